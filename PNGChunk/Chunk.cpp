#include "Chunk.h"

#include <limits>
#include <stdexcept>
#include <zlib.h>

std::uint32_t ComputeCrc(const ChunkType& type, std::span<const Byte> data)
{
    Bytes<4> typeBytes = type.AsBytes();

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, typeBytes.data(), static_cast<uInt>(typeBytes.size()));
    if(!data.empty())
        crc = crc32(crc, data.data(), static_cast<uInt>(data.size()));

    return static_cast<std::uint32_t>(crc);
}

Chunk::Chunk(ChunkType type, std::vector<Byte> data) :
    m_type(type),
    m_data(std::move(data))
{
    if(m_data.size() > std::numeric_limits<std::uint32_t>::max())
        throw std::length_error("Chunk data exceeds the maximum chunk length");

    m_length = static_cast<std::uint32_t>(m_data.size());
    m_crc = ComputeCrc(m_type, m_data);
}

Chunk::Chunk(std::uint32_t length, ChunkType type, std::vector<Byte> data, std::uint32_t crc) :
    m_length(length),
    m_type(type),
    m_data(std::move(data)),
    m_crc(crc)
{
}

AnyError<Chunk> Chunk::Create(std::span<const Byte> bytes)
{
    if(bytes.size() < lengthFieldSize)
        return tl::unexpected(PNGError::Truncated_Header);

    std::uint32_t length = ReadBigEndian<std::uint32_t>(bytes.first<lengthFieldSize>());

    if(bytes.size() != static_cast<std::uint64_t>(length) + overheadSize)
        return tl::unexpected(PNGError::Size_Mismatch);

    Bytes<4> typeBytes;
    std::copy_n(bytes.begin() + lengthFieldSize, typeFieldSize, typeBytes.begin());

    ChunkType type;
    if(auto value = ChunkType::Create(typeBytes); value)
        type = std::move(value).value();
    else
        return tl::unexpected(std::move(value).error());

    std::span<const Byte> dataBytes = bytes.subspan(lengthFieldSize + typeFieldSize, length);
    std::uint32_t crc = ReadBigEndian<std::uint32_t>(bytes.last<crcFieldSize>());

    //crc is computed over the type and data fields, never the length or crc fields
    if(crc != ComputeCrc(type, dataBytes))
        return tl::unexpected(PNGError::Checksum_Mismatch);

    return Chunk{ length, type, std::vector<Byte>(dataBytes.begin(), dataBytes.end()), crc };
}

AnyError<std::string> Chunk::DataAsString() const
{
    if(!IsValidUtf8(m_data))
        return tl::unexpected(PNGError::Invalid_Utf8);

    return std::string(m_data.begin(), m_data.end());
}

std::vector<Byte> Chunk::ToBytes() const
{
    std::vector<Byte> bytes;
    bytes.reserve(EncodedSize());

    AppendBigEndian(bytes, m_length);

    Bytes<4> typeBytes = m_type.AsBytes();
    bytes.insert(bytes.end(), typeBytes.begin(), typeBytes.end());
    bytes.insert(bytes.end(), m_data.begin(), m_data.end());

    AppendBigEndian(bytes, m_crc);
    return bytes;
}
