#include "PNG.h"

#include <algorithm>
#include <iterator>

AnyError<void> VerifySignature(std::span<const Byte> bytes)
{
    if(bytes.size() < PNGSignature.size())
        return tl::unexpected(PNGError::Insufficient_Size);

    if(!std::equal(PNGSignature.begin(), PNGSignature.end(), bytes.begin()))
        return tl::unexpected(PNGError::Unknown_Signature);

    return {};
}

PNG::PNG(std::vector<Chunk> chunks) :
    m_chunks(std::move(chunks))
{
}

AnyError<PNG> PNG::Create(std::span<const Byte> bytes)
{
    if(auto value = VerifySignature(bytes); !value)
        return tl::unexpected(std::move(value).error());

    PNG png;
    std::span<const Byte> remaining = bytes.subspan(PNGSignature.size());
    while(!remaining.empty())
    {
        if(remaining.size() < Chunk::lengthFieldSize)
            return tl::unexpected(PNGError::Truncated_Header);

        std::uint64_t chunkSize = ReadBigEndian<std::uint32_t>(remaining.first<Chunk::lengthFieldSize>());
        chunkSize += Chunk::overheadSize;
        if(remaining.size() < chunkSize)
            return tl::unexpected(PNGError::Size_Mismatch);

        if(auto value = Chunk::Create(remaining.first(chunkSize)); value)
            png.m_chunks.push_back(std::move(value).value());
        else
            return tl::unexpected(std::move(value).error());

        remaining = remaining.subspan(chunkSize);
    }

    return png;
}

void PNG::AppendChunk(Chunk chunk)
{
    m_chunks.push_back(std::move(chunk));
}

const Chunk* PNG::FindChunk(const ChunkType& type) const noexcept
{
    auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const Chunk& c) { return c.Type() == type; });
    if(it == m_chunks.end())
        return nullptr;

    return &*it;
}

std::vector<ChunkType> PNG::ChunkTypes() const
{
    std::vector<ChunkType> types;
    types.reserve(m_chunks.size());
    std::transform(m_chunks.begin(), m_chunks.end(), std::back_inserter(types), [](const Chunk& c) { return c.Type(); });
    return types;
}

std::vector<Byte> PNG::ToBytes() const
{
    std::vector<Byte> bytes(PNGSignature.begin(), PNGSignature.end());
    for(const Chunk& chunk : m_chunks)
    {
        std::vector<Byte> chunkBytes = chunk.ToBytes();
        bytes.insert(bytes.end(), chunkBytes.begin(), chunkBytes.end());
    }
    return bytes;
}
