#include "ImageHeader.h"

#include <vector>

AnyError<ImageHeader> ImageHeader::Parse(const Chunk& chunk)
{
    if(chunk.Type() != ChunkIdentifiers::header)
        return tl::unexpected(PNGError::Unexpected_Chunk_Type);

    if(chunk.Length() != dataSize)
        return tl::unexpected(PNGError::Unexpected_Chunk_Size);

    std::span<const Byte, dataSize> data = chunk.Data().first<dataSize>();

    ImageHeader header;
    header.width = ReadBigEndian<std::uint32_t>(data.subspan<0, 4>());
    header.height = ReadBigEndian<std::uint32_t>(data.subspan<4, 4>());
    header.bitDepth = data[8];
    std::uint8_t colorType = data[9];
    header.compressionMethod = data[10];
    header.filterMethod = data[11];
    std::uint8_t interlaceMethod = data[12];

    if(header.width == 0 || header.width > maxDimension || header.height == 0 || header.height > maxDimension)
        return tl::unexpected(PNGError::Invalid_Dimensions);

    std::optional<ColorFormatView> format = FindColorFormat(colorType);
    if(!format)
        return tl::unexpected(PNGError::Unsupported_Color_Format);
    header.colorType = format->type;

    if(!format->AllowsBitDepth(header.bitDepth))
        return tl::unexpected(PNGError::Invalid_Bit_Depth);

    if(header.compressionMethod != 0)
        return tl::unexpected(PNGError::Unknown_Compression_Method);

    if(header.filterMethod != 0)
        return tl::unexpected(PNGError::Unknown_Filter_Type);

    switch(interlaceMethod)
    {
    case static_cast<std::uint8_t>(InterlaceMethod::None):
    case static_cast<std::uint8_t>(InterlaceMethod::Adam7):
        header.interlaceMethod = static_cast<InterlaceMethod>(interlaceMethod);
        break;
    default:
        return tl::unexpected(PNGError::Unknown_Interlace_Method);
    }

    return header;
}

Chunk ImageHeader::ToChunk() const
{
    std::vector<Byte> data;
    data.reserve(dataSize);

    AppendBigEndian(data, width);
    AppendBigEndian(data, height);
    data.push_back(bitDepth);
    data.push_back(static_cast<Byte>(colorType));
    data.push_back(compressionMethod);
    data.push_back(filterMethod);
    data.push_back(static_cast<Byte>(interlaceMethod));

    return Chunk{ ChunkIdentifiers::header, std::move(data) };
}

AnyError<int> ImageHeader::SubpixelCount() const
{
    if(auto format = FindColorFormat(static_cast<std::uint8_t>(colorType)); format)
        return format->subpixelCount;

    return tl::unexpected(PNGError::Unsupported_Color_Format);
}

AnyError<std::string_view> ImageHeader::ColorTypeName() const
{
    if(auto format = FindColorFormat(static_cast<std::uint8_t>(colorType)); format)
        return format->name;

    return tl::unexpected(PNGError::Unsupported_Color_Format);
}
