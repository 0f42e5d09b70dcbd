#include "PlatformDetection.h"

std::string_view ToString(PNGError error) noexcept
{
    switch(error)
    {
    case PNGError::Truncated_Header:
        return "Not enough bytes to read the chunk length";
    case PNGError::Size_Mismatch:
        return "Declared chunk length does not match the buffer size";
    case PNGError::Invalid_Chunk_Type:
        return "Chunk type must be alphabetical with the reserved bit unset";
    case PNGError::Invalid_Length:
        return "Chunk type string must be 4 characters long";
    case PNGError::Invalid_Character:
        return "Chunk type string must only contain alphabetical characters";
    case PNGError::Checksum_Mismatch:
        return "Chunk does not match checksum";
    case PNGError::Invalid_Utf8:
        return "Bytes are not valid UTF-8";
    case PNGError::Insufficient_Size:
        return "Not enough bytes to read the PNG signature";
    case PNGError::Unknown_Signature:
        return "PNG signature could not be matched";
    case PNGError::Unexpected_Chunk_Type:
        return "Chunk is not of the expected type";
    case PNGError::Unexpected_Chunk_Size:
        return "Chunk data is not of the expected size";
    case PNGError::Invalid_Dimensions:
        return "Image dimensions must be between 1 and 2^31 - 1";
    case PNGError::Unsupported_Color_Format:
        return "Unsupported color type";
    case PNGError::Invalid_Bit_Depth:
        return "Bit depth is not allowed for the color type";
    case PNGError::Unknown_Compression_Method:
        return "Unknown compression method";
    case PNGError::Unknown_Filter_Type:
        return "Unknown filter method";
    case PNGError::Unknown_Interlace_Method:
        return "Unknown interlace method";
    case PNGError::File_Read_Failure:
        return "File could not be read";
    }

    return "Unknown error";
}

bool IsValidUtf8(std::span<const Byte> bytes) noexcept
{
    size_t i = 0;
    while(i < bytes.size())
    {
        Byte lead = bytes[i];
        size_t continuationCount = 0;
        std::uint32_t codePoint = 0;
        std::uint32_t minimum = 0;

        if(lead < 0x80)
        {
            ++i;
            continue;
        }
        else if((lead & 0xE0) == 0xC0)
        {
            continuationCount = 1;
            codePoint = lead & 0x1F;
            minimum = 0x80;
        }
        else if((lead & 0xF0) == 0xE0)
        {
            continuationCount = 2;
            codePoint = lead & 0x0F;
            minimum = 0x800;
        }
        else if((lead & 0xF8) == 0xF0)
        {
            continuationCount = 3;
            codePoint = lead & 0x07;
            minimum = 0x10000;
        }
        else
        {
            return false;
        }

        if(bytes.size() - i <= continuationCount)
            return false;

        for(size_t j = 1; j <= continuationCount; j++)
        {
            Byte continuation = bytes[i + j];
            if((continuation & 0xC0) != 0x80)
                return false;
            codePoint = (codePoint << 6) | (continuation & 0x3F);
        }

        //Overlong encodings, surrogates and values past U+10FFFF
        if(codePoint < minimum || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
            return false;

        i += continuationCount + 1;
    }

    return true;
}
