#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include "PlatformDetection.h"

/*
 * Chunk type codes are restricted to ASCII letters (A-Z and a-z) but are
 * compared as fixed binary values, not character strings.
 *
 * Bit 5 of each byte carries a property:
 *      byte 0: ancillary bit,    0 (uppercase) = critical,      1 (lowercase) = ancillary
 *      byte 1: private bit,      0 (uppercase) = public,        1 (lowercase) = private
 *      byte 2: reserved bit,     must be 0 (uppercase) in conforming files
 *      byte 3: safe-to-copy bit, 0 (uppercase) = unsafe to copy, 1 (lowercase) = safe to copy
 */

constexpr bool IsUppercase(Byte b)
{
    return b >= 'A' && b <= 'Z';
}

constexpr bool IsLowercase(Byte b)
{
    return b >= 'a' && b <= 'z';
}

constexpr bool IsAlphabetical(Byte b)
{
    return IsUppercase(b) || IsLowercase(b);
}

class ChunkType
{
public:
    static constexpr Byte propertyBit = 1 << 5;

private:
    Bytes<4> m_identifier{};

public:
    constexpr ChunkType() = default;
    friend constexpr ChunkType operator""_ct(const char* string, size_t n);

public:
    //Rejects non alphabetical bytes and a set reserved bit
    static AnyError<ChunkType> Create(Bytes<4> bytes);

    //Rejects non alphabetical characters and strings that are not 4 characters long.
    //The reserved bit is not checked, query IsValid() for that.
    static AnyError<ChunkType> Create(std::string_view string);

    constexpr Bytes<4> AsBytes() const noexcept { return m_identifier; }

    AnyError<std::string> ToString() const;

    constexpr bool IsValid() const noexcept
    {
        for(Byte b : m_identifier)
        {
            if(!IsAlphabetical(b))
                return false;
        }
        return IsReservedBitValid();
    }

    constexpr bool IsCritical() const noexcept { return (m_identifier[0] & propertyBit) == 0; }
    constexpr bool IsPublic() const noexcept { return (m_identifier[1] & propertyBit) == 0; }
    constexpr bool IsReservedBitValid() const noexcept { return (m_identifier[2] & propertyBit) == 0; }
    constexpr bool IsSafeToCopy() const noexcept { return (m_identifier[3] & propertyBit) != 0; }

    constexpr bool operator==(const ChunkType& rh) const noexcept { return m_identifier == rh.m_identifier; }
    constexpr bool operator!=(const ChunkType& rh) const noexcept { return m_identifier != rh.m_identifier; }

private:
    constexpr explicit ChunkType(Bytes<4> identifier) :
        m_identifier(identifier)
    {
    }
};

constexpr ChunkType operator""_ct(const char* string, size_t n)
{
    if(n != 4)
        throw std::invalid_argument("Expected string size to be 4");

    Bytes<4> identifier{};
    for(size_t i = 0; i < 4; i++)
    {
        identifier[i] = static_cast<Byte>(string[i]);
        if(!IsAlphabetical(identifier[i]))
            throw std::invalid_argument("String must only contain Alphabetical characters");
    }

    return ChunkType{ identifier };
}

namespace ChunkIdentifiers
{
    inline constexpr ChunkType header = "IHDR"_ct;
    inline constexpr ChunkType palette = "PLTE"_ct;
    inline constexpr ChunkType imageData = "IDAT"_ct;
    inline constexpr ChunkType imageTrailer = "IEND"_ct;
    inline constexpr ChunkType chromaticities = "cHRM"_ct;
    inline constexpr ChunkType imageGamma = "gAMA"_ct;
    inline constexpr ChunkType iccProfile = "iCCP"_ct;
    inline constexpr ChunkType significantBits = "sBIT"_ct;
    inline constexpr ChunkType rgbColorSpace = "sRGB"_ct;
    inline constexpr ChunkType backgroundColor = "bKGD"_ct;
    inline constexpr ChunkType imageHistogram = "hIST"_ct;
    inline constexpr ChunkType transparency = "tRNS"_ct;
    inline constexpr ChunkType physicalPixelDimensions = "pHYs"_ct;
    inline constexpr ChunkType suggestedPalette = "sPLT"_ct;
    inline constexpr ChunkType lastModificationTime = "tIME"_ct;
    inline constexpr ChunkType internationalTextualData = "iTXt"_ct;
    inline constexpr ChunkType texturalData = "tEXt"_ct;
    inline constexpr ChunkType compressedTextualData = "zTXt"_ct;
}
