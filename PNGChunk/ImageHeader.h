#pragma once
#include <cstdint>
#include <string_view>
#include "PlatformDetection.h"
#include "ColorTypeDescription.h"
#include "Chunk.h"

enum class InterlaceMethod : std::uint8_t
{
    None = 0,
    Adam7 = 1
};

/// <summary>
/// Structured view of an IHDR chunk's payload.
/// </summary>
struct ImageHeader
{
    static constexpr std::uint32_t dataSize = 13;
    static constexpr std::uint32_t maxDimension = 0x7FFFFFFF;

    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint8_t bitDepth = 0;
    ColorType colorType = ColorType::GreyScale;
    std::uint8_t compressionMethod = 0;
    std::uint8_t filterMethod = 0;
    InterlaceMethod interlaceMethod = InterlaceMethod::None;

    static AnyError<ImageHeader> Parse(const Chunk& chunk);
    Chunk ToChunk() const;

    constexpr bool UsesPalette() const noexcept { return (static_cast<std::uint8_t>(colorType) & 0x1) != 0; }
    constexpr bool UsesColor() const noexcept { return (static_cast<std::uint8_t>(colorType) & 0x2) != 0; }
    constexpr bool UsesAlpha() const noexcept { return (static_cast<std::uint8_t>(colorType) & 0x4) != 0; }

    AnyError<int> SubpixelCount() const;
    AnyError<std::string_view> ColorTypeName() const;

    //Palette indices always expand to 8 bit samples
    constexpr std::uint8_t SampleDepth() const noexcept { return colorType == ColorType::IndexedColor ? 8 : bitDepth; }
};
