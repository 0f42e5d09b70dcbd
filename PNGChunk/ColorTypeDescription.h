#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

enum class ColorType : std::uint8_t
{
    GreyScale = 0,
    TrueColor = 2,
    IndexedColor = 3,
    GreyscaleWithAlpha = 4,
    TruecolorWithAlpha = 6
};

struct ColorFormatView
{
    ColorType type;
    std::string_view name;
    std::span<const int> allowedBitDepths;
    int subpixelCount;

    constexpr bool AllowsBitDepth(int bitDepth) const noexcept
    {
        return std::find(allowedBitDepths.begin(), allowedBitDepths.end(), bitDepth) != allowedBitDepths.end();
    }
};

namespace BitDepths
{
    inline constexpr std::array greyScale = { 1, 2, 4, 8, 16 };
    inline constexpr std::array indexedColor = { 1, 2, 4, 8 };
    inline constexpr std::array multiChannel = { 8, 16 };
}

inline constexpr std::array standardColorFormats
{
    ColorFormatView{ ColorType::GreyScale, "Grey Scale", BitDepths::greyScale, 1 },
    ColorFormatView{ ColorType::TrueColor, "True Color", BitDepths::multiChannel, 3 },
    ColorFormatView{ ColorType::IndexedColor, "Indexed Color", BitDepths::indexedColor, 1 },
    ColorFormatView{ ColorType::GreyscaleWithAlpha, "Greyscale with Alpha", BitDepths::multiChannel, 2 },
    ColorFormatView{ ColorType::TruecolorWithAlpha, "True Color with Alpha", BitDepths::multiChannel, 4 },
};

constexpr std::optional<ColorFormatView> FindColorFormat(std::uint8_t colorType) noexcept
{
    for(const ColorFormatView& format : standardColorFormats)
    {
        if(static_cast<std::uint8_t>(format.type) == colorType)
            return format;
    }

    return std::nullopt;
}
