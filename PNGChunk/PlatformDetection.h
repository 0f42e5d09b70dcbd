#pragma once
#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstdint>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>
#include <tl/expected.hpp>

inline constexpr bool IsPlatformNetworkByteOrder = std::endian::native == std::endian::big;
inline constexpr bool SwapByteOrder = !IsPlatformNetworkByteOrder;

using Byte = std::uint8_t;

template<size_t Count>
using Bytes = std::array<Byte, Count>;

enum class PNGError : int
{
    Truncated_Header,
    Size_Mismatch,
    Invalid_Chunk_Type,
    Invalid_Length,
    Invalid_Character,
    Checksum_Mismatch,
    Invalid_Utf8,
    Insufficient_Size,
    Unknown_Signature,
    Unexpected_Chunk_Type,
    Unexpected_Chunk_Size,
    Invalid_Dimensions,
    Unsupported_Color_Format,
    Invalid_Bit_Depth,
    Unknown_Compression_Method,
    Unknown_Filter_Type,
    Unknown_Interlace_Method,
    File_Read_Failure
};

std::string_view ToString(PNGError error) noexcept;

template<class Ty>
using AnyError = tl::expected<Ty, PNGError>;

template<size_t Count>
constexpr Bytes<Count> FlipEndianness(Bytes<Count> bytes)
{
    Bytes<Count> newBytes;
    std::reverse_copy(bytes.begin(), bytes.end(), newBytes.begin());
    return newBytes;
}

template<size_t Count>
constexpr Bytes<Count> ToNativeRepresentation(Bytes<Count> bytes)
{
    if constexpr(SwapByteOrder)
        return FlipEndianness(bytes);
    else
        return bytes;
}

//Network byte order is the PNG byte order
template<class Ty>
    requires std::integral<Ty>
constexpr Ty ReadBigEndian(std::span<const Byte, sizeof(Ty)> bytes)
{
    Bytes<sizeof(Ty)> raw;
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    return std::bit_cast<Ty>(ToNativeRepresentation(raw));
}

template<class Ty>
    requires std::integral<Ty>
constexpr Bytes<sizeof(Ty)> ToBigEndian(Ty value)
{
    return ToNativeRepresentation(std::bit_cast<Bytes<sizeof(Ty)>>(value));
}

template<class Ty>
    requires std::integral<Ty>
void AppendBigEndian(std::vector<Byte>& out, Ty value)
{
    auto bytes = ToBigEndian(value);
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline constexpr Bytes<8> PNGSignature = Bytes<8>{ 137, 80, 78, 71, 13, 10, 26, 10 };

bool IsValidUtf8(std::span<const Byte> bytes) noexcept;
