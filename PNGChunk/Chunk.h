#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "PlatformDetection.h"
#include "ChunkType.h"

/// <summary>
/// A single PNG chunk as laid out on the wire:
/// [length: 4 bytes big endian][type: 4 bytes][data: length bytes][crc: 4 bytes big endian]
/// The crc covers the type and data fields only.
/// </summary>
class Chunk
{
public:
    static constexpr std::size_t lengthFieldSize = 4;
    static constexpr std::size_t typeFieldSize = 4;
    static constexpr std::size_t crcFieldSize = 4;
    static constexpr std::size_t overheadSize = lengthFieldSize + typeFieldSize + crcFieldSize;

private:
    std::uint32_t m_length = 0;
    ChunkType m_type;
    std::vector<Byte> m_data;
    std::uint32_t m_crc = 0;

public:
    /// <summary>
    /// Builds a chunk and computes its length and crc. The type is trusted to be already validated.
    /// </summary>
    /// <exception cref="std::length_error">data does not fit in the 32 bit length field</exception>
    Chunk(ChunkType type, std::vector<Byte> data);

    /// <summary>
    /// Decodes exactly one chunk. bytes must hold the whole chunk and nothing else.
    /// </summary>
    static AnyError<Chunk> Create(std::span<const Byte> bytes);

public:
    std::uint32_t Length() const noexcept { return m_length; }
    const ChunkType& Type() const noexcept { return m_type; }
    std::span<const Byte> Data() const noexcept { return m_data; }
    std::uint32_t Crc() const noexcept { return m_crc; }

    AnyError<std::string> DataAsString() const;

    std::size_t EncodedSize() const noexcept { return m_length + overheadSize; }
    std::vector<Byte> ToBytes() const;

    bool operator==(const Chunk& rh) const noexcept
    {
        return m_length == rh.m_length && m_type == rh.m_type && m_data == rh.m_data && m_crc == rh.m_crc;
    }
    bool operator!=(const Chunk& rh) const noexcept { return !(*this == rh); }

private:
    Chunk(std::uint32_t length, ChunkType type, std::vector<Byte> data, std::uint32_t crc);
};

std::uint32_t ComputeCrc(const ChunkType& type, std::span<const Byte> data);
