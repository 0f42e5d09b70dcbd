#pragma once
#include <span>
#include <vector>
#include "PlatformDetection.h"
#include "ChunkType.h"
#include "Chunk.h"

/// <summary>
/// A PNG signature followed by an ordered sequence of chunks.
/// Chunk ordering rules are not enforced.
/// </summary>
class PNG
{
private:
    std::vector<Chunk> m_chunks;

public:
    PNG() = default;
    explicit PNG(std::vector<Chunk> chunks);

    static AnyError<PNG> Create(std::span<const Byte> bytes);

public:
    std::vector<Chunk>& Chunks() & noexcept { return m_chunks; }
    const std::vector<Chunk>& Chunks() const& noexcept { return m_chunks; }

    void AppendChunk(Chunk chunk);

    //Returns the first chunk of the given type, nullptr if there is none
    const Chunk* FindChunk(const ChunkType& type) const noexcept;

    std::vector<ChunkType> ChunkTypes() const;

    std::vector<Byte> ToBytes() const;
};

AnyError<void> VerifySignature(std::span<const Byte> bytes);
