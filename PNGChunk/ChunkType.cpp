#include "ChunkType.h"

#include <algorithm>

AnyError<ChunkType> ChunkType::Create(Bytes<4> bytes)
{
    ChunkType type{ bytes };
    if(!type.IsValid())
        return tl::unexpected(PNGError::Invalid_Chunk_Type);

    return type;
}

AnyError<ChunkType> ChunkType::Create(std::string_view string)
{
    if(!std::all_of(string.begin(), string.end(), [](char c) { return IsAlphabetical(static_cast<Byte>(c)); }))
        return tl::unexpected(PNGError::Invalid_Character);

    if(string.size() != 4)
        return tl::unexpected(PNGError::Invalid_Length);

    Bytes<4> identifier;
    std::copy(string.begin(), string.end(), identifier.begin());
    return ChunkType{ identifier };
}

AnyError<std::string> ChunkType::ToString() const
{
    if(!IsValidUtf8(m_identifier))
        return tl::unexpected(PNGError::Invalid_Utf8);

    return std::string(m_identifier.begin(), m_identifier.end());
}
