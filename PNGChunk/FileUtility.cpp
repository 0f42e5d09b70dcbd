#include "FileUtility.h"

#include <fstream>
#include <iterator>

AnyError<std::vector<Byte>> ReadFile(const std::filesystem::path& path)
{
    std::fstream file{ path, std::ios::binary | std::ios::in };
    if(!file.is_open())
        return tl::unexpected(PNGError::File_Read_Failure);

    std::vector<Byte> bytes{ std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
    if(file.bad())
        return tl::unexpected(PNGError::File_Read_Failure);

    return bytes;
}

AnyError<PNG> ReadPNG(const std::filesystem::path& path)
{
    return ReadFile(path).and_then([](const std::vector<Byte>& bytes) { return PNG::Create(bytes); });
}

AnyError<std::vector<std::string>> ChunkTypeNames(const PNG& png)
{
    std::vector<std::string> names;
    names.reserve(png.Chunks().size());

    for(const Chunk& chunk : png.Chunks())
    {
        if(auto value = chunk.Type().ToString(); value)
            names.push_back(std::move(value).value());
        else
            return tl::unexpected(std::move(value).error());
    }

    return names;
}
