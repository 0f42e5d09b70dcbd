#include <algorithm>
#include <chrono>
#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string_view>
#include <vector>
#include "FileUtility.h"
#include "ImageHeader.h"
#include "PNG.h"

static void PrintUsage()
{
    std::cout << "Usage: pngchunk <file.png> [--benchmark <attempts>]\n";
}

static bool PrintChunks(const PNG& png)
{
    auto names = ChunkTypeNames(png);
    if(!names)
    {
        std::cerr << "Error: " << ToString(names.error()) << "\n";
        return false;
    }

    for(std::size_t i = 0; i < png.Chunks().size(); i++)
    {
        const Chunk& chunk = png.Chunks()[i];
        const ChunkType& type = chunk.Type();
        std::cout << std::setw(4) << i << "  " << (*names)[i]
            << "  length: " << chunk.Length()
            << "  crc: 0x" << std::hex << std::setw(8) << std::setfill('0') << chunk.Crc() << std::dec << std::setfill(' ')
            << "  " << (type.IsCritical() ? "critical" : "ancillary")
            << ", " << (type.IsPublic() ? "public" : "private")
            << ", " << (type.IsSafeToCopy() ? "safe to copy" : "unsafe to copy")
            << "\n";
    }

    if(const Chunk* headerChunk = png.FindChunk(ChunkIdentifiers::header); headerChunk)
    {
        if(auto header = ImageHeader::Parse(*headerChunk); header)
        {
            std::cout << "Image: " << header->width << "x" << header->height
                << ", bit depth " << static_cast<int>(header->bitDepth);
            if(auto name = header->ColorTypeName(); name)
                std::cout << ", " << *name;
            std::cout << (header->interlaceMethod == InterlaceMethod::Adam7 ? ", Adam7 interlaced" : "") << "\n";
        }
        else
        {
            std::cerr << "Invalid image header: " << ToString(header.error()) << "\n";
        }
    }

    return true;
}

static int Benchmark(const std::filesystem::path& file, int benchmarkAttempts)
{
    auto bytes = ReadFile(file);
    if(!bytes)
    {
        std::cerr << "Error: " << ToString(bytes.error()) << "\n";
        return 2;
    }

    std::vector<std::chrono::nanoseconds> attempts(static_cast<std::size_t>(benchmarkAttempts));
    for(int i = 0; i < benchmarkAttempts; i++)
    {
        auto timePoint = std::chrono::steady_clock::now();
        auto png = PNG::Create(*bytes);
        auto end = std::chrono::steady_clock::now();

        if(!png)
        {
            std::cerr << "Error: " << ToString(png.error()) << "\n";
            return 2;
        }
        attempts[i] = std::chrono::duration_cast<std::chrono::nanoseconds>(end - timePoint);
    }

    std::cout << "Min: " << std::min_element(attempts.begin(), attempts.end())->count() << "ns\n";
    std::cout << "Max: " << std::max_element(attempts.begin(), attempts.end())->count() << "ns\n";
    std::cout << "Average Time to parse: " << (std::accumulate(attempts.begin(), attempts.end(), std::chrono::nanoseconds{}) / benchmarkAttempts).count() << "ns\n";
    return 0;
}

int main(int argc, char** argv)
{
    if(argc != 2 && argc != 4)
    {
        PrintUsage();
        return 1;
    }

    std::filesystem::path file = argv[1];

    if(argc == 4)
    {
        std::string_view option = argv[2];
        std::string_view count = argv[3];
        int benchmarkAttempts = 0;
        auto [ptr, ec] = std::from_chars(count.data(), count.data() + count.size(), benchmarkAttempts);
        if(option != "--benchmark" || ec != std::errc{} || ptr != count.data() + count.size() || benchmarkAttempts <= 0)
        {
            PrintUsage();
            return 1;
        }

        return Benchmark(file, benchmarkAttempts);
    }

    auto png = ReadPNG(file);
    if(!png)
    {
        std::cerr << "Error reading " << file.string() << ": " << ToString(png.error()) << "\n";
        return 2;
    }

    return PrintChunks(*png) ? 0 : 2;
}
