#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "PlatformDetection.h"
#include "PNG.h"

AnyError<std::vector<Byte>> ReadFile(const std::filesystem::path& path);

AnyError<PNG> ReadPNG(const std::filesystem::path& path);

//Text form of every chunk type code, in file order
AnyError<std::vector<std::string>> ChunkTypeNames(const PNG& png);
