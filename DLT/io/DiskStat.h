#pragma once
#include <string>
#include <cstdint>
#include <optional>

// Current size of a regular file, nullopt if it is missing or not a file
std::optional<std::uint64_t> regularFileSize(const std::string& path);

std::uint64_t sizeOrZero(const std::string& path);
