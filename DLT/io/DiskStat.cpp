#include "DiskStat.h"

#include <filesystem>

namespace fs = std::filesystem;

std::optional<std::uint64_t> regularFileSize(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec)
        return std::nullopt;

    auto size = fs::file_size(path, ec);
    if (ec)
        return std::nullopt;

    return static_cast<std::uint64_t>(size);
}

std::uint64_t sizeOrZero(const std::string& path) {
    return regularFileSize(path).value_or(0);
}
