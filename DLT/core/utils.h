#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>

// Reference resource used to tell "network down" from "transfer stuck"
constexpr const char* REFERENCE_URL = "https://zenodo.org/record/6559475/files/README.md?download=1";

constexpr const char* TOTAL_PROGRESS_KEY = "total";

struct TrackerConfig {
    std::chrono::milliseconds pollInterval{ 300 };

    int softStallCycles = 30;
    int hardStallCycles = 60;

    std::string probeUrl = REFERENCE_URL;
    long probeTimeoutSeconds = 5;

    std::chrono::milliseconds progressLogInterval{ 1000 };
};

struct TrackedFile {
    std::string path;
    std::uint64_t size;
};

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct WatchConfig {
    std::string folder;
    std::vector<std::string> locators;

    long pid;
    LogLevel logLevel;

    TrackerConfig tracker;
};

inline double ratio(std::uint64_t part, std::uint64_t whole) {
    return whole == 0 ? 0.0 : (double)part / (double)whole;
}

inline std::string fileNameFromUrl(const std::string& url) {
    auto slash = url.find_last_of('/');
    std::string name = (slash == std::string::npos) ? url : url.substr(slash + 1);

    auto special = name.find_first_of("?#");
    if (special != std::string::npos)
        name = name.substr(0, special);

    if (name.empty())
        name = "download";

    return name;
}
