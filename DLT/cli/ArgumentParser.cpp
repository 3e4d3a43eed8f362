#include "ArgumentParser.h"
#include <iostream>
#include <stdexcept>

namespace {
// Whole argument must be a number: "5x" is rejected, not read as 5
long parseNumber(const std::string& arg) {
    std::size_t used = 0;
    long value = std::stol(arg, &used);
    if (used != arg.size())
        throw std::invalid_argument(arg);
    return value;
}
}

bool ArgumentParser::parse(int argc, char* argv[], WatchConfig& out) {
    if (argc < 2) {
        printUsage();
        return false;
    }

    out.folder = ".";
    out.locators.clear();
    out.pid = 0;
    out.logLevel = LogLevel::Info;
    out.tracker = TrackerConfig{};

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-d" && i + 1 < argc) {
                out.folder = argv[++i];
            }
            else if (arg == "-p" && i + 1 < argc) {
                out.pid = parseNumber(argv[++i]);
            }
            else if (arg == "-i" && i + 1 < argc) {
                out.tracker.pollInterval = std::chrono::milliseconds(parseNumber(argv[++i]));
            }
            else if (arg == "-u" && i + 1 < argc) {
                out.tracker.probeUrl = argv[++i];
            }
            else if (arg == "-t" && i + 1 < argc) {
                out.tracker.probeTimeoutSeconds = parseNumber(argv[++i]);
            }
            else if (arg == "-v") {
                out.logLevel = LogLevel::Debug;
            }
            else if (arg == "-q") {
                out.logLevel = LogLevel::Warn;
            }
            else if (!arg.empty() && arg[0] == '-') {
                printUsage();
                return false;
            }
            else {
                out.locators.push_back(arg);
            }
        }
    }
    catch (const std::logic_error&) {
        // stol on a non-number or out of range
        printUsage();
        return false;
    }

    if (out.locators.empty() || out.pid <= 0) {
        printUsage();
        return false;
    }

    // stall limits are counted in cycles, so the interval must be real
    if (out.tracker.pollInterval.count() <= 0 || out.tracker.probeTimeoutSeconds <= 0) {
        printUsage();
        return false;
    }

    return true;
}

void ArgumentParser::printUsage() const {
    std::cout <<
        "Usage:\n"
        "  dltrack <locator>... -p <pid> [-d <folder>] [options]\n\n"
        "Locators:\n"
        "  <url>            Size taken from the server (HEAD)\n"
        "  <name>=<bytes>   Size given explicitly\n\n"
        "Options:\n"
        "  -p <pid>         Process performing the download (required)\n"
        "  -d <folder>      Destination folder (default: .)\n"
        "  -i <ms>          Poll interval (default: 300)\n"
        "  -u <url>         Connectivity check URL\n"
        "  -t <seconds>     Network timeout for HEAD and connectivity check (default: 5)\n"
        "  -v / -q          Verbose / quiet logging\n";
}
