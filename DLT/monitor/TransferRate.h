#pragma once
#include <cstdint>
#include <chrono>

// Bytes seen on disk by the poller and the average rate since reset().
// Only the polling thread touches it.
class TransferRate {
public:
    explicit TransferRate(std::uint64_t totalBytes);

    void observe(std::uint64_t bytesOnDisk);
    std::uint64_t observed() const;
    std::uint64_t expected() const { return total; }
    double bytesPerSec() const;
    double elapsedSec() const;
    void reset(std::uint64_t totalBytes);

private:
    std::uint64_t total;
    std::uint64_t current{ 0 };
    std::chrono::steady_clock::time_point start;
};
