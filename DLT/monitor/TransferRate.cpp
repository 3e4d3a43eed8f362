#include "TransferRate.h"

TransferRate::TransferRate(std::uint64_t totalBytes)
    : total(totalBytes),
    start(std::chrono::steady_clock::now()) {
}

void TransferRate::observe(std::uint64_t bytesOnDisk) {
    current = bytesOnDisk;
}

std::uint64_t TransferRate::observed() const {
    return current;
}

double TransferRate::elapsedSec() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return elapsed.count();
}

double TransferRate::bytesPerSec() const {
    const double secs = elapsedSec();
    return secs > 0 ? current / secs : 0.0;
}

void TransferRate::reset(std::uint64_t totalBytes) {
    total = totalBytes;
    current = 0;
    start = std::chrono::steady_clock::now();
}
