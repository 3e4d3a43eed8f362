#include "ProgressLog.h"

void ProgressLog::append(const std::string& fragment) {
    std::lock_guard<std::mutex> lock(mtx);
    buffer += fragment;
}

std::string ProgressLog::readFrom(std::size_t offset) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (offset >= buffer.size())
        return std::string();
    return buffer.substr(offset);
}

std::string ProgressLog::str() const {
    std::lock_guard<std::mutex> lock(mtx);
    return buffer;
}

std::size_t ProgressLog::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return buffer.size();
}
