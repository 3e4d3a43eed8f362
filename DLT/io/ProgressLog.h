#pragma once
#include <string>
#include <mutex>
#include <cstddef>

// Append-only text buffer shared by one producer (the worker) and one
// consumer (the log poller). Bytes are never rewritten once appended.
class ProgressLog {
public:
    void append(const std::string& fragment);

    std::string readFrom(std::size_t offset) const;
    std::string str() const;
    std::size_t size() const;

private:
    std::string buffer;
    mutable std::mutex mtx;
};
