#pragma once
#include <map>
#include <string>
#include <cstdint>

class ProgressLog;

// Handle on whatever is performing the transfer. The tracker only asks
// whether it is still running and, on a stall, asks it to stop.
class Worker {
public:
    virtual ~Worker() = default;

    virtual bool isAlive() const = 0;
    virtual void cancel() = 0;
};

// Worker that reports per-file progress through the marker log:
//   START <path> FILE_SIZE <bytes> [ERROR] END ... FINISH
class ModelWorker : public Worker {
public:
    static constexpr const char* START_MARKER = "START";
    static constexpr const char* FILE_SIZE_MARKER = "FILE_SIZE";
    static constexpr const char* END_MARKER = "END";
    static constexpr const char* FINISH_MARKER = "FINISH";
    static constexpr const char* ERROR_MARKER = "ERROR";

    virtual const ProgressLog& progressLog() const = 0;

    std::string currentProgressLog() const;

    // estimate=true asks for a fallback guess when declared sizes are missing
    virtual std::map<std::string, std::uint64_t> declaredSizesByFile(bool estimate) const = 0;
};
