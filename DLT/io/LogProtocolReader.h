#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

#include "ProgressLog.h"

struct LogRecord {
    enum class State {
        InProgress,
        Complete,
        Failed
    };

    std::string path;
    std::optional<std::uint64_t> declaredSize;
    State state;
};

// Incremental reader for the worker's marker log. Only the bytes past
// cursor() are looked at; consumed bytes are never parsed again.
class LogProtocolReader {
public:
    explicit LogProtocolReader(const ProgressLog& log);

    // Records that changed since the last call. A record still being
    // downloaded is returned as InProgress on every call until it ends.
    std::vector<LogRecord> poll();

    bool finished() const { return finishSeen; }
    std::size_t cursor() const { return offset; }

    bool hasOpenRecord() const { return open.has_value(); }

private:
    struct OpenRecord {
        std::string path;
        bool failed;
    };

    std::size_t consume(const std::string& text, std::vector<LogRecord>& out);

private:
    const ProgressLog& log;
    std::size_t offset{ 0 };
    bool finishSeen{ false };
    std::optional<OpenRecord> open;
};
