#pragma once
#include <map>
#include <string>

#include "ProgressPoller.h"
#include "../io/LogProtocolReader.h"

// Follows a ModelWorker's marker log. The aggregate is the on-disk size of
// every file the log has mentioned over the sum of declared sizes.
class LogProtocolPoller : public ProgressPoller {
public:
    LogProtocolPoller(ModelWorker& worker,
        ProgressSink& sink,
        ConnectivityProbe& probe,
        const TrackerConfig& config,
        Logger& logger,
        volatile std::sig_atomic_t* externalStop = nullptr);

    bool done() const override;
    std::uint64_t totalBytes() const override;

    std::size_t cursor() const { return reader.cursor(); }

protected:
    void pollOnce() override;
    void finish() override;
    std::string summary() const override;

private:
    void apply(const LogRecord& record);
    std::uint64_t accumulated() const;

private:
    LogProtocolReader reader;
    std::map<std::string, std::uint64_t> onDisk;
    // declared sizes seen in the log, the total when the worker gave none
    std::map<std::string, std::uint64_t> seenDeclared;

    std::uint64_t grandTotal{ 0 };
    std::size_t completedFiles{ 0 };
    std::size_t failedFiles{ 0 };
};
