#pragma once
#include <atomic>
#include <string>
#include <cstdint>
#include <csignal>

#include "ProgressSink.h"
#include "StallDetector.h"
#include "TransferRate.h"
#include "Logger.h"
#include "../core/utils.h"
#include "../core/Worker.h"
#include "../net/ConnectivityProbe.h"

// A source of progress for one download. track() is the blocking
// monitoring loop; run it on its own thread and read the sink elsewhere.
class ProgressPoller {
public:
    ProgressPoller(Worker& worker,
        ProgressSink& sink,
        ConnectivityProbe& probe,
        const TrackerConfig& config,
        Logger& logger,
        volatile std::sig_atomic_t* externalStop = nullptr);
    virtual ~ProgressPoller() = default;

    ProgressPoller(const ProgressPoller&) = delete;
    ProgressPoller& operator=(const ProgressPoller&) = delete;

    // Returns true when every file finished, false when the worker went
    // away or stop() was called first. Throws StallError after cancelling
    // the worker when the download stops moving.
    bool track();
    void stop();

    virtual bool done() const = 0;
    virtual std::uint64_t totalBytes() const = 0;

    const StallDetector& stallDetector() const { return stall; }

protected:
    // One poll: per-file values first, then reportTotal().
    virtual void pollOnce() = 0;
    // Last catch-up read once the loop is over.
    virtual void finish() = 0;
    virtual std::string summary() const = 0;

    void reportTotal(std::uint64_t bytesOnDisk);

private:
    void logProgress();
    void logConclusion(const std::string& outcome);

protected:
    Worker& worker;
    ProgressSink& sink;
    const TrackerConfig& cfg;
    Logger& logger;

private:
    StallDetector stall;
    TransferRate rate;

    volatile std::sig_atomic_t* externalStopSignal{ nullptr };
    std::atomic<bool> stopFlag{ false };
};
