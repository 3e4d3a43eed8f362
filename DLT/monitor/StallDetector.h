#pragma once
#include "ProgressSink.h"
#include "Logger.h"
#include "../core/utils.h"
#include "../core/Worker.h"
#include "../net/ConnectivityProbe.h"

// Counts poll cycles in which the aggregate progress did not move.
//   > softStallCycles and the probe fails -> StallError(NetworkUnstable)
//   > hardStallCycles                     -> StallError(NoProgress)
// The worker is cancelled before either error is thrown.
class StallDetector {
public:
    StallDetector(const ProgressSink& sink,
        ConnectivityProbe& probe,
        Worker& worker,
        const TrackerConfig& config,
        Logger& logger);

    void check();
    void reset();

    int noChangeCount() const { return noChange; }
    double lastObservedTotal() const { return lastTotal; }

private:
    const ProgressSink& sink;
    ConnectivityProbe& probe;
    Worker& worker;
    const TrackerConfig& cfg;
    Logger& logger;

    double lastTotal{ 0.0 };
    int noChange{ 0 };
    bool warned{ false };
};
