#pragma once
#include <functional>
#include <memory>

#include "../monitor/ProgressPoller.h"

enum class ExitCode {
    Complete = 0,
    Usage = 1,      // bad arguments or an unresolvable locator
    Stalled = 2,
    Stopped = 3     // signal, or the worker exited before finishing
};

using TrackerFactory = std::function<std::unique_ptr<ProgressPoller>()>;

// Builds the tracker, runs it to the end and maps the outcome to an exit code.
ExitCode runTracker(const TrackerFactory& makeTracker, Logger& logger);
