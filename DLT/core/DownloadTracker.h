#pragma once
#include <memory>
#include <string>
#include <vector>
#include <csignal>

#include "utils.h"
#include "Worker.h"
#include "FileSetResolver.h"
#include "../monitor/ProgressPoller.h"

// Tracker for a plain list of sources downloaded into folder. Sizes are
// resolved here, before anything is polled; InvalidReferenceError if one
// cannot be.
std::unique_ptr<ProgressPoller> makeFileSetTracker(const std::string& folder,
    const std::vector<std::string>& locators,
    LocatorResolver& resolver,
    Worker& worker,
    ProgressSink& sink,
    ConnectivityProbe& probe,
    const TrackerConfig& config,
    Logger& logger,
    volatile std::sig_atomic_t* externalStop = nullptr);

// Tracker for a worker that narrates its progress in the marker log.
std::unique_ptr<ProgressPoller> makeModelTracker(ModelWorker& worker,
    ProgressSink& sink,
    ConnectivityProbe& probe,
    const TrackerConfig& config,
    Logger& logger,
    volatile std::sig_atomic_t* externalStop = nullptr);
