#include "DownloadTracker.h"
#include "../monitor/FileSystemPoller.h"
#include "../monitor/LogProtocolPoller.h"

std::unique_ptr<ProgressPoller> makeFileSetTracker(const std::string& folder,
    const std::vector<std::string>& locators,
    LocatorResolver& resolver,
    Worker& worker,
    ProgressSink& sink,
    ConnectivityProbe& probe,
    const TrackerConfig& config,
    Logger& logger,
    volatile std::sig_atomic_t* externalStop) {
    auto files = resolveFileSet(folder, locators, resolver);

    logger.debug("Resolved " + std::to_string(files.size()) + " files into " + folder);

    return std::make_unique<FileSystemPoller>(std::move(files),
        worker, sink, probe, config, logger, externalStop);
}

std::unique_ptr<ProgressPoller> makeModelTracker(ModelWorker& worker,
    ProgressSink& sink,
    ConnectivityProbe& probe,
    const TrackerConfig& config,
    Logger& logger,
    volatile std::sig_atomic_t* externalStop) {
    return std::make_unique<LogProtocolPoller>(worker, sink, probe, config, logger, externalStop);
}
