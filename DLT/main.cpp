#include <iostream>
#include <iomanip>
#include <csignal>
#include <curl/curl.h>
#include "cli/ArgumentParser.h"
#include "cli/WatchRunner.h"
#include "core/DownloadTracker.h"
#include "core/ProcessWorker.h"
#include "net/ConnectivityProbe.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}

void printSink(const ProgressSink& sink) {
    for (const auto& entry : sink.entries()) {
        std::cout << std::fixed << std::setprecision(3)
            << entry.second << "  " << entry.first << "\n";
    }
}
}

int main(int argc, char* argv[]) {
    WatchConfig config;
    ArgumentParser parser;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!parser.parse(argc, argv, config))
        return static_cast<int>(ExitCode::Usage);

    curl_global_init(CURL_GLOBAL_DEFAULT);

    Logger logger(std::cerr);
    logger.setLevel(config.logLevel);
    logger.start();

    ProcessWorker worker(static_cast<pid_t>(config.pid));
    HttpConnectivityProbe probe(config.tracker.probeTimeoutSeconds);
    HttpLocatorResolver httpResolver(config.tracker.probeTimeoutSeconds);
    ExplicitLocatorResolver resolver(&httpResolver);
    ProgressSink sink;

    const ExitCode rc = runTracker([&]() {
        return makeFileSetTracker(config.folder, config.locators, resolver,
            worker, sink, probe, config.tracker, logger, &gStopRequested);
        }, logger);

    logger.stop();
    printSink(sink);

    curl_global_cleanup();
    return static_cast<int>(rc);
}
