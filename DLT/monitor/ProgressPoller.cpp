#include "ProgressPoller.h"
#include "../core/Errors.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <thread>

ProgressPoller::ProgressPoller(Worker& w,
    ProgressSink& s,
    ConnectivityProbe& probe,
    const TrackerConfig& config,
    Logger& l,
    volatile std::sig_atomic_t* externalStop)
    : worker(w),
    sink(s),
    cfg(config),
    logger(l),
    stall(s, probe, w, config, l),
    rate(0),
    externalStopSignal(externalStop) {
}

void ProgressPoller::stop() {
    stopFlag.store(true);
}

bool ProgressPoller::track() {
    stall.reset();
    rate.reset(totalBytes());

    logger.info("Tracking " + summary() + ", " + std::to_string(totalBytes()) + " bytes expected");

    auto lastProgressLog = std::chrono::steady_clock::now();

    try {
        while (!done() && worker.isAlive()) {
            if (externalStopSignal && *externalStopSignal != 0)
                stopFlag.store(true);

            if (stopFlag.load())
                break;

            pollOnce();
            if (done())
                break;

            stall.check();

            auto now = std::chrono::steady_clock::now();
            if (now - lastProgressLog >= cfg.progressLogInterval) {
                logProgress();
                lastProgressLog = now;
            }

            std::this_thread::sleep_for(cfg.pollInterval);
        }

        finish();
    }
    catch (const StallError& e) {
        logger.error(e.what());
        logConclusion("failed");
        throw;
    }

    const bool success = done();
    logConclusion(success ? "completed" : "stopped");
    return success;
}

void ProgressPoller::reportTotal(std::uint64_t bytesOnDisk) {
    rate.observe(bytesOnDisk);

    const std::uint64_t total = totalBytes();
    if (total == 0) {
        sink.set(TOTAL_PROGRESS_KEY, 0.0);
        return;
    }
    sink.set(TOTAL_PROGRESS_KEY, std::min(1.0, ratio(bytesOnDisk, total)));
}

void ProgressPoller::logProgress() {
    std::ostringstream os;
    os << "Progress: "
        << rate.observed() << "/" << rate.expected() << " bytes ("
        << std::fixed << std::setprecision(1) << sink.snapshotTotal() * 100.0 << "%)";

    if (stall.noChangeCount() > 0)
        os << ", unchanged for " << stall.noChangeCount() << " checks";

    logger.info(os.str());
}

void ProgressPoller::logConclusion(const std::string& outcome) {
    const double secs = rate.elapsedSec();

    std::ostringstream conclusion;
    conclusion << "Tracking " << outcome
        << " in " << std::fixed << std::setprecision(2) << secs << "s"
        << ", avg speed " << std::setprecision(2) << (rate.bytesPerSec() * 8.0 / 1'000'000.0) << " Mbps"
        << ", " << summary()
        << ", total " << std::setprecision(1) << sink.snapshotTotal() * 100.0 << "%";

    logger.log(outcome == "failed" ? LogLevel::Error : LogLevel::Info, conclusion.str());
}
