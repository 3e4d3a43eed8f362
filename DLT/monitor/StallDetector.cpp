#include "StallDetector.h"
#include "../core/Errors.h"

#include <sstream>
#include <iomanip>

namespace {
std::string describeWindow(int cycles, const TrackerConfig& cfg) {
    const double secs = cycles * cfg.pollInterval.count() / 1000.0;
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << secs;
    return os.str();
}
}

StallDetector::StallDetector(const ProgressSink& s,
    ConnectivityProbe& p,
    Worker& w,
    const TrackerConfig& config,
    Logger& l)
    : sink(s),
    probe(p),
    worker(w),
    cfg(config),
    logger(l) {
}

void StallDetector::reset() {
    lastTotal = 0.0;
    noChange = 0;
    warned = false;
}

void StallDetector::check() {
    const double total = sink.snapshotTotal();
    if (total != lastTotal) {
        lastTotal = total;
        noChange = 0;
        warned = false;
        return;
    }

    ++noChange;

    if (noChange > cfg.softStallCycles) {
        if (!warned) {
            logger.warn("No progress for " + std::to_string(noChange) + " checks, probing " + cfg.probeUrl);
            warned = true;
        }

        if (!probe.isReachable(cfg.probeUrl)) {
            worker.cancel();
            throw StallError(StallError::Kind::NetworkUnstable,
                "The download seems to have stopped. There has been no progress during more than "
                + describeWindow(cfg.softStallCycles, cfg)
                + " seconds. The internet connection seems unstable.");
        }
    }

    if (noChange > cfg.hardStallCycles) {
        worker.cancel();
        throw StallError(StallError::Kind::NoProgress,
            "The download seems to have stopped. There has been no progress during more than "
            + describeWindow(cfg.hardStallCycles, cfg)
            + " seconds, please review your internet connection or computer permissions.");
    }
}
