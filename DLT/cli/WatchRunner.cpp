#include "WatchRunner.h"
#include "../core/Errors.h"

ExitCode runTracker(const TrackerFactory& makeTracker, Logger& logger) {
    try {
        auto tracker = makeTracker();
        return tracker->track() ? ExitCode::Complete : ExitCode::Stopped;
    }
    catch (const StallError&) {
        // already reported by the tracker
        return ExitCode::Stalled;
    }
    catch (const TrackerError& e) {
        logger.error(e.what());
        return ExitCode::Usage;
    }
}
