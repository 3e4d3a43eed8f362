#include "LogProtocolPoller.h"
#include "../io/DiskStat.h"

namespace {
std::uint64_t sumSizes(const std::map<std::string, std::uint64_t>& sizes) {
    std::uint64_t sum = 0;
    for (const auto& kv : sizes)
        sum += kv.second;
    return sum;
}
}

LogProtocolPoller::LogProtocolPoller(ModelWorker& worker,
    ProgressSink& sink,
    ConnectivityProbe& probe,
    const TrackerConfig& config,
    Logger& logger,
    volatile std::sig_atomic_t* externalStop)
    : ProgressPoller(worker, sink, probe, config, logger, externalStop),
    reader(worker.progressLog()) {
    grandTotal = sumSizes(worker.declaredSizesByFile(false));
    if (grandTotal < 1)
        grandTotal = sumSizes(worker.declaredSizesByFile(true));
    if (grandTotal < 1)
        logger.warn("Worker declared no file sizes, total follows the sizes in its log");
}

bool LogProtocolPoller::done() const {
    return reader.finished();
}

std::uint64_t LogProtocolPoller::totalBytes() const {
    return grandTotal > 0 ? grandTotal : sumSizes(seenDeclared);
}

std::uint64_t LogProtocolPoller::accumulated() const {
    return sumSizes(onDisk);
}

void LogProtocolPoller::apply(const LogRecord& record) {
    if (record.declaredSize)
        seenDeclared[record.path] = *record.declaredSize;

    if (record.state == LogRecord::State::Failed) {
        sink.set(record.path, 0.0);
        ++failedFiles;
        logger.warn("Download of " + record.path + " failed");
        return;
    }

    const std::uint64_t size = sizeOrZero(record.path);
    onDisk[record.path] = size;

    if (record.state == LogRecord::State::Complete) {
        // an empty declared file is done as soon as it is announced
        const double progress = *record.declaredSize == 0 ? 1.0 : (double)size / (double)*record.declaredSize;
        sink.set(record.path, progress);
        ++completedFiles;
        logger.info("Finished " + record.path + " (" + std::to_string(size) + " bytes)");
        return;
    }

    if (record.declaredSize && *record.declaredSize > 0)
        sink.set(record.path, (double)size / (double)*record.declaredSize);
}

void LogProtocolPoller::pollOnce() {
    for (const auto& record : reader.poll())
        apply(record);

    reportTotal(accumulated());
}

void LogProtocolPoller::finish() {
    // the worker may have written its last records after our last poll
    if (!reader.finished()) {
        for (const auto& record : reader.poll())
            apply(record);
    }

    reportTotal(accumulated());
}

std::string LogProtocolPoller::summary() const {
    std::string s = "files " + std::to_string(completedFiles) + " done";
    if (failedFiles > 0)
        s += ", " + std::to_string(failedFiles) + " failed";
    return s;
}
