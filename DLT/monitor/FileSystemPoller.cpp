#include "FileSystemPoller.h"
#include "../io/DiskStat.h"

FileSystemPoller::FileSystemPoller(std::vector<TrackedFile> files,
    Worker& worker,
    ProgressSink& sink,
    ConnectivityProbe& probe,
    const TrackerConfig& config,
    Logger& logger,
    volatile std::sig_atomic_t* externalStop)
    : ProgressPoller(worker, sink, probe, config, logger, externalStop),
    tracked(std::move(files)),
    remaining(tracked) {
    for (const auto& f : tracked)
        grandTotal += f.size;
}

bool FileSystemPoller::done() const {
    return remaining.empty();
}

std::uint64_t FileSystemPoller::totalBytes() const {
    return grandTotal;
}

void FileSystemPoller::complete(std::size_t i) {
    const TrackedFile f = remaining[i];

    sink.set(f.path, 1.0);
    completedBytes += f.size;
    remaining.erase(remaining.begin() + i);

    logger.info("Finished " + f.path + " (" + std::to_string(f.size) + " bytes)");
}

void FileSystemPoller::pollOnce() {
    for (std::size_t i = 0; i < remaining.size(); ++i) {
        const auto size = regularFileSize(remaining[i].path);
        if (!size)
            continue;

        if (*size < remaining[i].size) {
            sink.set(remaining[i].path, ratio(*size, remaining[i].size));
            reportTotal(completedBytes + *size);
            return;
        }

        complete(i);
        reportTotal(completedBytes);
        return;
    }

    // nothing on disk yet
    reportTotal(completedBytes);
}

void FileSystemPoller::finish() {
    std::uint64_t partial = 0;

    std::size_t i = 0;
    while (i < remaining.size()) {
        const auto size = regularFileSize(remaining[i].path);
        if (size && *size >= remaining[i].size) {
            complete(i);
            continue;
        }

        if (size) {
            sink.set(remaining[i].path, ratio(*size, remaining[i].size));
            partial += *size;
        }
        ++i;
    }

    reportTotal(completedBytes + partial);
}

std::string FileSystemPoller::summary() const {
    return "files " + std::to_string(tracked.size() - remaining.size()) + "/" + std::to_string(tracked.size());
}
