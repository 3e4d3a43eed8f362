#pragma once
#include <vector>

#include "ProgressPoller.h"

// Watches a fixed set of destination files grow toward their target
// sizes. Each cycle reports at most one file: the first remaining file
// found on disk, in the order the files were given.
class FileSystemPoller : public ProgressPoller {
public:
    FileSystemPoller(std::vector<TrackedFile> files,
        Worker& worker,
        ProgressSink& sink,
        ConnectivityProbe& probe,
        const TrackerConfig& config,
        Logger& logger,
        volatile std::sig_atomic_t* externalStop = nullptr);

    bool done() const override;
    std::uint64_t totalBytes() const override;

    std::size_t remainingCount() const { return remaining.size(); }

protected:
    void pollOnce() override;
    void finish() override;
    std::string summary() const override;

private:
    void complete(std::size_t i);

private:
    const std::vector<TrackedFile> tracked;
    std::vector<TrackedFile> remaining;

    std::uint64_t grandTotal{ 0 };
    std::uint64_t completedBytes{ 0 };
};
