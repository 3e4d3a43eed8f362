#pragma once
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <unordered_map>
#include <mutex>

// Ordered key -> progress map the tracker writes and the caller reads.
// Keys are file paths plus the reserved TOTAL_PROGRESS_KEY. Entries are
// never removed; a second set() on a key keeps its original position.
class ProgressSink {
public:
    using Entry = std::pair<std::string, double>;

    void set(const std::string& key, double value);
    std::optional<double> get(const std::string& key) const;

    double snapshotTotal() const;

    std::vector<Entry> entries() const;
    std::size_t size() const;

private:
    std::vector<Entry> ordered;
    std::unordered_map<std::string, std::size_t> index;
    mutable std::mutex mtx;
};
