#include "ProgressSink.h"
#include "../core/utils.h"

void ProgressSink::set(const std::string& key, double value) {
    std::lock_guard<std::mutex> lock(mtx);

    auto it = index.find(key);
    if (it != index.end()) {
        ordered[it->second].second = value;
        return;
    }

    index.emplace(key, ordered.size());
    ordered.emplace_back(key, value);
}

std::optional<double> ProgressSink::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx);

    auto it = index.find(key);
    if (it == index.end())
        return std::nullopt;
    return ordered[it->second].second;
}

double ProgressSink::snapshotTotal() const {
    return get(TOTAL_PROGRESS_KEY).value_or(0.0);
}

std::vector<ProgressSink::Entry> ProgressSink::entries() const {
    std::lock_guard<std::mutex> lock(mtx);
    return ordered;
}

std::size_t ProgressSink::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return ordered.size();
}
