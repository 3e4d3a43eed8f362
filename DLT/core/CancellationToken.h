#pragma once
#include <atomic>
#include <memory>

// Shared stop flag handed to a worker. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken()
        : flag(std::make_shared<std::atomic<bool>>(false)) {
    }

    void cancel() {
        flag->store(true);
    }

    bool cancelled() const {
        return flag->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag;
};
