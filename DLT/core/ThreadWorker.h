#pragma once
#include <thread>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "Worker.h"
#include "CancellationToken.h"

class ThreadWorker : public Worker {
public:
    using WorkerFn = std::function<void(const CancellationToken&)>;

    ThreadWorker();
    ~ThreadWorker() override;

    void start(WorkerFn worker);
    void join();

    bool isAlive() const override;
    void cancel() override;

    const CancellationToken& token() const { return stopToken; }

    // what() of the exception that ended the worker, empty otherwise
    std::string error() const;

private:
    std::thread thread;
    CancellationToken stopToken;
    std::atomic<bool> running{ false };
    std::mutex mtx;

    mutable std::mutex errorMutex;
    std::string lastError;
};
