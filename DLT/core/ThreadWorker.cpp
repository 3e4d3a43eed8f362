#include "ThreadWorker.h"

#include <exception>

ThreadWorker::ThreadWorker() {
}

ThreadWorker::~ThreadWorker() {
    cancel();
    join();
}

void ThreadWorker::start(WorkerFn worker) {
    std::lock_guard<std::mutex> lock(mtx);

    if (thread.joinable())
        return;

    running.store(true);
    thread = std::thread([this, worker]() {
        try {
            worker(stopToken);
        }
        catch (const std::exception& e) {
            std::lock_guard<std::mutex> errLock(errorMutex);
            lastError = e.what();
        }
        catch (...) {
            std::lock_guard<std::mutex> errLock(errorMutex);
            lastError = "unknown error";
        }
        running.store(false);
        });
}

void ThreadWorker::join() {
    std::lock_guard<std::mutex> lock(mtx);

    if (thread.joinable())
        thread.join();
}

bool ThreadWorker::isAlive() const {
    return running.load();
}

std::string ThreadWorker::error() const {
    std::lock_guard<std::mutex> lock(errorMutex);
    return lastError;
}

void ThreadWorker::cancel() {
    stopToken.cancel();
}
