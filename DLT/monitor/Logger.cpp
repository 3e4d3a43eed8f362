#include "Logger.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

Logger::Logger(std::ostream& o)
    : out(o) {
}

Logger::Logger()
    : out(std::cout) {
}

Logger::~Logger() {
    stop();
}

void Logger::start() {
    if (running.exchange(true))
        return;
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    running.store(false);
    cv.notify_all();

    if (worker.joinable())
        worker.join();
}

void Logger::setLevel(LogLevel level) {
    minLevel.store(level);
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (level < minLevel.load())
        return;

    {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push(prefix(level) + msg);
    }
    cv.notify_one();
}

std::string Logger::prefix(LogLevel level) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    const char* tag = "INFO";
    switch (level) {
    case LogLevel::Debug: tag = "DEBUG"; break;
    case LogLevel::Info:  tag = "INFO"; break;
    case LogLevel::Warn:  tag = "WARN"; break;
    case LogLevel::Error: tag = "ERROR"; break;
    }

    std::ostringstream os;
    os << "[" << std::put_time(&local, "%H:%M:%S") << "."
        << std::setw(3) << std::setfill('0') << millis << "] "
        << "[" << tag << "] ";
    return os.str();
}

void Logger::run() {
    while (running.load() || !messages.empty()) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            out << messages.front() << std::endl;
            messages.pop();
        }
    }
}
