#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <ostream>

#include "../core/utils.h"

class Logger {
public:
    explicit Logger(std::ostream& out);
    Logger();
    ~Logger();

    void start();
    void stop();

    void setLevel(LogLevel level);
    void log(LogLevel level, const std::string& msg);

    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    void run();
    static std::string prefix(LogLevel level);

private:
    std::ostream& out;
    std::atomic<LogLevel> minLevel{ LogLevel::Info };

    std::queue<std::string> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
