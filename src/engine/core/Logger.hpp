#pragma once

#include <string>
#include <set>
#include <mutex>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <thread>
#include <sstream>

namespace kineticEngine {

class Logger {
public:
    enum class Level {
        INFO,
        DEBUG,
        ERROR
    };

    static void Info(const std::string& message);
    static void Debug(const std::string& message);
    static void Error(const std::string& message);

    // Logs a given debug message at most once per process
    static void DebugOnce(const std::string& message);

    static void setDebugEnabled(bool enabled);
    static bool isDebugEnabled();

private:
    static std::mutex _mutex;
    static bool _debugEnabled;
    static std::set<std::string> _loggedOnce;

    static void Log(Level level, const std::string& message);
    static std::string getTimestamp();
    static std::string getThreadId();
};

} // namespace kineticEngine
