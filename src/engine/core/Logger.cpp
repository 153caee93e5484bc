#include "Logger.hpp"

#include <cstdlib>

namespace kineticEngine {

std::mutex Logger::_mutex;
bool Logger::_debugEnabled = std::getenv("KINETIC_DEBUG") != nullptr;
std::set<std::string> Logger::_loggedOnce;

void Logger::setDebugEnabled(bool enabled) {
    _debugEnabled = enabled;
}

bool Logger::isDebugEnabled() {
    return _debugEnabled;
}

void Logger::Info(const std::string& message) {
    Log(Level::INFO, message);
}

void Logger::Debug(const std::string& message) {
    if (_debugEnabled) {
        Log(Level::DEBUG, message);
    }
}

void Logger::Error(const std::string& message) {
    Log(Level::ERROR, message);
}

void Logger::DebugOnce(const std::string& message) {
    if (!_debugEnabled) return;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_loggedOnce.insert(message).second) {
            return;
        }
    }

    Log(Level::DEBUG, message);
}

void Logger::Log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(_mutex);

    std::string levelStr;
    std::string colorCode;

    switch (level) {
        case Level::INFO:    levelStr = "INFO "; colorCode = "\033[32m"; break; // Green
        case Level::DEBUG:   levelStr = "DEBUG"; colorCode = "\033[36m"; break; // Cyan
        case Level::ERROR:   levelStr = "ERROR"; colorCode = "\033[31m"; break; // Red
    }

    std::cout << colorCode
              << "[" << getTimestamp() << "]"
              << "[" << getThreadId() << "]"
              << "[" << levelStr << "] "
              << message
              << "\033[0m" << std::endl;
}

std::string Logger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    auto timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt = *std::localtime(&timer);

    std::stringstream ss;
    ss << std::put_time(&bt, "%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::getThreadId() {
    std::stringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

} // namespace kineticEngine
