/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace Nightfall {

namespace {

std::mutex g_logMutex;

std::tm localTimeNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return local;
}

std::string formatLocalTime(const char* pattern) {
    std::tm local = localTimeNow();
    std::ostringstream out;
    out << std::put_time(&local, pattern);
    return out.str();
}

#ifndef DEBUG

constexpr const char* LOG_PREFIX = "nightfall_";
constexpr size_t LOG_FILES_KEPT = 5;

// Deletes the oldest nightfall_*.log files so at most keep - 1 remain
void pruneLogFiles(const std::filesystem::path& dir, size_t keep) {
    namespace fs = std::filesystem;
    std::error_code ec;
    std::vector<fs::path> logs;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.path().extension() == ".log" && name.rfind(LOG_PREFIX, 0) == 0) {
            logs.push_back(entry.path());
        }
    }
    if (logs.size() < keep) {
        return;
    }

    std::sort(logs.begin(), logs.end(), [](const fs::path& a, const fs::path& b) {
        std::error_code ignored;
        return fs::last_write_time(a, ignored) < fs::last_write_time(b, ignored);
    });
    const size_t excess = logs.size() - keep + 1;
    for (size_t i = 0; i < excess; ++i) {
        fs::remove(logs[i], ec);
    }
}

// Append-only log file, opened lazily on the first message after a directory is set
class LogFileSink {
public:
    void setDirectory(const std::string& directory) {
        if (m_file.is_open()) {
            m_file.close();
        }
        m_directory = directory;
        m_openAttempted = false;
    }

    void write(LogLevel level, const char* system, const char* message) {
        if (!m_openAttempted) {
            open();
        }
        if (!m_file.is_open()) {
            return;
        }
        m_file << formatLocalTime("%Y-%m-%d %H:%M:%S") << " [" << Logger::LevelName(level) << "] ["
               << system << "] " << message << std::endl;
    }

private:
    std::string m_directory;
    std::ofstream m_file;
    bool m_openAttempted{false};

    void open() {
        namespace fs = std::filesystem;
        m_openAttempted = true;
        if (m_directory.empty()) {
            return;
        }

        const fs::path dir = fs::path(m_directory) / "logs";
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return;
        }
        pruneLogFiles(dir, LOG_FILES_KEPT);

        const fs::path file = dir / (LOG_PREFIX + formatLocalTime("%Y%m%d_%H%M%S") + ".log");
        m_file.open(file, std::ios::out | std::ios::app);
        if (m_file.is_open()) {
            m_file << "# " << NIGHTFALL_APP_NAME << " started "
                   << formatLocalTime("%Y-%m-%d %H:%M:%S") << '\n';
        }
    }
};

LogFileSink& fileSink() {
    static LogFileSink sink;
    return sink;
}

#endif // DEBUG

} // namespace

const char* Logger::LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG_LEVEL: return "DEBUG";
    }
    return "UNKNOWN";
}

void Logger::Log(LogLevel level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

#ifdef DEBUG

void Logger::SetLogDirectory(const std::string&) {}

void Logger::Log(LogLevel level, const char* system, const char* message) {
    if (IsMuted()) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::printf("%s Nightfall [%s] %s: %s\n", formatLocalTime("%H:%M:%S").c_str(), system,
                LevelName(level), message);
    std::fflush(stdout);
}

#else

void Logger::SetLogDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    fileSink().setDirectory(directory);
}

void Logger::Log(LogLevel level, const char* system, const char* message) {
    if (IsMuted() || level > LogLevel::ERROR_LEVEL) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_logMutex);
    fileSink().write(level, system, message);
}

#endif // DEBUG

} // namespace Nightfall
