/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds use inline definitions
#ifndef DEBUG

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ShoalEngine {
namespace {

constexpr const char* LOG_FILE_PREFIX = "shoal_";
constexpr const char* LOG_FILE_EXTENSION = ".log";
constexpr size_t DEFAULT_MAX_LOG_FILES = 5;
constexpr size_t FLUSH_INTERVAL = 50;

std::tm toLocalTime(std::time_t time) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &time);
#else
    localtime_r(&time, &timeinfo);
#endif
    return timeinfo;
}

bool isShoalLog(const std::filesystem::path& path) {
    return path.extension() == LOG_FILE_EXTENSION &&
           path.filename().string().starts_with(LOG_FILE_PREFIX);
}

// Release-build sink: CRITICAL and ERROR lines go to one file per run
class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void setDirectory(const std::string& directory) {
        std::lock_guard<std::mutex> lock(m_fileMutex);
        if (!m_opened) {
            m_directory = directory;
        }
    }

    void setMaxFiles(size_t maxFiles) {
        std::lock_guard<std::mutex> lock(m_fileMutex);
        if (!m_opened) {
            m_maxFiles = std::max<size_t>(1, maxFiles);
        }
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_opened) {
            open();
        }
        if (!m_fileStream.is_open()) {
            return; // File logging disabled for this run
        }

        // Format: YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;
        const std::tm timeinfo = toLocalTime(std::chrono::system_clock::to_time_t(now));

        m_fileStream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                     << std::setfill('0') << std::setw(3) << ms.count() << " ["
                     << level << "] [" << system << "] " << message << '\n';

        // Flush on CRITICAL or every FLUSH_INTERVAL messages
        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pendingLines >= FLUSH_INTERVAL) {
            m_fileStream.flush();
            m_pendingLines = 0;
        }
    }

private:
    FileLogger() = default;

    ~FileLogger() {
        if (m_fileStream.is_open()) {
            m_fileStream.flush();
        }
    }

    // Non-copyable
    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    // Opened lazily so the directory and retention can be configured first
    void open() {
        m_opened = true;

        namespace fs = std::filesystem;
        const fs::path logDir(m_directory);

        // Create logs directory if it doesn't exist
        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        // Make room for the file this run is about to create
        pruneLogs(logDir, m_maxFiles - 1);

        // Generate timestamped filename
        const std::tm started =
            toLocalTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
        std::ostringstream filename;
        filename << LOG_FILE_PREFIX << std::put_time(&started, "%Y%m%d_%H%M%S")
                 << LOG_FILE_EXTENSION;

        m_fileStream.open(logDir / filename.str(), std::ios::out | std::ios::app);
        if (!m_fileStream.is_open()) {
            return;
        }

        // Write header with app name
        m_fileStream << "=== " << SHOAL_APP_NAME << " Log ===\n"
                     << "Started: " << std::put_time(&started, "%Y-%m-%d %H:%M:%S") << '\n'
                     << "Retention: " << m_maxFiles << " file(s) in " << m_directory << "\n\n";
        m_fileStream.flush();
    }

    static void pruneLogs(const std::filesystem::path& logDir, size_t keepCount) {
        namespace fs = std::filesystem;

        std::error_code ec;
        std::vector<std::pair<fs::file_time_type, fs::path>> logFiles;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (!isShoalLog(entry.path())) {
                continue;
            }
            const auto modified = entry.last_write_time(ec);
            if (!ec) {
                logFiles.emplace_back(modified, entry.path());
            }
        }

        if (logFiles.size() <= keepCount) {
            return;
        }

        // Sort by modification time (oldest first)
        std::sort(logFiles.begin(), logFiles.end());

        // Remove oldest files
        const size_t toRemove = logFiles.size() - keepCount;
        for (size_t i = 0; i < toRemove; ++i) {
            fs::remove(logFiles[i].second, ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_fileStream;
    std::string m_directory{"logs"};
    size_t m_maxFiles{DEFAULT_MAX_LOG_FILES};
    size_t m_pendingLines{0};
    bool m_opened{false};
};

} // anonymous namespace

void Logger::SetLogDirectory(const std::string& directory) {
    FileLogger::Instance().setDirectory(directory);
}

void Logger::SetMaxLogFiles(size_t maxFiles) {
    FileLogger::Instance().setMaxFiles(maxFiles);
}

// Logger::Log implementations for release builds - write to file instead of console
void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    FileLogger::Instance().write(level, system, message);
}

} // namespace ShoalEngine

#endif // ifndef DEBUG
