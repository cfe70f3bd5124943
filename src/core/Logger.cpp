/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace HordeMind {
namespace {

constexpr const char* LOG_FILE_PREFIX = "hordemind_";
constexpr size_t LOG_FILES_KEPT = 5;
constexpr size_t FLUSH_EVERY = 50;

std::tm localTime(std::chrono::system_clock::time_point tp) {
    auto raw = std::chrono::system_clock::to_time_t(tp);
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &raw);
#else
    localtime_r(&raw, &out);
#endif
    return out;
}

class ReleaseLogFile {
public:
    static ReleaseLogFile& Instance() {
        static ReleaseLogFile instance;
        return instance;
    }

    void write(LogLevel level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        std::tm stamp = localTime(now);

        m_stream << std::put_time(&stamp, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << Logger::levelName(level) << "] [" << system << "] "
                 << message << '\n';

        if (level == LogLevel::CRITICAL || ++m_pending >= FLUSH_EVERY) {
            m_stream.flush();
            m_pending = 0;
        }
    }

    ReleaseLogFile(const ReleaseLogFile&) = delete;
    ReleaseLogFile& operator=(const ReleaseLogFile&) = delete;

private:
    ReleaseLogFile() = default;
    ~ReleaseLogFile() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    void open() {
        m_opened = true;

        // HORDE_APP_NAME comes from the build (PROJECT_NAME)
        char* prefPath = SDL_GetPrefPath("HammerForged", HORDE_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        namespace fs = std::filesystem;
        fs::path dir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return;
        }
        pruneOldLogs(dir);

        std::tm started = localTime(std::chrono::system_clock::now());
        std::ostringstream name;
        name << LOG_FILE_PREFIX << std::put_time(&started, "%Y%m%d_%H%M%S")
             << ".log";

        m_stream.open(dir / name.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << HORDE_APP_NAME << " navigation log, started "
                     << std::put_time(&started, "%Y-%m-%d %H:%M:%S")
                     << " ===\n";
            m_stream.flush();
        }
    }

    // Keeps the newest LOG_FILES_KEPT - 1 files so the new one makes the total
    void pruneOldLogs(const std::filesystem::path& dir) {
        namespace fs = std::filesystem;
        std::vector<fs::directory_entry> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            const auto file = entry.path().filename().string();
            if (entry.path().extension() == ".log" &&
                file.starts_with(LOG_FILE_PREFIX)) {
                logs.push_back(entry);
            }
        }
        if (logs.size() < LOG_FILES_KEPT) {
            return;
        }
        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      std::error_code ea;
                      std::error_code eb;
                      return a.last_write_time(ea) < b.last_write_time(eb);
                  });
        const size_t excess = logs.size() - (LOG_FILES_KEPT - 1);
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i].path(), ec);
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_opened{false};
    size_t m_pending{0};
};

} // namespace

void Logger::Log(LogLevel level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(LogLevel level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    ReleaseLogFile::Instance().write(level, system, message);
}

} // namespace HordeMind

#endif // ifndef DEBUG
