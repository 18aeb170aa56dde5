/**
 * xkpass Logger
 *
 * File-based logging for diagnosing word list and configuration problems.
 * Logs to ~/.xkpass/xkpass.log with timestamps and rotation.
 * Generated passwords are never written to the log.
 */

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <cstdlib>

namespace xkpass {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,    // Named ERR to avoid Windows ERROR macro conflict
        FATAL
    };

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    bool init(const std::string& log_dir = "", Level min_level = Level::INFO) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string dir = log_dir;
        if (dir.empty()) {
            const char* home = nullptr;
#ifdef _WIN32
            home = std::getenv("USERPROFILE");
#else
            home = std::getenv("HOME");
#endif
            if (home) {
                dir = std::string(home) + "/.xkpass";
            } else {
                dir = ".";
            }
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }

        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_path_ = dir + "/xkpass.log";

        // Rotate log if too large (> 10MB)
        if (std::filesystem::exists(log_path_, ec) &&
            std::filesystem::file_size(log_path_, ec) > 10 * 1024 * 1024) {
            std::string backup = log_path_ + ".old";
            std::filesystem::remove(backup, ec);
            std::filesystem::rename(log_path_, backup, ec);
        }

        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        min_level_ = min_level;
        initialized_ = true;

        // Write directly, the mutex is already held
        log_file_ << timestamp() << " [INFO ] === xkpass Logger Started ===\n";
        log_file_.flush();

        return true;
    }

    void log(Level level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || level < min_level_) return;

        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    // Lock-free check so callers can skip building messages
    bool enabled(Level level) const {
        return initialized_.load() && level >= min_level_.load();
    }

    void log_wordlist_loaded(const std::string& source, size_t total, size_t suitable,
                             int min_length, int max_length, double elapsed_ms) {
        std::stringstream ss;
        ss << "WORDLIST: Source=" << source
           << ", Words=" << total
           << ", Suitable=" << suitable
           << " (length " << min_length << "<len<" << max_length << ")"
           << ", ElapsedMs=" << std::fixed << std::setprecision(2) << elapsed_ms;
        log(Level::DEBUG, ss.str());
    }

    void log_config_loaded(const std::string& path, int errors) {
        std::stringstream ss;
        ss << "CONFIG: Path=" << path << ", Errors=" << errors;
        log(errors > 0 ? Level::WARN : Level::INFO, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    std::string get_log_path() const { return log_path_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== xkpass Logger Stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() : initialized_(false) {}

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    std::atomic<bool> initialized_;
    std::atomic<Level> min_level_{Level::INFO};
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_INFO(msg)  xkpass::Logger::instance().log(xkpass::Logger::Level::INFO, msg)
#define LOG_WARN(msg)  xkpass::Logger::instance().log(xkpass::Logger::Level::WARN, msg)
#define LOG_ERROR(msg) xkpass::Logger::instance().log(xkpass::Logger::Level::ERR, msg)
#define LOG_DEBUG(msg) xkpass::Logger::instance().log(xkpass::Logger::Level::DEBUG, msg)

}  // namespace xkpass
