// WATSIM - Logger utility
// Console logging with verbosity control and a per-run trace file

#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unistd.h>

namespace watsim {

enum class Verbosity { Quiet, Normal, Verbose };

class Logger {
public:
    Verbosity console_level = Verbosity::Normal;

private:
    std::chrono::steady_clock::time_point start_;
    std::ofstream trace_file_;
    std::mutex mutex_;
    bool is_tty_;
    int last_progress_len_ = 0;
    std::string command_;
    std::string version_;
    size_t warnings_ = 0;

    double elapsed() const {
        return std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_).count();
    }

    std::string timestamp() const {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&time));
        return buf;
    }

    void write_trace(const std::string& line) {
        if (trace_file_.is_open()) {
            trace_file_ << line << "\n";
            trace_file_.flush();
        }
    }

    void clear_progress_unlocked() {
        if (is_tty_ && last_progress_len_ > 0) {
            std::cerr << "\r" << std::string(last_progress_len_, ' ') << "\r";
            last_progress_len_ = 0;
        }
    }

public:
    Logger() : start_(std::chrono::steady_clock::now()),
               is_tty_(isatty(fileno(stderr))) {}

    explicit Logger(const std::string& command, const std::string& version = "")
        : start_(std::chrono::steady_clock::now()),
          is_tty_(isatty(fileno(stderr))),
          command_(command),
          version_(version) {}

    ~Logger() {
        if (trace_file_.is_open()) {
            trace_file_ << "\n[" << timestamp() << "] Run completed in "
                        << std::fixed << std::setprecision(1) << elapsed() << "s";
            if (warnings_ > 0) trace_file_ << " (" << warnings_ << " warnings)";
            trace_file_ << "\n";
            trace_file_.close();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Returns false if the trace file could not be created; console logging
    // keeps working either way.
    bool open_trace(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace_file_.open(path);
        if (!trace_file_.is_open()) return false;
        trace_file_ << "WATSIM";
        if (!command_.empty()) trace_file_ << " " << command_;
        if (!version_.empty()) trace_file_ << " v" << version_;
        trace_file_ << "\n";
        trace_file_ << "Started: " << timestamp() << "\n";
        trace_file_ << std::string(60, '=') << "\n\n";
        return true;
    }

    void info(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        clear_progress_unlocked();
        if (console_level >= Verbosity::Normal) {
            std::cerr << "[" << command_ << "] " << msg << "\n";
        }
        write_trace("[" + std::to_string(int(elapsed())) + "s] " + msg);
    }

    void detail(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (console_level >= Verbosity::Verbose) {
            clear_progress_unlocked();
            std::cerr << "[" << command_ << "]   " << msg << "\n";
        }
        write_trace("  " + msg);
    }

    void warn(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        clear_progress_unlocked();
        ++warnings_;
        if (console_level >= Verbosity::Normal) {
            std::cerr << "Warning: " << msg << "\n";
        }
        write_trace("[WARN] " + msg);
    }

    void error(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        clear_progress_unlocked();
        std::cerr << "Error: " << msg << "\n";
        write_trace("[ERROR] " + msg);
    }

    void progress(const std::string& stage, size_t current, size_t total) {
        if (console_level < Verbosity::Normal) return;
        std::lock_guard<std::mutex> lock(mutex_);

        size_t pct = total > 0 ? (100 * current / total) : 0;
        std::ostringstream ss;
        ss << "[" << command_ << "] " << stage << " " << current << "/" << total
           << " (" << pct << "%)";
        std::string line = ss.str();

        if (is_tty_) {
            std::cerr << "\r" << line;
            if ((int)line.size() < last_progress_len_) {
                std::cerr << std::string(last_progress_len_ - line.size(), ' ');
            }
            last_progress_len_ = line.size();
            if (current == total) {
                std::cerr << "\n";
                last_progress_len_ = 0;
            }
            std::cerr.flush();
        } else if (current == total || current == 1 || pct % 25 == 0) {
            std::cerr << line << "\n";
        }
    }

    void section(const std::string& title) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace("\n" + std::string(60, '='));
        write_trace(" " + title);
        write_trace(std::string(60, '='));
    }

    void metric(const std::string& name, double value, int precision = 4) {
        std::ostringstream ss;
        ss << "  " << name << ": " << std::fixed << std::setprecision(precision) << value;
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace(ss.str());
    }

    void metric(const std::string& name, size_t value) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace("  " + name + ": " + std::to_string(value));
    }

    void metric(const std::string& name, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace("  " + name + ": " + value);
    }

    size_t warnings() const { return warnings_; }
};

}  // namespace watsim
