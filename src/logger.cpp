#include "logger.hpp"
#include "time_utils.hpp"
#include <iostream>
#include <ctime>
#include <iomanip>

namespace lc {
    std::ofstream Logger::log_file_("lunar_log.txt", std::ios::out | std::ios::app);
    std::mutex Logger::log_mutex_;

    void Logger::init(const std::string& path) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (log_file_.is_open()) log_file_.close();
        log_file_.open(path, std::ios::out | std::ios::app);
        if (!log_file_.is_open()) std::cerr << "[LOG] Cannot open log file " << path << std::endl;
    }

    void Logger::info(const std::string& msg) { write("INFO", msg); }
    void Logger::warn(const std::string& msg) { write("WARN", msg); }
    void Logger::error(const std::string& msg) { write("ERROR", msg); }

    void Logger::write(const char* level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (log_file_.is_open()) {
            std::time_t now = std::time(nullptr);
            std::tm local;
            {
                std::lock_guard<std::mutex> zone(zoneLock());
                localtime_r(&now, &local);
            }
            log_file_ << "[" << std::put_time(&local, "%T") << "] " << level << " " << msg << std::endl;
        }
    }
}
