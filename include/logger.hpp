#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace lc {
    class Logger {
    public:
        // Reopens the log at path (append). Default is lunar_log.txt in the working directory.
        static void init(const std::string& path);
        static void log(const std::string& msg) { info(msg); }
        static void info(const std::string& msg);
        static void warn(const std::string& msg);
        static void error(const std::string& msg);
    private:
        static void write(const char* level, const std::string& msg);
        static std::ofstream log_file_;
        static std::mutex log_mutex_;
    };
}
