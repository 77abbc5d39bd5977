/**
 * @file logger.hpp
 * @brief leveled log sink of the console
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <cstddef>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>

namespace anylist::console {

enum LogLevel : std::size_t {
    kDebug = 1,
    kInfo = 3,
    kError = 5,
};

struct Logger {
    std::size_t log_level = 0;
    bool enable_log = true;

    /**
     * @brief write "[src-level]: msg", dropped if level is below log_level, log is disabled or no sink
     *
     */
    void writeLog(std::string_view src, std::string_view msg, std::size_t level) noexcept {
        if (level < log_level || !enable_log || !sink)
            return;
        *sink << '[' << src << '-' << level << "]: " << msg << '\n';
        sink->flush();
    }

    bool openFile(const std::string &path) {
        log_file = std::ofstream(path, std::ios::app);
        if (!log_file) {
            sink = nullptr;
            return false;
        }
        sink = &log_file;
        return true;
    }

    void attach(std::ostream &os) {
        log_file = std::ofstream{};
        sink = &os;
    }

  private:
    std::ofstream log_file = {};
    std::ostream *sink = nullptr;
};

} // namespace anylist::console
