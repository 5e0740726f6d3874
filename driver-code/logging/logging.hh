#pragma once
#include <string>
#include <iostream>

// journal priorities, lowest number is most severe
enum class LogLevel {
    error = 3,
    warning = 4,
    info = 6,
    debug = 7,
};

void log_info(const std::string& s);
void log_debug(const std::string& s);
void log_warning(const std::string& s);
void log_error(const std::string& s);

// messages less severe than this are dropped
void set_log_threshold(LogLevel level);
LogLevel log_threshold();
LogLevel log_level_from_string(const std::string& name);
