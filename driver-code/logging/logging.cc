#include <logging.hh>
#include <atomic>
#include <mutex>
#include <stdexcept>

#include <systemd/sd-journal.h>

// log functions need to be thread safe
static std::mutex mux;
static std::atomic<LogLevel> threshold{LogLevel::info};

static void journal(LogLevel level, const std::string& s) {
    if (static_cast<int>(level) > static_cast<int>(threshold.load())) {
        return;
    }
    std::lock_guard<std::mutex> l(mux);
    sd_journal_send(
        "MESSAGE=%s", s.c_str(),
        "PRIORITY=%i", static_cast<int>(level),
        "SYSLOG_IDENTIFIER=panel-driver",
        NULL);
}

void log_info(const std::string& s) {
    journal(LogLevel::info, s);
}

void log_debug(const std::string& s) {
    journal(LogLevel::debug, s);
}

void log_warning(const std::string& s) {
    journal(LogLevel::warning, s);
}

void log_error(const std::string& s) {
    journal(LogLevel::error, s);
}

void set_log_threshold(LogLevel level) {
    threshold.store(level);
}

LogLevel log_threshold() {
    return threshold.load();
}

LogLevel log_level_from_string(const std::string& name) {
    if (name == "debug") return LogLevel::debug;
    if (name == "info") return LogLevel::info;
    if (name == "warning") return LogLevel::warning;
    if (name == "error") return LogLevel::error;
    throw std::invalid_argument{"unknown log level: " + name};
}
