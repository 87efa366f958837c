#include "log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

namespace prefixcrawl {

static const char* level_name(Log::Level level) {
    switch (level) {
        case Log::Level::Debug: return "DEBUG";
        case Log::Level::Info: return "INFO";
        case Log::Level::Warning: return "WARNING";
        case Log::Level::Error: return "ERROR";
    }
    return "INFO";
}

static std::string timestamp_now() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::localtime_r(&secs, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}

Log::Log(Level min_level, std::ostream& out) : min_level_(min_level), out_(out) {}

std::string Log::open_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mu_);
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_) return "could not open log file " + path;
    return "";
}

void Log::set_level(Level level) {
    min_level_.store(level);
}

void Log::write(Level level, const std::string& message) {
    if (!enabled(level)) return;
    const std::string line = timestamp_now() + " - " + level_name(level) + " - " + message + "\n";

    std::lock_guard<std::mutex> lock(mu_);
    out_ << line;
    out_.flush();
    if (file_.is_open()) {
        file_ << line;
        file_.flush();
    }
}

}  // namespace prefixcrawl
