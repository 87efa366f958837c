#pragma once

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace prefixcrawl {

// Line-oriented log sink shared by every component of a crawl.
// Lines look like "2024-01-01 12:00:00,123 - INFO - message".
class Log {
public:
    enum class Level {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3,
    };

    explicit Log(Level min_level = Level::Info, std::ostream& out = std::cerr);

    // Additionally appends every line to `path`. Returns empty string on success.
    std::string open_file(const std::string& path);

    void set_level(Level level);
    bool enabled(Level level) const { return level >= min_level_.load(); }

    void write(Level level, const std::string& message);

    void debug(const std::string& m) { write(Level::Debug, m); }
    void info(const std::string& m) { write(Level::Info, m); }
    void warning(const std::string& m) { write(Level::Warning, m); }
    void error(const std::string& m) { write(Level::Error, m); }

private:
    std::atomic<Level> min_level_;
    std::ostream& out_;
    std::ofstream file_;
    std::mutex mu_;
};

// Builds a message with stream syntax: log.info(msg() << "x=" << x);
class msg {
public:
    template <typename T>
    msg& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }
    operator std::string() const { return ss_.str(); }

private:
    std::ostringstream ss_;
};

}  // namespace prefixcrawl
