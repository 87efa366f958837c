#include "config.hpp"

#include <cctype>
#include <cstdlib>
#include <exception>
#include <functional>
#include <limits>
#include <sstream>
#include <vector>

namespace prefixcrawl {

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string parse_double(const std::string& key, const std::string& v, double& out) {
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) return key + ": not a number: '" + v + "'";
        out = d;
        return "";
    } catch (const std::exception&) {
        return key + ": not a number: '" + v + "'";
    }
}

static std::string parse_long(const std::string& key, const std::string& v, long long& out) {
    try {
        size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != v.size()) return key + ": not an integer: '" + v + "'";
        out = n;
        return "";
    } catch (const std::exception&) {
        return key + ": not an integer: '" + v + "'";
    }
}

static std::string parse_bool(const std::string& key, const std::string& v, bool& out) {
    const std::string s = to_lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on" || s.empty()) {
        out = true;
        return "";
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return "";
    }
    return key + ": not a boolean: '" + v + "'";
}

namespace {

struct Option {
    const char* flag;
    const char* env;
    bool is_switch;  // may appear without a value
    std::function<std::string(const std::string& key, const std::string& value, Config& cfg)> apply;
};

template <typename Int>
Option int_option(const char* flag, const char* env, Int Config::*field) {
    return {flag, env, false, [field](const std::string& key, const std::string& v, Config& cfg) {
                long long n = 0;
                auto err = parse_long(key, v, n);
                if (!err.empty()) return err;
                if (n < 0) return key + ": must not be negative";
                if (static_cast<unsigned long long>(n) >
                    static_cast<unsigned long long>(std::numeric_limits<Int>::max())) {
                    return key + ": value too large: '" + v + "'";
                }
                cfg.*field = static_cast<Int>(n);
                return std::string();
            }};
}

Option double_option(const char* flag, const char* env, double Config::*field) {
    return {flag, env, false, [field](const std::string& key, const std::string& v, Config& cfg) {
                return parse_double(key, v, cfg.*field);
            }};
}

Option string_option(const char* flag, const char* env, std::string Config::*field) {
    return {flag, env, false, [field](const std::string&, const std::string& v, Config& cfg) {
                cfg.*field = v;
                return std::string();
            }};
}

Option bool_option(const char* flag, const char* env, bool Config::*field) {
    return {flag, env, true, [field](const std::string& key, const std::string& v, Config& cfg) {
                return parse_bool(key, v, cfg.*field);
            }};
}

const std::vector<Option>& options() {
    static const std::vector<Option> opts = {
        string_option("base-url", "CRAWL_BASE_URL", &Config::base_url),
        int_option("api-version", "CRAWL_API_VERSION", &Config::api_version),
        int_option("max-results", "CRAWL_MAX_RESULTS", &Config::max_results),
        int_option("workers", "CRAWL_WORKERS", &Config::workers),
        int_option("checkpoint-every", "CRAWL_CHECKPOINT_EVERY", &Config::checkpoint_every),
        double_option("checkpoint-seconds", "CRAWL_CHECKPOINT_SECONDS", &Config::checkpoint_seconds),
        string_option("checkpoint-file", "CRAWL_CHECKPOINT_FILE", &Config::checkpoint_file),
        string_option("output-file", "CRAWL_OUTPUT_FILE", &Config::output_file),
        string_option("log-file", "CRAWL_LOG_FILE", &Config::log_file),
        double_option("initial-delay", "CRAWL_INITIAL_DELAY", &Config::initial_delay),
        double_option("min-delay", "CRAWL_MIN_DELAY", &Config::min_delay),
        double_option("max-delay", "CRAWL_MAX_DELAY", &Config::max_delay),
        int_option("max-retries", "CRAWL_MAX_RETRIES", &Config::max_retries),
        int_option("request-timeout", "CRAWL_REQUEST_TIMEOUT", &Config::request_timeout),
        int_option("connect-timeout", "CRAWL_CONNECT_TIMEOUT", &Config::connect_timeout),
        double_option("status-seconds", "CRAWL_STATUS_SECONDS", &Config::status_seconds),
        string_option("charset", "CRAWL_CHARSET", &Config::charset),
        bool_option("special-chars", "CRAWL_SPECIAL_CHARS", &Config::special_chars),
        bool_option("verbose", "CRAWL_VERBOSE", &Config::verbose),
    };
    return opts;
}

const Option* find_option(const std::string& flag) {
    for (const auto& o : options()) {
        if (flag == o.flag) return &o;
    }
    return nullptr;
}

}  // namespace

std::string validate_config(Config& cfg) {
    while (!cfg.base_url.empty() && cfg.base_url.back() == '/') cfg.base_url.pop_back();
    if (cfg.base_url.empty()) return "base-url must not be empty";
    if (cfg.api_version < 1) return "api-version must be >= 1";
    if (cfg.max_results < 1) return "max-results must be >= 1";
    if (cfg.workers < 1) return "workers must be >= 1";
    if (cfg.min_delay < 0.0) return "min-delay must not be negative";
    if (cfg.max_delay < cfg.min_delay) return "max-delay must be >= min-delay";
    if (cfg.checkpoint_file.empty()) return "checkpoint-file must not be empty";
    if (cfg.output_file.empty()) return "output-file must not be empty";
    if (cfg.charset.empty()) return "charset must not be empty";
    if (cfg.status_seconds <= 0.0) return "status-seconds must be > 0";
    if (cfg.request_timeout < 1) return "request-timeout must be >= 1";
    if (cfg.connect_timeout < 1) return "connect-timeout must be >= 1";
    if (cfg.initial_delay < cfg.min_delay) cfg.initial_delay = cfg.min_delay;
    if (cfg.initial_delay > cfg.max_delay) cfg.initial_delay = cfg.max_delay;
    return "";
}

std::string load_config(int argc, const char* const* argv, Config& out) {
    Config cfg;

    for (const auto& o : options()) {
        const char* v = std::getenv(o.env);
        if (!v) continue;
        auto err = o.apply(o.env, v, cfg);
        if (!err.empty()) return err;
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            cfg.help = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) return "unexpected argument '" + arg + "'";

        std::string key = arg.substr(2);
        std::string value;
        bool has_value = false;
        if (auto eq = key.find('='); eq != std::string::npos) {
            value = key.substr(eq + 1);
            key = key.substr(0, eq);
            has_value = true;
        }

        const Option* o = find_option(key);
        if (!o) return "unknown option '--" + key + "'";
        if (!has_value && !o->is_switch) {
            if (i + 1 >= argc) return "option '--" + key + "' needs a value";
            value = argv[++i];
        }
        auto err = o->apply("--" + key, value, cfg);
        if (!err.empty()) return err;
    }

    if (!cfg.help) {
        auto err = validate_config(cfg);
        if (!err.empty()) return err;
    }
    out = cfg;
    return "";
}

std::string usage(const std::string& program) {
    const Config d;
    std::ostringstream ss;
    ss << "usage: " << program << " [--key=value ...]\n\n"
       << "Reconstructs every name behind a truncating autocomplete endpoint.\n"
       << "Each option can also be set through the environment variable shown.\n\n";
    for (const auto& o : options()) {
        ss << "  --" << o.flag << (o.is_switch ? "[=BOOL]" : "=VALUE") << "  (" << o.env << ")\n";
    }
    ss << "\ndefaults: base-url " << d.base_url << ", max-results " << d.max_results << ", workers " << d.workers
       << ", delays " << d.min_delay << "-" << d.max_delay << "s\n";
    return ss.str();
}

}  // namespace prefixcrawl
