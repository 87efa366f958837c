#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace prefixcrawl {

struct Config {
    std::string base_url = "http://127.0.0.1:8000";
    int api_version = 3;
    size_t max_results = 100;
    size_t workers = 5;

    uint64_t checkpoint_every = 200;       // requests
    double checkpoint_seconds = 300.0;
    std::string checkpoint_file = "autocomplete_checkpoint.json";
    std::string output_file = "discovered_names.json";
    std::string log_file = "autocomplete_extraction.log";

    double initial_delay = 1.0;
    double min_delay = 0.8;
    double max_delay = 3.0;
    int max_retries = 8;
    long request_timeout = 30;
    long connect_timeout = 5;
    double status_seconds = 30.0;

    std::string charset = "0123456789abcdefghijklmnopqrstuvwxyz";
    bool special_chars = true;
    bool verbose = false;
    bool help = false;
};

// Applies CRAWL_* environment variables, then `--key=value` / `--key value`
// flags, then validates. Returns empty string on success.
std::string load_config(int argc, const char* const* argv, Config& out);

// Only the validation step of load_config().
std::string validate_config(Config& cfg);

std::string usage(const std::string& program);

}  // namespace prefixcrawl
