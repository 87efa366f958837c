#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>

#include "config.hpp"
#include "crawler.hpp"
#include "http_transport.hpp"
#include "log.hpp"

using namespace std;
using namespace prefixcrawl;

static std::atomic<bool> g_stop_requested{false};

static void signal_handler(int) {
    g_stop_requested.store(true);
}

int main(int argc, char** argv) {
    Config cfg;
    auto err = load_config(argc, argv, cfg);
    if (!err.empty()) {
        cerr << "Configuration error: " << err << "\n\n" << usage(argv[0]);
        return 2;
    }
    if (cfg.help) {
        cout << usage(argv[0]);
        return 0;
    }

    Log log(cfg.verbose ? Log::Level::Debug : Log::Level::Info);
    if (!cfg.log_file.empty()) {
        auto lerr = log.open_file(cfg.log_file);
        if (!lerr.empty()) cerr << "Warning: " << lerr << ", logging to stderr only\n";
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CurlTransport transport(cfg.connect_timeout, cfg.request_timeout, "prefixcrawl/1.0");
    Crawler crawler(cfg, transport, log);

    Crawler::Summary summary;
    err = crawler.run(g_stop_requested, summary);

    cout << "Extraction " << (summary.interrupted ? "interrupted" : "complete") << ". Found " << summary.names
         << " names.\n";
    cout << "Made " << summary.requests << " API requests.\n";
    if (summary.requests > 0) {
        cout << "Efficiency: " << fixed << setprecision(2)
             << static_cast<double>(summary.names) / static_cast<double>(summary.requests) << " names per request\n";
    }

    if (!err.empty()) {
        cerr << "Crawl failed: " << err << "\n";
        return 1;
    }
    return 0;
}
