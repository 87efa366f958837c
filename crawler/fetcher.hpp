#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "crawl_state.hpp"
#include "http_transport.hpp"
#include "log.hpp"
#include "rate_controller.hpp"

namespace prefixcrawl {

enum class FetchError {
    None,
    RateLimited,        // HTTP 429
    ServerError,        // HTTP 5xx
    NetworkError,       // no response at all
    MalformedResponse,  // 2xx without a "results" list of strings
    ClientError,        // any other non-2xx status, never retried
    RetriesExhausted,
};

const char* fetch_error_name(FetchError e);

struct FetchResult {
    FetchError error = FetchError::None;
    std::vector<std::string> names;
    bool truncated = false;
    long count = -1;  // the page's "count" field, -1 when absent
    int attempts = 0;

    bool ok() const { return error == FetchError::None; }
};

struct FetchPolicy {
    int api_version = 3;
    size_t max_results = 100;
    int max_retries = 8;
    double jitter = 0.3;             // upper bound of every random jitter, seconds
    double rate_limit_cap = 90.0;    // backoff ceilings, seconds
    double server_error_cap = 45.0;
    double network_cap = 45.0;
};

using Sleeper = std::function<void(double seconds)>;

void sleep_seconds(double seconds);

// Backoff before retry number `retry` (0-based) after a failure of `kind`.
// `u` is the random jitter drawn for this wait, in [0, policy.jitter].
double backoff_seconds(FetchError kind, int retry, double u, const FetchPolicy& policy);

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string url_escape(const std::string& s);

// Runs one autocomplete query with local retries. Every attempt that reaches
// the transport counts as a request; every 429, 5xx and transport failure is
// reported to the rate controller once.
class Fetcher {
public:
    Fetcher(HttpTransport& transport, RateController& rate, RequestCounter& requests, std::string base_url,
            FetchPolicy policy, Log& log, Sleeper sleeper = sleep_seconds);

    FetchResult fetch(const std::string& prefix);

    std::string url_for(const std::string& prefix) const;
    const FetchPolicy& policy() const { return policy_; }

private:
    HttpTransport& transport_;
    RateController& rate_;
    RequestCounter& requests_;
    std::string base_url_;
    FetchPolicy policy_;
    Log& log_;
    Sleeper sleep_;

    double random_jitter() const;
    bool parse_page(const std::string& prefix, const std::string& body, FetchResult& out) const;
};

}  // namespace prefixcrawl
