#include "fetcher.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

#include "json_util.hpp"

namespace prefixcrawl {

const char* fetch_error_name(FetchError e) {
    switch (e) {
        case FetchError::None: return "none";
        case FetchError::RateLimited: return "rate limited";
        case FetchError::ServerError: return "server error";
        case FetchError::NetworkError: return "network error";
        case FetchError::MalformedResponse: return "malformed response";
        case FetchError::ClientError: return "client error";
        case FetchError::RetriesExhausted: return "retries exhausted";
    }
    return "unknown";
}

void sleep_seconds(double seconds) {
    if (seconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

double backoff_seconds(FetchError kind, int retry, double u, const FetchPolicy& policy) {
    const double pow2 = std::ldexp(1.0, std::min(retry, 30));
    switch (kind) {
        case FetchError::RateLimited:
            return std::min(policy.rate_limit_cap, pow2 * (1.0 + u));
        case FetchError::ServerError:
            return std::min(policy.server_error_cap, 5.0 * (retry + 1)) + u;
        case FetchError::NetworkError:
            return std::min(policy.network_cap, 2.0 * pow2) + u;
        default:
            return 0.0;
    }
}

std::string url_escape(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        const bool unreserved = std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
        if (unreserved && c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

static std::mt19937& thread_rng() {
    thread_local std::mt19937 rng = [] {
        std::random_device rd;
        auto now = static_cast<unsigned>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
        std::seed_seq seq{rd(), rd(), rd(), now, now ^ 0x9e3779b9U};
        return std::mt19937(seq);
    }();
    return rng;
}

Fetcher::Fetcher(HttpTransport& transport, RateController& rate, RequestCounter& requests, std::string base_url,
                 FetchPolicy policy, Log& log, Sleeper sleeper)
    : transport_(transport),
      rate_(rate),
      requests_(requests),
      base_url_(std::move(base_url)),
      policy_(policy),
      log_(log),
      sleep_(std::move(sleeper)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string Fetcher::url_for(const std::string& prefix) const {
    std::ostringstream ss;
    ss << base_url_ << "/v" << policy_.api_version << "/autocomplete?query=" << url_escape(prefix)
       << "&max_results=" << policy_.max_results;
    return ss.str();
}

double Fetcher::random_jitter() const {
    if (policy_.jitter <= 0.0) return 0.0;
    std::uniform_real_distribution<double> dist(0.0, policy_.jitter);
    return dist(thread_rng());
}

bool Fetcher::parse_page(const std::string& prefix, const std::string& body, FetchResult& out) const {
    JsonValue doc;
    auto err = json_parse(body, doc);
    if (!err.empty()) {
        log_.warning(msg() << "Unparseable response for query '" << prefix << "': " << err);
        return false;
    }
    const JsonValue* results = doc.find("results");
    if (!results || !results->is_array()) {
        std::string keys;
        for (const auto& m : doc.members) keys += (keys.empty() ? "" : ", ") + m.first;
        log_.warning(msg() << "Unexpected response format for query '" << prefix << "': keys [" << keys << "]");
        return false;
    }

    std::vector<std::string> names;
    names.reserve(results->items.size());
    for (const auto& item : results->items) {
        if (!item.is_string()) {
            log_.warning(msg() << "Non-string entry in results for query '" << prefix << "'");
            return false;
        }
        names.push_back(item.str);
    }
    out.names = std::move(names);
    // "count" is informational; values a long cannot hold are treated as absent.
    if (const JsonValue* count = doc.find("count"); count && count->is_number()) {
        const double n = count->number;
        if (n >= 0.0 && n < static_cast<double>(std::numeric_limits<long>::max())) {
            out.count = static_cast<long>(n);
        }
    }
    return true;
}

FetchResult Fetcher::fetch(const std::string& prefix) {
    FetchResult result;
    const std::string url = url_for(prefix);

    for (int attempt = 0;; attempt++) {
        sleep_(random_jitter());

        HttpReply reply;
        auto terr = transport_.get(url, reply);
        requests_.increment();
        result.attempts = attempt + 1;

        FetchError failure = FetchError::None;
        if (!terr.empty()) {
            failure = FetchError::NetworkError;
            log_.error(msg() << "Request error querying '" << prefix << "': " << terr);
        } else if (reply.status == 429) {
            failure = FetchError::RateLimited;
        } else if (reply.status >= 500) {
            failure = FetchError::ServerError;
            log_.error(msg() << "Error status code: " << reply.status << " for query '" << prefix << "'");
        } else if (reply.status < 200 || reply.status >= 300) {
            log_.error(msg() << "Error status code: " << reply.status << " for query '" << prefix << "'");
            result.error = FetchError::ClientError;
            return result;
        }

        if (failure == FetchError::None) {
            if (!parse_page(prefix, reply.body, result)) {
                result.error = FetchError::MalformedResponse;
                result.names.clear();
                return result;
            }
            result.truncated = result.names.size() >= policy_.max_results;
            rate_.report_success();

            if (result.count >= 0) {
                log_.info(msg() << "Query '" << prefix << "' returned " << result.names.size()
                                << " suggestions (count: " << result.count << ")");
            } else {
                log_.info(msg() << "Query '" << prefix << "' returned " << result.names.size()
                                << " suggestions (count: N/A)");
            }
            if (!result.names.empty() && log_.enabled(Log::Level::Debug)) {
                log_.debug(msg() << "First: " << result.names.front() << ", Last: " << result.names.back());
            }
            return result;
        }

        rate_.report_failure();
        if (attempt >= policy_.max_retries) {
            log_.error(msg() << "Max retries reached for query '" << prefix << "' (last failure: "
                             << fetch_error_name(failure) << "). Skipping.");
            result.error = FetchError::RetriesExhausted;
            return result;
        }

        const double wait = backoff_seconds(failure, attempt, random_jitter(), policy_);
        log_.warning(msg() << (failure == FetchError::RateLimited ? "Rate limited" : fetch_error_name(failure))
                           << ". Sleeping for " << std::fixed << std::setprecision(2) << wait << " seconds. (Retry "
                           << attempt + 1 << "/" << policy_.max_retries << ")");
        sleep_(wait);
    }
}

}  // namespace prefixcrawl
