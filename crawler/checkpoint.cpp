#include "checkpoint.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "file_util.hpp"
#include "json_util.hpp"

namespace prefixcrawl {

static double unix_now() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string encode_checkpoint(const CheckpointRecord& record) {
    std::string out;
    out.reserve(64 + 16 * (record.discovered_names.size() + record.explored_prefixes.size()));
    out += "{\"discovered_names\": ";
    json_append_string_array(out, record.discovered_names);
    out += ", \"explored_prefixes\": ";
    json_append_string_array(out, record.explored_prefixes);

    std::ostringstream tail;
    tail << ", \"request_count\": " << record.request_count;
    tail << ", \"timestamp\": " << std::fixed << std::setprecision(6) << record.timestamp;
    tail << ", \"prefix_length_stats\": {";
    bool first = true;
    for (const auto& [len, st] : record.prefix_length_stats) {
        if (!first) tail << ", ";
        first = false;
        tail << "\"" << len << "\": {\"success\": " << st.success << ", \"queries\": " << st.queries << "}";
    }
    tail << "}}";
    out += tail.str();
    return out;
}

static std::string read_string_list(const JsonValue& doc, const char* key, std::vector<std::string>& out) {
    out.clear();
    const JsonValue* v = doc.find(key);
    if (!v) return "";
    if (!v->is_array()) return std::string(key) + " is not a list";
    out.reserve(v->items.size());
    for (const auto& item : v->items) {
        if (!item.is_string()) return std::string(key) + " contains a non-string entry";
        out.push_back(item.str);
    }
    return "";
}

static uint64_t as_count(const JsonValue& v) {
    if (!v.is_number() || !(v.number > 0.0)) return 0;
    return static_cast<uint64_t>(std::llround(v.number));
}

std::string decode_checkpoint(const std::string& text, CheckpointRecord& out) {
    out = CheckpointRecord{};
    JsonValue doc;
    auto err = json_parse(text, doc);
    if (!err.empty()) return "checkpoint is not valid JSON: " + err;
    if (!doc.is_object()) return "checkpoint is not a JSON object";

    err = read_string_list(doc, "discovered_names", out.discovered_names);
    if (!err.empty()) return err;
    err = read_string_list(doc, "explored_prefixes", out.explored_prefixes);
    if (!err.empty()) return err;

    if (const JsonValue* rc = doc.find("request_count")) out.request_count = as_count(*rc);
    if (const JsonValue* ts = doc.find("timestamp"); ts && ts->is_number()) out.timestamp = ts->number;

    if (const JsonValue* stats = doc.find("prefix_length_stats")) {
        if (!stats->is_object()) return "prefix_length_stats is not an object";
        for (const auto& [key, entry] : stats->members) {
            size_t len = 0;
            try {
                len = static_cast<size_t>(std::stoul(key));
            } catch (const std::exception&) {
                return "prefix_length_stats has a non-numeric key '" + key + "'";
            }
            LengthStats st;
            if (const JsonValue* s = entry.find("success")) st.success = as_count(*s);
            if (const JsonValue* q = entry.find("queries")) st.queries = as_count(*q);
            out.prefix_length_stats[len] = st;
        }
    }
    return "";
}

std::vector<ChildPrefix> reconstruct_frontier(const std::vector<std::string>& explored, const Charset& charset) {
    const std::unordered_set<std::string> seen(explored.begin(), explored.end());

    // Shorter prefixes first so their extensions get the smaller sequence numbers.
    std::vector<const std::string*> order;
    order.reserve(seen.size());
    for (const auto& p : seen) order.push_back(&p);
    std::sort(order.begin(), order.end(), [](const std::string* a, const std::string* b) {
        if (a->size() != b->size()) return a->size() < b->size();
        return *a < *b;
    });

    std::vector<ChildPrefix> out;
    for (const std::string* prefix : order) {
        const int priority = static_cast<int>(prefix->size()) + kResumeBoost;
        for (char c : charset.all()) {
            std::string child = *prefix + c;
            if (seen.count(child)) continue;
            out.push_back({priority, std::move(child)});
        }
    }
    return out;
}

CheckpointRecord snapshot_state(const CrawlState& state) {
    CheckpointRecord r;
    // Workers record a page's names before marking its prefix explored, so
    // copying explored first keeps every stored prefix's names in the record.
    r.explored_prefixes = state.explored.sorted();
    r.discovered_names = state.names.sorted();
    r.request_count = state.requests.value();
    r.timestamp = unix_now();
    r.prefix_length_stats = state.stats.snapshot();
    return r;
}

void apply_checkpoint(const CheckpointRecord& record, CrawlState& state) {
    state.names.insert_all(record.discovered_names);
    state.explored.insert_all(record.explored_prefixes);
    state.requests.reset(record.request_count);
    state.stats.restore(record.prefix_length_stats);
}

// -------------------------
// CheckpointManager
// -------------------------
CheckpointManager::CheckpointManager(std::string path, uint64_t every_requests, double every_seconds,
                                     CrawlState& state, Log& log)
    : path_(std::move(path)),
      every_requests_(every_requests),
      every_seconds_(every_seconds),
      state_(state),
      log_(log),
      last_saved_at_(std::chrono::steady_clock::now()) {}

std::string CheckpointManager::load(CheckpointRecord& out, bool& found) const {
    found = false;
    out = CheckpointRecord{};
    if (!file_exists(path_)) return "";

    std::string text;
    auto err = read_text_file(path_, text);
    if (!err.empty()) return err;
    err = decode_checkpoint(text, out);
    if (!err.empty()) return err;
    found = true;
    return "";
}

std::string CheckpointManager::save_locked() {
    CheckpointRecord record = snapshot_state(state_);
    auto err = write_text_file_atomic(path_, encode_checkpoint(record));
    if (!err.empty()) return err;

    last_saved_requests_ = record.request_count;
    last_saved_at_ = std::chrono::steady_clock::now();
    saves_++;
    log_.info(msg() << "Checkpoint saved with " << record.discovered_names.size() << " names and "
                    << record.explored_prefixes.size() << " explored prefixes");
    return "";
}

std::string CheckpointManager::save() {
    std::lock_guard<std::mutex> lock(mu_);
    return save_locked();
}

std::string CheckpointManager::save_or_retry_locked() {
    auto err = save_locked();
    if (err.empty()) return "";

    log_.error("Error saving checkpoint: " + err + "; retrying");
    err = save_locked();
    if (err.empty()) return "";

    storage_failed_ = true;
    log_.error("Checkpoint storage failed twice in a row: " + err);
    return err;
}

std::string CheckpointManager::save_or_retry() {
    std::lock_guard<std::mutex> lock(mu_);
    return save_or_retry_locked();
}

void CheckpointManager::maybe_save() {
    std::unique_lock<std::mutex> lock(mu_, std::try_to_lock);
    if (!lock.owns_lock()) return;

    const uint64_t requests = state_.requests.value();
    const bool by_count = every_requests_ > 0 && requests >= last_saved_requests_ + every_requests_;
    const bool by_time = every_seconds_.count() > 0 &&
                         std::chrono::steady_clock::now() - last_saved_at_ >= every_seconds_;
    if (!by_count && !by_time) return;

    // Failures are logged and recorded in storage_failed_.
    (void)save_or_retry_locked();
}

void CheckpointManager::reset_schedule() {
    std::lock_guard<std::mutex> lock(mu_);
    last_saved_requests_ = state_.requests.value();
    last_saved_at_ = std::chrono::steady_clock::now();
}

bool CheckpointManager::storage_failed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return storage_failed_;
}

uint64_t CheckpointManager::saves() const {
    std::lock_guard<std::mutex> lock(mu_);
    return saves_;
}

}  // namespace prefixcrawl
