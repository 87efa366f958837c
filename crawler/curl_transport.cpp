#include "http_transport.hpp"

#include <utility>

#include <curl/curl.h>

namespace prefixcrawl {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* reply = reinterpret_cast<HttpReply*>(userdata);
    reply->body.append(ptr, size * nmemb);
    return size * nmemb;
}

CurlTransport::CurlTransport(long connect_timeout_s, long request_timeout_s, std::string user_agent)
    : connect_timeout_s_(connect_timeout_s),
      request_timeout_s_(request_timeout_s),
      user_agent_(std::move(user_agent)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

std::string CurlTransport::get(const std::string& url, HttpReply& out) {
    out = {};
    CURL* c = curl_easy_init();
    if (!c) return "curl init failed";

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(c, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, connect_timeout_s_);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, request_timeout_s_);
    // Worker threads must not receive SIGALRM from the resolver.
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers);

    CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK) {
        std::string err = curl_easy_strerror(rc);
        curl_slist_free_all(headers);
        curl_easy_cleanup(c);
        return "curl request failed: " + err;
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(c);
    return "";
}

}  // namespace prefixcrawl
