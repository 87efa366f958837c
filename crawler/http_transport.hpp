#pragma once

#include <string>

namespace prefixcrawl {

struct HttpReply {
    long status = 0;
    std::string body;
};

// Issues one GET. Implementations must be safe to call from several threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Returns empty string when a response (of any status) was received;
    // otherwise a transport error (DNS, connect, TLS, timeout...).
    virtual std::string get(const std::string& url, HttpReply& out) = 0;
};

// libcurl-backed transport. Construct once, before any worker threads start.
class CurlTransport : public HttpTransport {
public:
    CurlTransport(long connect_timeout_s, long request_timeout_s, std::string user_agent);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::string get(const std::string& url, HttpReply& out) override;

private:
    long connect_timeout_s_;
    long request_timeout_s_;
    std::string user_agent_;
};

}  // namespace prefixcrawl
