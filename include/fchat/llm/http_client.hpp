#pragma once
#include <string>
#include <utility>
#include <vector>

namespace fchat::llm
{

struct HttpResponse
{
    long        status = 0;
    std::string body;
};

/**
 *  Blocking HTTPS client on libcurl, one easy handle per request.
 *  curl_global_init() must have run (see CurlGlobal).
 */
class HttpClient
{
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit HttpClient(long timeout_ms = 60000) : timeout_ms_(timeout_ms) {}

    /** Throws fchat::CollaboratorFailure on transport errors (not on HTTP status). */
    HttpResponse post_json(const std::string& url, const Headers& headers,
                           const std::string& body) const;

private:
    long timeout_ms_;
};

/** RAII for curl_global_init / curl_global_cleanup. */
class CurlGlobal
{
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace fchat::llm
