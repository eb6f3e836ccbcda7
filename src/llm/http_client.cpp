#include "llm/http_client.hpp"
#include "core/errors.hpp"

#include <memory>
#include <stdexcept>

#include <curl/curl.h>

namespace fchat::llm {

namespace {

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

using CurlPtr  = std::unique_ptr<CURL, void (*)(CURL*)>;
using SlistPtr = std::unique_ptr<curl_slist, void (*)(curl_slist*)>;

} // namespace

CurlGlobal::CurlGlobal()
{
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        throw std::runtime_error("curl_global_init failed");
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

HttpResponse HttpClient::post_json(const std::string& url, const Headers& headers,
                                   const std::string& body) const
{
    CurlPtr curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
        throw CollaboratorFailure("curl_easy_init failed");

    SlistPtr hdrs(curl_slist_append(nullptr, "Content-Type: application/json"),
                  curl_slist_free_all);
    for (const auto& [k, v] : headers) {
        const std::string line = k + ": " + v;
        curl_slist* next = curl_slist_append(hdrs.get(), line.c_str());
        if (!next) throw CollaboratorFailure("curl_slist_append failed");
        hdrs.release();
        hdrs.reset(next);
    }

    HttpResponse res;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "flightchat/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &res.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        const std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        throw CollaboratorFailure("HTTP request to " + url + " failed: " + detail);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
    return res;
}

} // namespace fchat::llm
