#include "net/curl_http_client.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace luasync {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

std::once_flag g_curl_init_once;
CURLcode g_curl_init_rc = CURLE_OK;

CURLcode EnsureCurlGlobalInit() {
    std::call_once(g_curl_init_once, [] {
        g_curl_init_rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    return g_curl_init_rc;
}

size_t AppendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    const size_t n = size * nmemb;
    body->append(ptr, n);
    return n;
}

} // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {}

Result CurlHttpClient::Get(const std::string& url, long timeout_sec, HttpResponse& out) {
    out = HttpResponse{};

    if (const CURLcode rc = EnsureCurlGlobalInit(); rc != CURLE_OK) {
        return Result::Fail(ErrorKind::NetworkError,
                            std::string("curl_global_init: ") + curl_easy_strerror(rc));
    }

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(ErrorKind::NetworkError, "curl_easy_init failed");

    char errbuf[CURL_ERROR_SIZE]{};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out.body);

    LogDebug("GET %s (timeout %lds)", url.c_str(), timeout_sec);

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        const char* detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        return Result::Fail(ErrorKind::NetworkError,
                            "GET " + url + " failed: " + detail + " (curl code " +
                                std::to_string(static_cast<int>(rc)) + ")");
    }

    (void)curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &out.status);
    LogDebug("GET %s -> HTTP %ld, %zu bytes", url.c_str(), out.status, out.body.size());
    return Result::Ok();
}

} // namespace luasync
