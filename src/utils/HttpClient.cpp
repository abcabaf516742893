#include "utils/HttpClient.hpp"
#include <curl/curl.h>
#include <mutex>

namespace ZenFeed {

namespace {

constexpr long kMaxRedirects = 5;

ErrorCode classifyCurlError(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return ErrorCode::ConnectionRefused;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_USE_SSL_FAILED:
            return ErrorCode::TlsError;
        default:
            return ErrorCode::NetworkFailure;
    }
}

}

void HttpClient::globalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpClient::HttpClient()
    : userAgent_("ZenFeed/1.0"), timeout_(10) {
    globalInit();
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpClient::Response HttpClient::get(const std::string& url) {
    Response response{0, "", false, "", std::nullopt};
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "CURL init failed";
        response.transportError = ErrorCode::NetworkFailure;
        return response;
    }

    struct curl_slist* requestHeaders = nullptr;
    requestHeaders = curl_slist_append(requestHeaders,
        "Accept: application/rss+xml, application/atom+xml, application/rdf+xml, application/xml;q=0.9, text/xml;q=0.9, */*;q=0.8");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, requestHeaders);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.success = (httpCode >= 200 && httpCode < 300);
        if (!response.success) response.error = "HTTP " + std::to_string(httpCode);
    } else {
        response.error = curl_easy_strerror(res);
        response.transportError = classifyCurlError(res);
    }
    curl_slist_free_all(requestHeaders);
    curl_easy_cleanup(curl);
    return response;
}

void HttpClient::setUserAgent(const std::string& ua) { userAgent_ = ua; }
void HttpClient::setTimeout(long t) { timeout_ = t; }

}
