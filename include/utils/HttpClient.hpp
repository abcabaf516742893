#pragma once
#include "core/Errors.hpp"
#include <optional>
#include <string>

namespace ZenFeed {

class HttpClient {
public:
    HttpClient();

    struct Response {
        int statusCode;
        std::string body;
        bool success;
        std::string error;
        // Set when the transfer itself failed (no HTTP status available).
        std::optional<ErrorCode> transportError;
    };

    Response get(const std::string& url);
    void setUserAgent(const std::string& userAgent);
    void setTimeout(long timeoutSeconds);

    // curl_global_init is not thread-safe; call once before worker threads start.
    static void globalInit();

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    std::string userAgent_;
    long timeout_;
};

}
