#include "services/FeedFetcher.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include <thread>

namespace ZenFeed {

HttpFetcher::HttpFetcher(FetchOptions options) : options_(std::move(options)) {
    HttpClient::globalInit();
}

std::string HttpFetcher::fetch(const std::string& url, std::chrono::seconds timeout) {
    int attempt = 0;
    while (true) {
        try {
            return fetchOnce(url, timeout);
        } catch (const FetchError& e) {
            if (!e.isTransient() || attempt >= options_.retries) throw;
            attempt++;
            LOG_W("Fetcher", "{} failed ({}), retry {}/{} in {} ms", url, e.what(), attempt,
                  options_.retries, options_.retryDelayMs);
            std::this_thread::sleep_for(std::chrono::milliseconds(options_.retryDelayMs));
        }
    }
}

std::string HttpFetcher::fetchOnce(const std::string& url, std::chrono::seconds timeout) {
    HttpClient client;
    client.setUserAgent(options_.userAgent);
    client.setTimeout(static_cast<long>(timeout.count()));

    auto response = client.get(url);
    if (response.transportError) {
        throw FetchError(*response.transportError, response.error);
    }
    if (!response.success) {
        throw FetchError(ErrorCode::HttpStatus, response.error, response.statusCode);
    }
    LOG_T("Fetcher", "{}: HTTP {}, {} bytes", url, response.statusCode, response.body.size());
    return std::move(response.body);
}

}
