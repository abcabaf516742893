#pragma once
#include "utils/Config.hpp"
#include <chrono>
#include <string>

namespace ZenFeed {

// Retrieves raw feed documents. Implementations must be safe to call from
// several worker threads at once and never touch storage.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Body of a 2xx response. Throws FetchError.
    virtual std::string fetch(const std::string& url, std::chrono::seconds timeout) = 0;
};

// libcurl-backed fetcher with a fixed-delay retry on transient failures.
class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(FetchOptions options = FetchOptions());

    std::string fetch(const std::string& url, std::chrono::seconds timeout) override;

    const FetchOptions& options() const { return options_; }

protected:
    // One HTTP request, no retry.
    virtual std::string fetchOnce(const std::string& url, std::chrono::seconds timeout);

private:
    FetchOptions options_;
};

}
