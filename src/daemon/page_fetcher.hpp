#pragma once

#include <chrono>
#include <string>

namespace pagewatch {

// Outcome of one GET. On failure body is empty and error holds a readable
// cause; fetchers report failures here instead of throwing.
struct FetchResult {
    bool ok = false;
    std::string body;
    std::string contentType;
    int httpStatus = 0;
    std::string error;

    static FetchResult success(std::string body, std::string contentType, int httpStatus);
    static FetchResult failure(std::string error, int httpStatus = 0);
};

// Fetchers are called from pool workers concurrently and must be thread-safe.
class PageFetcher
{
public:
    virtual ~PageFetcher() = default;
    virtual FetchResult fetch(const std::string &url) const = 0;
};

/**
 * HttpPageFetcher performs a single GET through Qt Network with a fixed
 * User-Agent and an overall deadline. Redirects are followed unless they
 * downgrade from https; a terminal status of 400 or above is a failure. The
 * body is decoded to UTF-8 using the declared charset, then the HTML meta
 * charset, then UTF-8 as a last resort.
 *
 * A fresh QNetworkAccessManager and local event loop are used per call, so
 * the fetcher can run on any thread that has no event loop of its own.
 */
class HttpPageFetcher : public PageFetcher
{
public:
    HttpPageFetcher(std::string userAgent, std::chrono::milliseconds timeout);

    FetchResult fetch(const std::string &url) const override;

private:
    std::string m_userAgent;
    std::chrono::milliseconds m_timeout;
};

} // namespace pagewatch
