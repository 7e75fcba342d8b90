#pragma once

#include <string>

namespace osintpipe::media {

class MediaFetcher {
public:
    virtual ~MediaFetcher() = default;
    // Returns the raw bytes behind `uri`; throws MediaFetchError.
    virtual std::string Fetch(const std::string& uri) = 0;
};

struct FetchOptions {
    int timeout_s = 30;
    long long max_bytes = 50LL * 1024 * 1024;
};

// Handles file:// (listener spool) and http(s):// references.
class UriMediaFetcher : public MediaFetcher {
public:
    explicit UriMediaFetcher(FetchOptions options = {});

    std::string Fetch(const std::string& uri) override;

private:
    std::string FetchFile(const std::string& path);
    std::string FetchHttp(const std::string& uri);

    FetchOptions options_;
};

}  // namespace osintpipe::media
