#include "media/media_fetcher.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include "core/errors.hpp"
#include "httplib.h"
#include "utils/url.hpp"

namespace osintpipe::media {

UriMediaFetcher::UriMediaFetcher(FetchOptions options)
    : options_(options) {}

std::string UriMediaFetcher::Fetch(const std::string& uri) {
    if (uri.rfind("file://", 0) == 0) {
        return FetchFile(uri.substr(7));
    }
    if (uri.rfind("http://", 0) == 0 || uri.rfind("https://", 0) == 0) {
        return FetchHttp(uri);
    }
    throw MediaFetchError("unsupported media uri: " + uri);
}

std::string UriMediaFetcher::FetchFile(const std::string& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw MediaFetchError("cannot stat media file " + path + ": " + ec.message());
    }
    if (static_cast<long long>(size) > options_.max_bytes) {
        throw MediaFetchError("media file " + path + " exceeds " + std::to_string(options_.max_bytes) + " bytes");
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw MediaFetchError("cannot open media file " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string UriMediaFetcher::FetchHttp(const std::string& uri) {
    utils::ParsedUrl parsed;
    try {
        parsed = utils::ParseUrl(uri);
    } catch (const std::invalid_argument& ex) {
        throw MediaFetchError("bad media url " + uri + ": " + ex.what());
    }
    const auto path = parsed.base_path.empty() ? std::string("/") : parsed.base_path;

    auto client = std::make_unique<httplib::Client>(parsed.SchemeHostPort());
    client->set_connection_timeout(options_.timeout_s);
    client->set_read_timeout(options_.timeout_s);
    client->set_follow_location(true);

    std::string body;
    bool too_large = false;
    auto response = client->Get(path, [&](const char* data, std::size_t length) {
        if (static_cast<long long>(body.size() + length) > options_.max_bytes) {
            too_large = true;
            return false;
        }
        body.append(data, length);
        return true;
    });
    if (too_large) {
        throw MediaFetchError("media at " + uri + " exceeds " + std::to_string(options_.max_bytes) + " bytes");
    }
    if (!response) {
        throw MediaFetchError("GET " + uri + " failed: " + httplib::to_string(response.error()));
    }
    if (response->status >= 400) {
        throw MediaFetchError("GET " + uri + " returned HTTP " + std::to_string(response->status));
    }
    return body;
}

}  // namespace osintpipe::media
