#pragma once

#include <string>

namespace osintpipe::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;

    std::string SchemeHostPort() const;
};

ParsedUrl ParseUrl(const std::string& url);

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port);

}  // namespace osintpipe::utils
