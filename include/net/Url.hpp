#pragma once
#include <string>

namespace net {

struct UrlParts {
    std::string scheme;
    std::string netloc;   // host[:port], userinfo kept as-is
    std::string path;
    std::string query;
    std::string fragment;
};

UrlParts split_url(const std::string& url);
std::string unsplit_url(const UrlParts& parts);

// lowercased host, port stripped
std::string url_host(const std::string& url);

// scheme://host/path with the host lowercased, one trailing slash dropped,
// query and fragment removed
std::string clean_url(const std::string& url);

// resolves `ref` against `base` (absolute, host-relative or path-relative)
std::string resolve_url(const std::string& base, const std::string& ref);

// absolute http(s) URL with a host and no whitespace/control characters
bool is_valid_url(const std::string& url);

}  // namespace net
