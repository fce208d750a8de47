#pragma once

#include "net/HttpClient.hpp"

#include <map>
#include <string>
#include <vector>

namespace net {

struct RecordedPost {
    std::string url;
    std::string body;
    BasicAuth auth;
};

// Canned responses keyed by URL ("POST <url>" for posts).
//
// A fixture directory holds routes.json:
//   { "https://example.org/spec": {"status": 200, "file": "spec.html"},
//     "POST https://api.github.com/...": {"status": 201, "body": "{\"number\": 7}"} }
// Unknown URLs answer 404.
class MockHttpClient final : public HttpClient {
    std::map<std::string, HttpResponse> routes_;
    std::vector<std::string> gets_;
    std::vector<RecordedPost> posts_;

public:
    MockHttpClient() = default;
    explicit MockHttpClient(const std::string& fixture_dir);

    void set_response(const std::string& key, int status, const std::string& body);

    HttpResponse get(const std::string& url) override;
    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const BasicAuth& auth) override;

    const std::vector<std::string>& gets() const { return gets_; }
    const std::vector<RecordedPost>& posts() const { return posts_; }
};

} // namespace net
