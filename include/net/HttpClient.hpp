#pragma once
#include <stdexcept>
#include <string>

namespace net {

struct HttpResponse {
    int status = 0;     // 0 when no response was received
    std::string body;
};

struct BasicAuth {
    std::string user;
    std::string password;

    bool empty() const { return user.empty() && password.empty(); }
};

class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url) = 0;

    // POST with Content-Type: application/json
    virtual HttpResponse post_json(const std::string& url,
                                   const std::string& body,
                                   const BasicAuth& auth) = 0;
};

} // namespace net
