#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

#include "net/HttpClient.hpp"
#include "positions/Models.hpp"

namespace github {

class GithubError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GithubConfig {
    std::string owner = "mozilla";
    std::string repo = "standards-positions";
    std::string api_base = "https://api.github.com";
    std::string user;    // GH_USER
    std::string token;   // GH_TOKEN

    static GithubConfig from_env();

    bool has_credentials() const { return !user.empty() && !token.empty(); }
    std::string issues_url() const;
};

std::string issue_title(const positions::PositionRecord& r);
std::string issue_body(const positions::PositionRecord& r);

// Files an issue asking for a position on `r`. Returns the issue number, or
// nothing when credentials are missing. Throws GithubError unless GitHub
// answers 201 with a number.
std::optional<std::int64_t> create_issue(net::HttpClient& http,
                                         const GithubConfig& cfg,
                                         const positions::PositionRecord& r,
                                         std::ostream& log);

}  // namespace github
