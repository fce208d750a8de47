#include "github/IssueClient.hpp"

#include "nlohmann/json.hpp"

#include <cstdlib>
#include <ostream>
#include <sstream>

using json = nlohmann::json;

namespace github {

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

static std::string or_empty(const std::optional<std::string>& v) {
    return v ? *v : std::string();
}

GithubConfig GithubConfig::from_env() {
    GithubConfig cfg;
    cfg.user = env_or_empty("GH_USER");
    cfg.token = env_or_empty("GH_TOKEN");
    return cfg;
}

std::string GithubConfig::issues_url() const {
    return api_base + "/repos/" + owner + "/" + repo + "/issues";
}

std::string issue_title(const positions::PositionRecord& r) {
    return r.title;
}

std::string issue_body(const positions::PositionRecord& r) {
    std::ostringstream b;
    b << "* Specification Title: " << r.title << "\n"
      << "* Specification URL: " << r.url << "\n"
      << "* Caniuse.com URL (optional): " << or_empty(r.ciu_name) << "\n"
      << "* Bugzilla URL (optional): " << or_empty(r.moz_bug_url) << "\n";
    return b.str();
}

std::optional<std::int64_t> create_issue(net::HttpClient& http,
                                         const GithubConfig& cfg,
                                         const positions::PositionRecord& r,
                                         std::ostream& log) {
    if (!cfg.has_credentials()) {
        log << "* Cannot find GH_USER or GH_TOKEN; not creating an issue.\n";
        return std::nullopt;
    }

    const json payload = {
        {"title", issue_title(r)},
        {"body", issue_body(r)}
    };

    net::HttpResponse res;
    try {
        res = http.post_json(cfg.issues_url(), payload.dump(), net::BasicAuth{cfg.user, cfg.token});
    } catch (const net::HttpError& e) {
        throw GithubError(std::string("Failed to create issue: ") + e.what());
    }

    if (res.status != 201) {
        throw GithubError("Failed to create issue; status " + std::to_string(res.status));
    }

    json j;
    try {
        j = json::parse(res.body);
    } catch (const json::exception& e) {
        throw GithubError(std::string("Unreadable issue response: ") + e.what());
    }
    if (!j.is_object() || !j.contains("number") || !j["number"].is_number_integer()) {
        throw GithubError("Issue response has no number");
    }

    const std::int64_t number = j["number"].get<std::int64_t>();
    log << "* Created Github Issue " << number << "\n";
    return number;
}

}  // namespace github
