#include "net/MockHttpClient.hpp"
#include "nlohmann/json.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace net {

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) throw HttpError("mock fixture not found: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

MockHttpClient::MockHttpClient(const std::string& fixture_dir) {
    const fs::path root(fixture_dir);
    const fs::path routes_path = root / "routes.json";

    json j;
    try {
        j = json::parse(read_all(routes_path));
    } catch (const json::exception& e) {
        throw HttpError("bad " + routes_path.string() + ": " + e.what());
    }
    if (!j.is_object()) throw HttpError(routes_path.string() + " must be an object");

    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& r = it.value();
        if (!r.is_object()) continue;

        HttpResponse resp;
        resp.status = r.value("status", 200);
        if (r.contains("file") && r["file"].is_string()) {
            resp.body = read_all(root / r["file"].get<std::string>());
        } else if (r.contains("body") && r["body"].is_string()) {
            resp.body = r["body"].get<std::string>();
        }
        routes_[it.key()] = std::move(resp);
    }
}

void MockHttpClient::set_response(const std::string& key, int status, const std::string& body) {
    routes_[key] = HttpResponse{status, body};
}

HttpResponse MockHttpClient::get(const std::string& url) {
    gets_.push_back(url);
    auto it = routes_.find(url);
    if (it == routes_.end()) return HttpResponse{404, ""};
    return it->second;
}

HttpResponse MockHttpClient::post_json(const std::string& url,
                                       const std::string& body,
                                       const BasicAuth& auth) {
    posts_.push_back(RecordedPost{url, body, auth});
    auto it = routes_.find("POST " + url);
    if (it == routes_.end()) return HttpResponse{404, ""};
    return it->second;
}

} // namespace net
