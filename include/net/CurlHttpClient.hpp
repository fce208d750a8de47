#pragma once

#include "net/HttpClient.hpp"

#include <filesystem>
#include <string>

namespace net {

// Drives the curl executable. Request and response bodies travel through
// files in work_dir; credentials go through a 0600 curl config file so they
// never appear on a command line. An empty work_dir means a private mkdtemp
// directory that is removed with the client.
class CurlHttpClient final : public HttpClient {
    std::filesystem::path work_dir_;
    bool owns_work_dir_ = false;
    std::string curl_bin_;
    int timeout_s_;
    unsigned seq_ = 0;

public:
    explicit CurlHttpClient(const std::string& work_dir = "", const std::string& curl_bin = "curl", int timeout_s = 30);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    const std::filesystem::path& work_dir() const { return work_dir_; }

    HttpResponse get(const std::string& url) override;
    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const BasicAuth& auth) override;

private:
    // work_dir/<pid>-<seq><suffix>, unique per call
    std::filesystem::path scratch(const std::string& suffix);
    HttpResponse run_curl(const std::string& args, const std::string& url);
};

} // namespace net
