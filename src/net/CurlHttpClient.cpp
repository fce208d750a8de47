#include "net/CurlHttpClient.hpp"
#include "net/ProcUtil.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace net {

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void ensure_dir(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    if (ec) throw HttpError("cannot create work dir " + p.string() + ": " + ec.message());
}

// curl config files use C-like double quoted strings
static std::string config_quote(const std::string& s) {
    std::string o = "\"";
    for (char c : s) {
        if (c == '\\' || c == '"') o += '\\';
        o += c;
    }
    o += "\"";
    return o;
}

CurlHttpClient::CurlHttpClient(const std::string& work_dir, const std::string& curl_bin, int timeout_s)
    : work_dir_(work_dir), curl_bin_(curl_bin), timeout_s_(timeout_s) {
    if (work_dir_.empty()) {
        try {
            work_dir_ = procutil::make_private_dir(fs::temp_directory_path().string(), "positions-http-");
        } catch (const std::exception& e) {
            throw HttpError(e.what());
        }
        owns_work_dir_ = true;
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (owns_work_dir_) {
        std::error_code ec;
        fs::remove_all(work_dir_, ec);
    }
}

fs::path CurlHttpClient::scratch(const std::string& suffix) {
    return work_dir_ / (std::to_string(::getpid()) + "-" + std::to_string(++seq_) + suffix);
}

HttpResponse CurlHttpClient::run_curl(const std::string& args, const std::string& url) {
    const fs::path resp = scratch(".response");

    std::error_code ec;
    fs::remove(resp, ec);

    std::ostringstream cmd;
    cmd << procutil::shell_quote(curl_bin_) << " -s -L"
        << " --max-time " << timeout_s_
        << " -o " << procutil::shell_quote(resp.string())
        << " -w '%{http_code}' "
        << args << " "
        << procutil::shell_quote(url);

    const procutil::ProcResult pr = procutil::run_capture(cmd.str());
    if (pr.exit_code != 0) {
        fs::remove(resp, ec);
        throw HttpError("curl failed (exit " + std::to_string(pr.exit_code) + ") for " + url);
    }

    HttpResponse out;
    std::string code;
    for (char c : pr.output) if (std::isdigit((unsigned char)c)) code += c;
    if (!code.empty()) out.status = std::stoi(code);

    std::ifstream rf(resp, std::ios::in | std::ios::binary);
    if (rf) out.body = read_all(rf);
    rf.close();
    fs::remove(resp, ec);

    return out;
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    ensure_dir(work_dir_);
    return run_curl("", url);
}

HttpResponse CurlHttpClient::post_json(const std::string& url,
                                       const std::string& body,
                                       const BasicAuth& auth) {
    ensure_dir(work_dir_);

    const fs::path payload = scratch(".payload.json");
    const fs::path config  = scratch(".auth.conf");

    std::error_code ec;
    auto cleanup = [&]() {
        fs::remove(payload, ec);
        fs::remove(config, ec);
    };

    std::ostringstream args;
    args << "-X POST"
         << " -H 'Content-Type: application/json'"
         << " --data-binary " << procutil::shell_quote("@" + payload.string());

    try {
        procutil::write_private_file(payload.string(), body);
        if (!auth.empty()) {
            // created 0600 before the secret is written; refuses an existing file or symlink
            procutil::write_private_file(config.string(), "user = " + config_quote(auth.user + ":" + auth.password) + "\n");
            args << " --config " << procutil::shell_quote(config.string());
        }
    } catch (const std::runtime_error& e) {
        cleanup();
        throw HttpError(e.what());
    }

    try {
        HttpResponse r = run_curl(args.str(), url);
        cleanup();
        return r;
    } catch (const HttpError&) {
        cleanup();
        throw;
    }
}

} // namespace net
