#include "commands/CliArgs.hpp"

#include "net/CurlHttpClient.hpp"
#include "net/MockHttpClient.hpp"

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

std::string positional(int argc, char** argv, std::initializer_list<const char*> value_flags) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.compare(0, 2, "--") == 0) {
            for (const char* f : value_flags) {
                if (a == f) { ++i; break; }
            }
            continue;
        }
        return a;
    }
    return "";
}

std::unique_ptr<net::HttpClient> make_http_client(int argc, char** argv) {
    const std::string mock_dir = get_arg(argc, argv, "--http_mock", "");
    if (!mock_dir.empty()) return std::make_unique<net::MockHttpClient>(mock_dir);

    // empty: the client makes its own private scratch directory
    const std::string work_dir = get_arg(argc, argv, "--http_workdir", "");
    return std::make_unique<net::CurlHttpClient>(work_dir);
}

}  // namespace cli
