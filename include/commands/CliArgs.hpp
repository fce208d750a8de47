#pragma once

#include <initializer_list>
#include <memory>
#include <string>

#include "net/HttpClient.hpp"

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key);

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// first argument after the verb that is neither a flag nor a flag's value;
// flags listed in `value_flags` take a value
std::string positional(int argc, char** argv, std::initializer_list<const char*> value_flags);

// --http_mock <dir> selects canned responses, otherwise curl with
// --http_workdir (default: a private per-run temp dir)
std::unique_ptr<net::HttpClient> make_http_client(int argc, char** argv);

}  // namespace cli
