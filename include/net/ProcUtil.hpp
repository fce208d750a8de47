#pragma once
#include <string>

namespace procutil {

struct ProcResult {
    int exit_code = -1;   // -1 if the process could not be started
    std::string output;   // captured stdout
};

// Runs a command line through /bin/sh and captures its stdout.
ProcResult run_capture(const std::string& cmdline);

// Single-quotes `s` for the POSIX shell.
std::string shell_quote(const std::string& s);

// Creates a fresh 0700 directory <parent>/<prefix>XXXXXX. Throws std::runtime_error.
std::string make_private_dir(const std::string& parent, const std::string& prefix);

// Creates `path` with mode 0600 and writes `content`. Fails if anything,
// including a symlink, already exists there. Throws std::runtime_error.
void write_private_file(const std::string& path, const std::string& content);

} // namespace procutil
