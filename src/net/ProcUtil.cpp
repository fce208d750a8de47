#include "net/ProcUtil.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace procutil {

namespace {

struct PipeCloser {
    int* status;
    void operator()(FILE* f) const {
        if (f) *status = pclose(f);
    }
};

} // namespace

ProcResult run_capture(const std::string& cmdline) {
    ProcResult res;

    int raw_status = -1;
    {
        std::unique_ptr<FILE, PipeCloser> pipe(popen(cmdline.c_str(), "r"), PipeCloser{&raw_status});
        if (!pipe) return res;

        char buf[4096];
        size_t n = 0;
        while ((n = fread(buf, 1, sizeof(buf), pipe.get())) > 0) {
            res.output.append(buf, buf + n);
        }
    } // pclose runs here

    if (raw_status == -1) return res;
    if (WIFEXITED(raw_status)) res.exit_code = WEXITSTATUS(raw_status);
    return res;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string make_private_dir(const std::string& parent, const std::string& prefix) {
    std::string tmpl = parent + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw std::runtime_error("mkdtemp failed for " + tmpl + ": " + std::strerror(errno));
    }
    return std::string(buf.data());
}

void write_private_file(const std::string& path, const std::string& content) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw std::runtime_error("cannot create " + path + ": " + std::strerror(errno));
    }

    size_t off = 0;
    while (off < content.size()) {
        const ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            ::unlink(path.c_str());
            throw std::runtime_error("cannot write " + path + ": " + std::strerror(err));
        }
        off += (size_t)n;
    }
    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(path.c_str());
        throw std::runtime_error("cannot write " + path + ": " + std::strerror(err));
    }
}

} // namespace procutil
