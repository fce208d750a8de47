#include "net/Url.hpp"

#include <cctype>

namespace net {

static std::string to_lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

static bool is_scheme_char(char c) {
    return std::isalnum((unsigned char)c) || c == '+' || c == '-' || c == '.';
}

UrlParts split_url(const std::string& url) {
    UrlParts p;
    std::string rest = url;

    // scheme
    size_t colon = rest.find(':');
    if (colon != std::string::npos && colon > 0 && std::isalpha((unsigned char)rest[0])) {
        bool ok = true;
        for (size_t i = 0; i < colon; ++i) {
            if (!is_scheme_char(rest[i])) { ok = false; break; }
        }
        if (ok) {
            p.scheme = to_lower_ascii(rest.substr(0, colon));
            rest = rest.substr(colon + 1);
        }
    }

    // netloc
    if (rest.compare(0, 2, "//") == 0) {
        size_t end = rest.find_first_of("/?#", 2);
        if (end == std::string::npos) end = rest.size();
        p.netloc = rest.substr(2, end - 2);
        rest = rest.substr(end);
    }

    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        p.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }

    size_t q = rest.find('?');
    if (q != std::string::npos) {
        p.query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }

    p.path = rest;
    return p;
}

std::string unsplit_url(const UrlParts& parts) {
    std::string out;
    if (!parts.scheme.empty()) out += parts.scheme + ":";
    if (!parts.netloc.empty() || parts.scheme == "http" || parts.scheme == "https") {
        out += "//" + parts.netloc;
        if (!parts.path.empty() && parts.path[0] != '/') out += "/";
    }
    out += parts.path;
    if (!parts.query.empty()) out += "?" + parts.query;
    if (!parts.fragment.empty()) out += "#" + parts.fragment;
    return out;
}

static std::string host_of_netloc(const std::string& netloc) {
    std::string h = netloc;
    size_t at = h.rfind('@');
    if (at != std::string::npos) h = h.substr(at + 1);

    if (!h.empty() && h[0] == '[') {
        size_t close = h.find(']');
        return to_lower_ascii(close == std::string::npos ? h : h.substr(0, close + 1));
    }

    size_t colon = h.find(':');
    if (colon != std::string::npos) h = h.substr(0, colon);
    return to_lower_ascii(h);
}

std::string url_host(const std::string& url) {
    return host_of_netloc(split_url(url).netloc);
}

std::string clean_url(const std::string& url) {
    UrlParts p = split_url(url);
    std::string path = p.path;
    if (!path.empty() && path.back() == '/') path.pop_back();
    return p.scheme + "://" + to_lower_ascii(p.netloc) + path;
}

std::string resolve_url(const std::string& base, const std::string& ref) {
    const UrlParts r = split_url(ref);
    if (!r.scheme.empty()) return ref;

    UrlParts b = split_url(base);
    if (ref.compare(0, 2, "//") == 0) return b.scheme + ":" + ref;

    UrlParts out;
    out.scheme = b.scheme;
    out.netloc = b.netloc;
    out.query = r.query;
    out.fragment = r.fragment;

    if (!r.path.empty() && r.path[0] == '/') {
        out.path = r.path;
    } else if (r.path.empty()) {
        out.path = b.path;
        if (r.query.empty()) out.query = b.query;
    } else {
        size_t slash = b.path.rfind('/');
        const std::string dir = (slash == std::string::npos) ? "/" : b.path.substr(0, slash + 1);
        out.path = dir + r.path;
    }
    return unsplit_url(out);
}

bool is_valid_url(const std::string& url) {
    if (url.empty()) return false;
    for (unsigned char c : url) {
        if (c <= 0x20 || c == 0x7f) return false;
    }

    UrlParts p = split_url(url);
    if (p.scheme != "http" && p.scheme != "https") return false;

    const std::string host = host_of_netloc(p.netloc);
    if (host.empty()) return false;

    // port, when present, must be numeric
    std::string hp = p.netloc.substr(p.netloc.rfind('@') == std::string::npos ? 0 : p.netloc.rfind('@') + 1);
    if (!hp.empty() && hp[0] != '[') {
        size_t colon = hp.find(':');
        if (colon != std::string::npos) {
            const std::string port = hp.substr(colon + 1);
            if (port.empty()) return false;
            for (char c : port) if (!std::isdigit((unsigned char)c)) return false;
        }
    }

    return true;
}

}  // namespace net
