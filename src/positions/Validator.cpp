#include "positions/Validator.hpp"

#include "net/Url.hpp"
#include "positions/Models.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace positions {

static void add_error(std::vector<ValidationError>& out, const std::string& code, const std::string& msg, const std::string& entry) {
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.entry = entry;
    out.push_back(std::move(e));
}

static std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

// strict UTF-8: no overlongs, no surrogates, nothing above U+10FFFF
static bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = (unsigned char)s[i];
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const unsigned char cc = (unsigned char)s[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

static void check_field(std::vector<ValidationError>& errors, const FieldSpec& f, const json& value, const std::string& label) {
    const std::string name = f.name;

    switch (f.kind) {
        case FieldKind::String:
            if (!value.is_string()) {
                add_error(errors, "bad_type", label + "'s " + name + " isn't a string", label);
            } else if (!is_valid_utf8(value.get<std::string>())) {
                add_error(errors, "bad_value", label + "'s " + name + " isn't valid UTF-8", label);
            }
            break;

        case FieldKind::Url:
            if (!value.is_string()) {
                add_error(errors, "bad_type", label + "'s " + name + " isn't a URL string.", label);
            } else if (!is_valid_utf8(value.get<std::string>())) {
                add_error(errors, "bad_value", label + "'s " + name + " isn't valid UTF-8", label);
            } else if (!net::is_valid_url(value.get<std::string>())) {
                add_error(errors, "bad_url", label + "'s " + name + " isn't a valid URL: " + value.get<std::string>(), label);
            }
            break;

        case FieldKind::Integer:
            if (!value.is_number_integer()) {
                add_error(errors, "bad_type", label + "'s " + name + " isn't an integer", label);
            } else if (value.is_number_unsigned()) {
                if (value.get<std::uint64_t>() > (std::uint64_t)std::numeric_limits<std::int64_t>::max()) {
                    add_error(errors, "bad_value", label + "'s " + name + " is too large", label);
                }
            } else if (value.get<std::int64_t>() < 0) {
                add_error(errors, "negative_issue", label + "'s " + name + " is negative", label);
            }
            break;

        case FieldKind::Enum: {
            const bool ok = value.is_string() &&
                std::find(f.choices.begin(), f.choices.end(), value.get<std::string>()) != f.choices.end();
            if (!ok) {
                add_error(errors, "bad_value", label + "'s " + name + " isn't one of [" + join(f.choices, ", ") + "]", label);
            }
            break;
        }
    }
}

std::vector<ValidationError> validate_entry(const json& entry, const std::string& label_in) {
    const std::string label = label_in.empty() ? std::string("Entry") : label_in;
    std::vector<ValidationError> errors;

    if (!entry.is_object()) {
        add_error(errors, "not_an_object", label + " is not a dictionary.", label);
        return errors;
    }

    for (const auto& f : field_specs()) {
        auto it = entry.find(f.name);
        const bool is_null = (it == entry.end()) || it->is_null();

        if (is_null) {
            if (f.required) {
                add_error(errors, "missing_member", label + " doesn't have required member " + f.name, label);
            }
            continue;
        }
        check_field(errors, f, *it, label);
    }

    std::vector<std::string> extra;
    for (auto it = entry.begin(); it != entry.end(); ++it) {
        if (!is_known_field(it.key())) extra.push_back(it.key());
    }
    if (!extra.empty()) {
        std::sort(extra.begin(), extra.end());
        add_error(errors, "unknown_member", label + " includes unrecognised members: " + join(extra, " "), label);
    }

    return errors;
}

ValidationReport validate_document(const json& doc) {
    ValidationReport rep;

    if (!doc.is_array()) {
        rep.pass = false;
        add_error(rep.errors, "not_a_list", "Top-level data structure is not a list.", "");
        return rep;
    }

    int i = 0;
    for (const auto& entry : doc) {
        ++i;
        const std::string fallback = "entry " + std::to_string(i);

        if (!entry.is_object()) {
            add_error(rep.errors, "not_an_object", "Entry " + std::to_string(i) + " is not a dictionary.", fallback);
            continue;
        }

        std::string label = fallback;
        auto t = entry.find("title");
        if (t != entry.end() && t->is_string() && !t->get<std::string>().empty()) label = t->get<std::string>();

        auto errs = validate_entry(entry, label);
        rep.errors.insert(rep.errors.end(), errs.begin(), errs.end());
    }

    rep.pass = rep.errors.empty();
    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    json j;
    j["pass"] = rep.pass;
    j["errors"] = json::array();

    for (const auto& e : rep.errors) {
        json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.entry.empty()) ej["entry"] = e.entry;
        j["errors"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open report file: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace positions
