#include "positions/Models.hpp"

namespace positions {

const std::vector<std::string>& known_positions() {
    static const std::vector<std::string> v = {
        "under consideration",
        "participating",
        "supportive",
        "non-harmful",
        "neutral",
        "harmful",
        "defer"
    };
    return v;
}

const std::vector<std::string>& known_orgs() {
    static const std::vector<std::string> v = {"W3C", "WHATWG", "IETF", "Ecma", "Other"};
    return v;
}

const std::vector<FieldSpec>& field_specs() {
    static const std::vector<FieldSpec> v = {
        {"title",             true,  FieldKind::String,  {}},
        {"description",       true,  FieldKind::String,  {}},
        {"ciuName",           false, FieldKind::String,  {}},
        {"org",               true,  FieldKind::Enum,    known_orgs()},
        {"group",             false, FieldKind::String,  {}},
        {"url",               true,  FieldKind::Url,     {}},
        {"mozBugUrl",         false, FieldKind::Url,     {}},
        {"mozPositionIssue",  false, FieldKind::Integer, {}},
        {"mozPosition",       true,  FieldKind::Enum,    known_positions()},
        {"mozPositionDetail", false, FieldKind::String,  {}},
    };
    return v;
}

bool is_known_field(const std::string& name) {
    for (const auto& f : field_specs()) {
        if (name == f.name) return true;
    }
    return false;
}

}  // namespace positions
