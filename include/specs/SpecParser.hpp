#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "specs/Html.hpp"

namespace specs {

// The page is not something we can build a record from.
class SpecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The URL does not point at a specification, or fetching it failed.
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SpecData {
    std::string title;
    std::string description;
    std::string org;
    std::string url;
};

// Either the spec's metadata, or a more canonical URL to fetch instead.
struct ParseResult {
    std::optional<SpecData> data;
    std::string better_url;

    static ParseResult found(SpecData d) { return ParseResult{std::move(d), ""}; }
    static ParseResult redirect(std::string url) { return ParseResult{std::nullopt, std::move(url)}; }
};

class SpecParser {
public:
    virtual ~SpecParser() = default;

    virtual std::string org() const = 0;
    virtual ParseResult parse(const html::Document& doc, const std::string& url) const = 0;
};

class W3CParser : public SpecParser {
public:
    std::string org() const override { return "W3C"; }
    ParseResult parse(const html::Document& doc, const std::string& url) const override;

    // link from the first <dl> whose <dt> starts with `label` (case-insensitive);
    // "" if not found
    static std::string metadata_link(const html::Document& doc, const std::string& label);
};

class WHATWGParser final : public W3CParser {
public:
    std::string org() const override { return "WHATWG"; }
};

class IETFParser final : public SpecParser {
public:
    std::string org() const override { return "IETF"; }
    ParseResult parse(const html::Document& doc, const std::string& url) const override;

    // "draft-foo-bar-03" -> {"draft-foo-bar", "03"}; otherwise {in, ""}
    static std::pair<std::string, std::string> parse_draft_name(const std::string& in);

    // https://tools.ietf.org/html/<doc_name>
    static std::string html_url(const std::string& doc_name);

    // content of the first <meta name=...> present, tried in order; "" if none
    static std::string meta_content(const html::Document& doc, const std::vector<std::string>& names);
};

// Picks a parser by host; nullptr when the organisation is unknown.
std::unique_ptr<SpecParser> parser_for_url(const std::string& url);

}  // namespace specs
