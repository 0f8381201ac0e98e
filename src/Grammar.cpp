// Grammar.cpp – Regex-driven matchers for database lines and archive values.
//
// Patterns are compiled once (function-local statics) and applied with
// match_continuous, so every match is anchored at the requested offset.

#include "EpicsArchiveConfig/Grammar.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace archcfg {

using std::regex_constants::match_continuous;

// ─── Small string helpers ─────────────────────────────────────────────────────

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

static std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static std::string_view group(const std::cmatch& m, std::size_t i) {
    if (!m[i].matched) return {};
    return {m[i].first, static_cast<std::size_t>(m[i].length())};
}

// Inputs longer than kMaxLineLength never reach the regex engine: libstdc++
// recurses once per matched character.
static bool searchAt(std::string_view text, std::size_t from, std::cmatch& m, const std::regex& re) {
    if (from > text.size() || text.size() - from > kMaxLineLength) return false;
    return std::regex_search(text.data() + from, text.data() + text.size(), m, re,
                             match_continuous);
}

// ─── Patterns ─────────────────────────────────────────────────────────────────

// record ( type , "name" )  |  record ( type , name )
//   1 = type, 2 = quoted name, 3 = bare name (may carry trailing blanks)
// A bare name ends at the first ')' outside a $(macro) and never spans '#'.
static const std::regex& recordHeaderRe() {
    static const std::regex re(
        R"re(\s*record\s*\(\s*([^,()"]+?)\s*,\s*)re"
        R"re((?:"([^"]+)"|((?:\$\([^)]*\)|[^",\s{()#])(?:\$\([^)]*\)|[^,"{()#])*))\s*\))re");
    return re;
}

static const std::regex& recordPrefixRe() {
    static const std::regex re(R"re(\s*record\s*\()re");
    return re;
}

// field|info ( name , "value" )
//   1 = kind, 2 = name, 3 = value (backslash pairs kept verbatim)
static const std::regex& attributeRe() {
    static const std::regex re(
        R"re(\s*(field|info)\s*\(\s*([^,()"]+?)\s*,\s*"([^"\\]*(?:\\.[^"\\]*)*)"\s*\))re");
    return re;
}

static const std::regex& attributePrefixRe() {
    static const std::regex re(R"re(\s*(field|info)\s*\()re");
    return re;
}

// mode , HH:MM:SS [ , props… ]
//   1 = mode, 2 = period, 3 = property segment
static const std::regex& policyRe() {
    static const std::regex re(
        R"re(\s*(monitor|scan)\s*,\s*([0-5][0-9]:[0-5][0-9]:[0-5][0-9])\s*(?:,(.*))?)re",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

static const std::regex& policyModeRe() {
    static const std::regex re(R"re(\s*(monitor|scan)\b)re",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

static const std::regex& policyPeriodRe() {
    static const std::regex re(
        R"re(\s*(monitor|scan)\s*,\s*[0-5][0-9]:[0-5][0-9]:[0-5][0-9])re",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

// Explain why a value failed the full policy pattern.
static std::string describePolicyFailure(std::string_view value) {
    std::cmatch m;
    if (trim(value).empty())
        return "empty archive value";
    if (!searchAt(value, 0, m, policyModeRe()))
        return "expected sampling mode 'monitor' or 'scan' in \"" + std::string(value) + "\"";
    if (!searchAt(value, 0, m, policyPeriodRe()))
        return "expected period HH:MM:SS after the sampling mode in \"" +
               std::string(value) + "\"";
    return "unexpected text after the period in \"" + std::string(value) +
           "\" (properties must follow a comma)";
}

// ─── Record header ────────────────────────────────────────────────────────────

std::optional<RecordHeader> matchRecordHeader(std::string_view line) {
    std::cmatch m;
    if (!searchAt(line, 0, m, recordHeaderRe()))
        return std::nullopt;

    RecordHeader h;
    h.type = std::string(trim(group(m, 1)));
    h.name = std::string(trim(m[2].matched ? group(m, 2) : group(m, 3)));
    h.end  = static_cast<std::size_t>(m.length(0));
    if (h.type.empty() || h.name.empty())
        return std::nullopt;
    return h;
}

bool looksLikeRecordHeader(std::string_view line) {
    std::cmatch m;
    return searchAt(line, 0, m, recordPrefixRe());
}

// ─── Attributes ───────────────────────────────────────────────────────────────

std::optional<AttributeMatch> matchAttribute(std::string_view text, std::size_t from) {
    std::cmatch m;
    if (!searchAt(text, from, m, attributeRe()))
        return std::nullopt;

    AttributeMatch a;
    a.kind  = group(m, 1) == "field" ? AttributeKind::Field : AttributeKind::Info;
    a.name  = std::string(trim(group(m, 2)));
    a.value = std::string(group(m, 3));
    a.end   = from + static_cast<std::size_t>(m.length(0));
    if (a.name.empty())
        return std::nullopt;
    return a;
}

bool looksLikeAttribute(std::string_view text, std::size_t from) {
    std::cmatch m;
    return searchAt(text, from, m, attributePrefixRe());
}

// ─── Structural delimiters ────────────────────────────────────────────────────

std::size_t findDelimiter(std::string_view text, char ch, std::size_t from) {
    bool in_quotes = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '\\')     ++i;            // skip escaped character
            else if (c == '"') in_quotes = false;
            continue;
        }
        if (c == '"') { in_quotes = true; continue; }
        if (c == '#') break;                   // comment runs to end of line
        if (c == ch && i >= from) return i;
    }
    return std::string_view::npos;
}

// ─── Sampling policy ──────────────────────────────────────────────────────────

PolicyParseResult parseArchivePolicy(std::string_view value) {
    PolicyParseResult result;

    if (value.size() > kMaxLineLength) {
        result.error = "archive value longer than " + std::to_string(kMaxLineLength) +
                       " characters";
        return result;
    }

    std::cmatch m;
    if (!std::regex_match(value.data(), value.data() + value.size(), m, policyRe())) {
        result.error = describePolicyFailure(value);
        return result;
    }

    ArchivePolicy p;
    p.raw_value = std::string(value);
    p.mode      = lower(group(m, 1)) == "scan" ? SampleMode::Scan : SampleMode::Monitor;
    p.period    = std::string(group(m, 2));

    std::vector<std::string> props;
    std::istringstream       ss{std::string(group(m, 3))};
    for (std::string tok; ss >> tok;)
        props.push_back(std::move(tok));
    if (!props.empty())
        p.properties = std::move(props);

    result.policy = std::move(p);
    return result;
}

} // namespace archcfg
