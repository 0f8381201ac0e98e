#pragma once
// Grammar.hpp – Line-level matchers for the EPICS database text format and
// the sampling-policy mini-language carried by `info(archive, "…")`.
//
//   record(<type>, "<name>") {          ← matchRecordHeader
//       field(<name>, "<value>")         ← matchAttribute
//       info(archive, "scan, 00:01:00, HIHI LOLO")
//                      └─ parseArchivePolicy
//   }
//
// All matchers are pure functions; none of them throws on bad input.

#include "Types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace archcfg {

// Longest line (or archive value) the matchers accept. Longer input never
// matches; the database parser reports such lines and skips them.
inline constexpr std::size_t kMaxLineLength = 16384;

// ─── Record header ────────────────────────────────────────────────────────────

struct RecordHeader {
    std::string type;
    std::string name;      // Surrounding quotes and whitespace removed
    std::size_t end{0};    // Offset just past the closing ')'
};

// Match `record ( <type> , <name> )` at the start of the line (leading
// whitespace allowed). Text after the ')' is not inspected.
[[nodiscard]] std::optional<RecordHeader> matchRecordHeader(std::string_view line);

// True for lines that begin like a record header (`record(`) whether or not
// the rest is well formed. Used to warn about near misses.
[[nodiscard]] bool looksLikeRecordHeader(std::string_view line);

// ─── Attributes ───────────────────────────────────────────────────────────────

struct AttributeMatch {
    AttributeKind kind{AttributeKind::Field};
    std::string   name;
    std::string   value;   // Raw text between the quotes
    std::size_t   end{0};  // Offset just past the closing ')'
};

// Match `<kind>(<name>, "<value>")` where kind is exactly `field` or `info`,
// starting at `from` (leading whitespace allowed).
[[nodiscard]] std::optional<AttributeMatch> matchAttribute(std::string_view text,
                                                           std::size_t from = 0);

// True if the text at `from` starts with `field(` or `info(`.
[[nodiscard]] bool looksLikeAttribute(std::string_view text, std::size_t from = 0);

// ─── Structural delimiters ────────────────────────────────────────────────────

// Position of `ch` in `text` at or after `from`, ignoring anything inside
// double-quoted strings and everything after an unquoted '#'.
// Returns std::string_view::npos when absent.
[[nodiscard]] std::size_t findDelimiter(std::string_view text, char ch, std::size_t from = 0);

// ─── Sampling policy ──────────────────────────────────────────────────────────

// Outcome of parsing one archive value. Exactly one of `policy` / `error`
// carries information: a value that fails the grammar never yields a policy.
struct PolicyParseResult {
    std::optional<ArchivePolicy> policy;
    std::string                  error;

    [[nodiscard]] bool ok() const noexcept { return policy.has_value(); }
};

// Parse `<mode>, <period>[, <prop> <prop> …]`.
//   mode    – "monitor" or "scan", any letter case
//   period  – HH:MM:SS, every two-digit group in [0-5][0-9]
//   props   – whitespace separated names after a comma; a missing or blank
//             segment yields the "no properties" state (properties == nullopt)
[[nodiscard]] PolicyParseResult parseArchivePolicy(std::string_view value);

} // namespace archcfg
