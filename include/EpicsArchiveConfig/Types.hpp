#pragma once
// Types.hpp – In-memory model of a parsed EPICS database and the archive
// channels derived from it. Everything the converter produces flows through
// these structures.

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace archcfg {

// ─── Attribute kind as written in the database (`field(...)` / `info(...)`) ──
enum class AttributeKind { Field, Info };

// ─── Sampling trigger of an archived channel ──────────────────────────────────
enum class SampleMode {
    Monitor, // Event driven: store on every value change
    Scan,    // Periodic: store once per period
};

// Lower-case name used both in the database value and as the output tag.
const char* toString(SampleMode mode) noexcept;
const char* toString(AttributeKind kind) noexcept;

// ─── One `field(NAME, "value")` or non-archive `info(...)` line ──────────────
struct PlainAttribute {
    AttributeKind kind{AttributeKind::Field};
    std::string   name;   // DESC, INP, SCAN …
    std::string   value;  // Raw text between the quotes, no escape processing

    [[nodiscard]] std::string toString() const;
};

// ─── Parsed `info(archive, "<mode>, <period>[, <props…>]")` ───────────────────
// Only ever constructed by parseArchivePolicy() after a complete match, so
// mode and period are always set.
struct ArchivePolicy {
    std::string raw_value;        // Original quoted value, for diagnostics
    SampleMode  mode{SampleMode::Monitor};
    std::string period;           // "HH:MM:SS"

    // nullopt = no property segment at all → one bare channel.
    // Engaged but empty = property segment present with no names → no channel.
    std::optional<std::vector<std::string>> properties;

    [[nodiscard]] std::size_t propertyCount() const noexcept {
        return properties ? properties->size() : 0;
    }
    [[nodiscard]] std::string toString() const;
};

// Tagged union selected at parse time.
using Attribute = std::variant<PlainAttribute, ArchivePolicy>;

[[nodiscard]] AttributeKind kindOf(const Attribute& attr) noexcept;

// ─── One `record(type, "name") { … }` block ──────────────────────────────────
struct Record {
    std::string            type;    // ai, bo, calc …
    std::string            name;    // Quotes stripped
    std::size_t            line{0}; // 1-based line of the header
    std::vector<Attribute> attributes; // Source order

    [[nodiscard]] std::string toString() const;
};

// ─── Output unit: one <channel> in the engine configuration ──────────────────
struct ChannelDescriptor {
    std::string name;   // Record name, or record name + "." + property
    std::string period; // "HH:MM:SS"
    SampleMode  mode{SampleMode::Monitor};

    bool operator==(const ChannelDescriptor&) const = default;
};

// ─── Non-fatal parser findings ────────────────────────────────────────────────
enum class Severity { Warning, Error };

struct Diagnostic {
    Severity    severity{Severity::Warning};
    std::size_t line{0};    // 1-based input line
    std::string message;
};

// ─── Result of parsing a whole database ───────────────────────────────────────
struct ParsedDatabase {
    std::vector<Record>     records;     // Source order
    std::vector<Diagnostic> diagnostics; // Source order
    std::size_t             lines_read{0};

    // Number of archive attributes dropped because their value did not parse.
    [[nodiscard]] std::size_t skippedAttributes() const noexcept;
};

} // namespace archcfg
