// DbParser.cpp – Record builder driving the line scanner and the matchers.
//
// A record spans from its header line to the first unquoted '}' after its
// opening '{'. Text between the braces is scanned for attributes; one line
// may carry several of them, and the brace lines themselves are scanned too
// (everything after '{' and before '}').

#include "EpicsArchiveConfig/DbParser.hpp"
#include "EpicsArchiveConfig/Errors.hpp"
#include "EpicsArchiveConfig/Grammar.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace archcfg {

// Scanner position plus the database being filled in.
struct DbParseState {
    LineScanner&    scanner;
    ParsedDatabase& out;
};

static void report(DbParseState& st, Severity sev, std::string msg) {
    st.out.diagnostics.push_back({sev, st.scanner.lineNumber(), std::move(msg)});
}

static void reportOverlong(DbParseState& st) {
    report(st, Severity::Warning, "ignoring line longer than " +
           std::to_string(kMaxLineLength) + " characters");
}

static std::string nextLineOrThrow(DbParseState& st, const Record& rec) {
    auto line = st.scanner.next();
    if (!line)
        throw UnterminatedRecordError(rec.name, rec.line);
    return std::move(*line);
}

static void addAttribute(DbParseState& st, AttributeMatch attr, Record& rec) {
    if (attr.kind == AttributeKind::Field) {
        rec.attributes.emplace_back(
            PlainAttribute{attr.kind, std::move(attr.name), std::move(attr.value)});
        return;
    }
    // Only info(archive, …) is kept; other info tags are dropped.
    if (attr.name != "archive")
        return;

    PolicyParseResult res = parseArchivePolicy(attr.value);
    if (!res.ok()) {
        report(st, Severity::Error, "record '" + rec.name +
               "': skipping archive attribute: " + res.error);
        return;
    }
    rec.attributes.emplace_back(std::move(*res.policy));
}

static void parseBody(DbParseState& st, std::string_view text, std::size_t pos, Record& rec) {
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
        if (pos >= text.size() || text[pos] == '#')
            return;

        if (auto attr = matchAttribute(text, pos)) {
            pos = attr->end;
            addAttribute(st, std::move(*attr), rec);
            continue;
        }
        if (looksLikeAttribute(text, pos)) {
            report(st, Severity::Warning, "record '" + rec.name +
                   "': ignoring malformed attribute: " + std::string(text.substr(pos)));
        }
        return; // anything else on the line is not an attribute
    }
}

static void parseRecord(DbParseState& st, std::string line, const RecordHeader& hdr) {
    Record rec;
    rec.type = hdr.type;
    rec.name = hdr.name;
    rec.line = st.scanner.lineNumber();

    // ── Opening brace: same line as the header or any later line ─────────────
    std::size_t open = findDelimiter(line, '{', hdr.end);
    while (open == std::string::npos) {
        line = nextLineOrThrow(st, rec);
        open = findDelimiter(line, '{');
    }

    // ── Body up to and including the line holding the closing brace ──────────
    std::size_t start = open + 1;
    for (;;) {
        const std::size_t close = findDelimiter(line, '}', start);
        std::string_view  body(line);
        if (close != std::string::npos)
            body = body.substr(0, close);
        if (line.size() > kMaxLineLength)
            reportOverlong(st); // braces still count, attributes do not
        else
            parseBody(st, body, start, rec);
        if (close != std::string::npos)
            break;
        line  = nextLineOrThrow(st, rec);
        start = 0;
    }

    st.out.records.push_back(std::move(rec));
}

static void parseLines(DbParseState& st) {
    while (auto line = st.scanner.next()) {
        if (line->size() > kMaxLineLength) {
            reportOverlong(st);
            continue;
        }
        if (auto hdr = matchRecordHeader(*line)) {
            parseRecord(st, std::move(*line), *hdr);
        } else if (looksLikeRecordHeader(*line)) {
            report(st, Severity::Warning, "ignoring malformed record header: " + *line);
        }
    }
    st.out.lines_read = st.scanner.lineNumber();
}

// ─── Public API ───────────────────────────────────────────────────────────────

ParsedDatabase parseDatabase(LineScanner& scanner) {
    ParsedDatabase db;
    DbParseState   st{scanner, db};
    try {
        parseLines(st);
    } catch (UnterminatedRecordError& e) {
        e.setDiagnostics(std::move(db.diagnostics));
        throw;
    }
    return db;
}

ParsedDatabase parseDatabase(std::istream& in) {
    LineScanner scanner(in);
    return parseDatabase(scanner);
}

ParsedDatabase parseDatabaseFile(const std::filesystem::path& path) {
    LineScanner scanner = LineScanner::open(path);
    return parseDatabase(scanner);
}

} // namespace archcfg
