#pragma once
// DbParser.hpp – Builds the record list from an EPICS database text.
//
// Fatal problems (unreadable input, a record that never closes) are thrown;
// everything else is reported through ParsedDatabase::diagnostics and the
// offending line or attribute is skipped.

#include "LineScanner.hpp"
#include "Types.hpp"

#include <filesystem>
#include <istream>

namespace archcfg {

// Parse every record reachable through the scanner.
// Throws UnterminatedRecordError or IoError.
[[nodiscard]] ParsedDatabase parseDatabase(LineScanner& scanner);

// Convenience overloads.
[[nodiscard]] ParsedDatabase parseDatabase(std::istream& in);
[[nodiscard]] ParsedDatabase parseDatabaseFile(const std::filesystem::path& path);

} // namespace archcfg
