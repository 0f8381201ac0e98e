#pragma once
// Errors.hpp – Fatal conversion errors. Anything thrown from this library
// derives from ArchiveConfigError.

#include "Types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace archcfg {

class ArchiveConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Input could not be opened / read, or output could not be written.
class IoError : public ArchiveConfigError {
public:
    using ArchiveConfigError::ArchiveConfigError;
};

// End of input reached inside a record (before its '{' or its '}').
class UnterminatedRecordError : public ArchiveConfigError {
public:
    UnterminatedRecordError(std::string record_name, std::size_t header_line)
        : ArchiveConfigError("record '" + record_name + "' (line " +
                             std::to_string(header_line) +
                             ") is not terminated before end of input"),
          record_name_(std::move(record_name)),
          header_line_(header_line) {}

    [[nodiscard]] const std::string& recordName() const noexcept { return record_name_; }
    [[nodiscard]] std::size_t headerLine() const noexcept { return header_line_; }

    // Warnings and skipped attributes reported before input ran out.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept { return diagnostics_; }
    void setDiagnostics(std::vector<Diagnostic> diags) { diagnostics_ = std::move(diags); }

private:
    std::string             record_name_;
    std::size_t             header_line_;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace archcfg
