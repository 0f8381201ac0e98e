#pragma once
// LineScanner.hpp – Forward-only line source over a database text.
//
// Lines come back exactly as read (no trimming; a trailing '\r' from CRLF
// files is the only thing removed). End of input is reported as nullopt,
// which is distinct from an empty line.

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace archcfg {

class LineScanner {
public:
    // Scan an already-open stream. The stream must outlive the scanner.
    explicit LineScanner(std::istream& in) noexcept : in_(&in) {}

    // Open and own a file stream. Throws IoError if the file cannot be opened.
    static LineScanner open(const std::filesystem::path& path);

    LineScanner(LineScanner&&) noexcept = default;
    LineScanner& operator=(LineScanner&&) noexcept = default;

    // Next raw line, or nullopt at end of input.
    // Throws IoError if the stream fails for any reason other than EOF.
    [[nodiscard]] std::optional<std::string> next();

    // 1-based number of the line most recently returned (0 before the first).
    [[nodiscard]] std::size_t lineNumber() const noexcept { return line_no_; }

private:
    LineScanner(std::unique_ptr<std::ifstream> owned, std::filesystem::path path);

    std::unique_ptr<std::ifstream> owned_;
    std::istream*                  in_{nullptr};
    std::filesystem::path          path_;
    std::size_t                    line_no_{0};
    bool                           done_{false};
};

} // namespace archcfg
