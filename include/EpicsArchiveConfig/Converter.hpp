#pragma once
// Converter.hpp – One-shot database → engine configuration conversion.
//
// Usage example:
//   auto summary = convertFile("BL7_motors.db");   // writes BL7_motors_arch.xml
//   for (const auto& d : summary.diagnostics) …

#include "EngineConfigWriter.hpp"
#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace archcfg {

inline constexpr const char* kInputSuffix  = ".db";
inline constexpr const char* kOutputSuffix = "_arch.xml";

struct ConversionSummary {
    std::filesystem::path   input;
    std::filesystem::path   output;
    std::size_t             records{0};
    std::size_t             channels{0};
    std::size_t             skipped_attributes{0};
    std::vector<Diagnostic> diagnostics;
};

// "<dir>/name.db" → "<dir>/name_arch.xml"; a path without the ".db" suffix
// gets "_arch.xml" appended.
[[nodiscard]] std::filesystem::path outputPathFor(const std::filesystem::path& input);

// Parse `input`, expand its archive channels and write them next to it.
// Nothing is written if parsing fails.
// Throws IoError or UnterminatedRecordError.
ConversionSummary convertFile(const std::filesystem::path& input,
                              const EngineConfigOptions& opts = {});

} // namespace archcfg
