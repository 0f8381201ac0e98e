// main.cpp – epics-archive-config: EPICS database → archive engine config.
//
//   epics-archive-config <database>.db
//
// Writes <database>_arch.xml next to the input. Exit status 0 on success,
// 2 on a missing argument or any fatal conversion error.

#include "EpicsArchiveConfig/Converter.hpp"
#include "EpicsArchiveConfig/Errors.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <vector>

using namespace archcfg;

static constexpr int kExitFailure = 2;

static void printDiagnostics(const std::filesystem::path& input,
                             const std::vector<Diagnostic>& diags) {
    for (const auto& d : diags) {
        std::cerr << input.string() << ':' << d.line << ": "
                  << (d.severity == Severity::Error ? "error" : "warning") << ": "
                  << d.message << '\n';
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Missing input file name!\n"
                  << "usage: " << (argc > 0 ? argv[0] : "epics-archive-config")
                  << " <database>" << kInputSuffix << '\n';
        return kExitFailure;
    }
    if (argc > 2) {
        std::cerr << "Expected exactly one input file, got " << (argc - 1) << '\n';
        return kExitFailure;
    }

    const std::filesystem::path input = argv[1];
    std::cout << "Input: " << input.string() << '\n';

    try {
        ConversionSummary s = convertFile(input);
        printDiagnostics(s.input, s.diagnostics);

        std::cout << "Records: " << s.records << ", channels: " << s.channels;
        if (s.skipped_attributes > 0)
            std::cout << ", skipped archive attributes: " << s.skipped_attributes;
        std::cout << '\n' << "Wrote " << s.output.string() << '\n';
        return 0;
    } catch (const UnterminatedRecordError& e) {
        printDiagnostics(input, e.diagnostics());
        std::cerr << input.string() << ':' << e.headerLine() << ": error: " << e.what() << '\n';
    } catch (const ArchiveConfigError& e) {
        std::cerr << "error: " << e.what() << '\n';
    } catch (const std::exception& e) {
        std::cerr << "unexpected error: " << e.what() << '\n';
    }
    return kExitFailure;
}
