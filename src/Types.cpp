// Types.cpp – String forms and small queries on the database model.

#include "EpicsArchiveConfig/Types.hpp"

#include <algorithm>

namespace archcfg {

const char* toString(SampleMode mode) noexcept {
    switch (mode) {
    case SampleMode::Monitor: return "monitor";
    case SampleMode::Scan:    return "scan";
    }
    return "monitor";
}

const char* toString(AttributeKind kind) noexcept {
    return kind == AttributeKind::Field ? "field" : "info";
}

std::string PlainAttribute::toString() const {
    return std::string(archcfg::toString(kind)) + "(" + name + ", \"" + value + "\")";
}

std::string ArchivePolicy::toString() const {
    std::string s = std::string("info(archive, ") + archcfg::toString(mode) + " " + period;
    if (properties) {
        for (const auto& p : *properties)
            s += ' ' + p;
    }
    s += ')';
    return s;
}

AttributeKind kindOf(const Attribute& attr) noexcept {
    if (const auto* plain = std::get_if<PlainAttribute>(&attr))
        return plain->kind;
    return AttributeKind::Info;
}

std::string Record::toString() const {
    return "record(" + type + ", \"" + name + "\")";
}

std::size_t ParsedDatabase::skippedAttributes() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(diagnostics.begin(), diagnostics.end(),
                      [](const Diagnostic& d) { return d.severity == Severity::Error; }));
}

} // namespace archcfg
