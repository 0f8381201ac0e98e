// EngineConfigWriter.cpp – Builds the engine configuration tree with pugixml.

#include "EpicsArchiveConfig/EngineConfigWriter.hpp"
#include "EpicsArchiveConfig/Errors.hpp"

#include <pugixml.hpp>

#include <sstream>

namespace archcfg {

// ─── Tree construction ────────────────────────────────────────────────────────

static void appendTextElement(pugi::xml_node parent, const char* name, const std::string& text) {
    parent.append_child(name).text().set(text.c_str());
}

static void appendChannel(pugi::xml_node group, const ChannelDescriptor& ch) {
    pugi::xml_node node = group.append_child("channel");
    appendTextElement(node, "name",   ch.name);
    appendTextElement(node, "period", ch.period);
    node.append_child(toString(ch.mode)); // empty <monitor/> or <scan/>
}

static void buildDocument(pugi::xml_document& doc,
                          const std::vector<ChannelDescriptor>& channels,
                          const EngineConfigOptions& opts) {
    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version")  = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    pugi::xml_node group = doc.append_child(kRootElement).append_child("group");
    appendTextElement(group, "name", opts.group_name);

    for (const auto& ch : channels)
        appendChannel(group, ch);
}

// ─── Public entry points ──────────────────────────────────────────────────────

std::string renderEngineConfig(const std::vector<ChannelDescriptor>& channels,
                               const EngineConfigOptions& opts) {
    pugi::xml_document doc;
    buildDocument(doc, channels, opts);

    std::ostringstream os;
    doc.save(os, opts.indent.c_str(), pugi::format_default, pugi::encoding_utf8);
    return os.str();
}

void writeEngineConfig(const std::filesystem::path& path,
                       const std::vector<ChannelDescriptor>& channels,
                       const EngineConfigOptions& opts) {
    pugi::xml_document doc;
    buildDocument(doc, channels, opts);

    if (!doc.save_file(path.c_str(), opts.indent.c_str(), pugi::format_default,
                       pugi::encoding_utf8))
        throw IoError("cannot write output file '" + path.string() + "'");
}

} // namespace archcfg
