#pragma once
// EngineConfigWriter.hpp – Serializes channel descriptors as an archive
// engine configuration document:
//
//   <engineconfig>
//     <group>
//       <name>Default_Group</name>
//       <channel>
//         <name>BL7:Mot:Parker:HROT.RBV</name>
//         <period>00:00:10</period>
//         <monitor />
//       </channel>
//     </group>
//   </engineconfig>

#include "Types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace archcfg {

inline constexpr const char* kRootElement     = "engineconfig";
inline constexpr const char* kDefaultGroupName = "Default_Group";

struct EngineConfigOptions {
    std::string group_name{kDefaultGroupName};
    std::string indent{"  "};
};

// Render the document (UTF-8, with XML declaration) to a string.
[[nodiscard]] std::string renderEngineConfig(const std::vector<ChannelDescriptor>& channels,
                                             const EngineConfigOptions& opts = {});

// Write the document to `path`, replacing any existing file.
// Throws IoError if the file cannot be written.
void writeEngineConfig(const std::filesystem::path& path,
                       const std::vector<ChannelDescriptor>& channels,
                       const EngineConfigOptions& opts = {});

} // namespace archcfg
