#pragma once
// ChannelExpander.hpp – Turns archive policies into output channels.

#include "Types.hpp"

#include <vector>

namespace archcfg {

// One channel per property of each archive policy (named "<record>.<prop>"),
// or a single "<record>" channel when the policy has no property segment.
// Output order: record, then attribute, then property. Field attributes
// contribute nothing.
[[nodiscard]] std::vector<ChannelDescriptor> expandChannels(const std::vector<Record>& records);

// Channels for a single policy attached to `record_name`.
[[nodiscard]] std::vector<ChannelDescriptor> expandPolicy(const std::string& record_name,
                                                          const ArchivePolicy& policy);

} // namespace archcfg
