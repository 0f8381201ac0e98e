// ChannelExpander.cpp – Flattens records into the channel list.

#include "EpicsArchiveConfig/ChannelExpander.hpp"

#include <iterator>

namespace archcfg {

std::vector<ChannelDescriptor> expandPolicy(const std::string& record_name,
                                            const ArchivePolicy& policy) {
    std::vector<ChannelDescriptor> out;

    if (!policy.properties) {
        out.push_back({record_name, policy.period, policy.mode});
        return out;
    }

    // Present-but-empty list yields nothing.
    out.reserve(policy.properties->size());
    for (const auto& prop : *policy.properties)
        out.push_back({record_name + "." + prop, policy.period, policy.mode});
    return out;
}

std::vector<ChannelDescriptor> expandChannels(const std::vector<Record>& records) {
    std::vector<ChannelDescriptor> out;
    for (const auto& rec : records) {
        for (const auto& attr : rec.attributes) {
            const auto* policy = std::get_if<ArchivePolicy>(&attr);
            if (!policy) continue;

            auto chans = expandPolicy(rec.name, *policy);
            out.insert(out.end(), std::make_move_iterator(chans.begin()),
                       std::make_move_iterator(chans.end()));
        }
    }
    return out;
}

} // namespace archcfg
