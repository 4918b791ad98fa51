#pragma once

#include "wizctl/control/group.hpp"
#include "wizctl/protocol/message.hpp"

#include <string>
#include <vector>

namespace wizctl
{

// Pretty-printed JSON for wizctl_probe. Bytes that are not valid UTF-8, as found in raw
// responses, are replaced with U+FFFD instead of failing the dump.

std::string format_devices(const std::vector<DiscoveredDevice>& devices);

std::string format_reply(const Reply& reply);

/// One entry per device: address, success, and either the reply or the error message.
std::string format_group_results(const std::vector<GroupResult>& results);

} // namespace wizctl
