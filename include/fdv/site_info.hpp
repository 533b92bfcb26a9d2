#pragma once

#include "fdv/types.hpp"

#include <string>
#include <vector>

namespace fdv {

struct SiteInfo {
  std::string site_id{unknown_site()};
  std::string site_name{unknown_site()};
};

// Infer the site identity of a logger export.
//
// Rules, in order:
//   - file stem of letters followed by digits ("FM12"): site id and name
//   - file stem of digits only ("4711"): site id
//   - otherwise: the first channel qualifier ("4711_1|Depth|mm") is the site id
// A known id with an unknown name uses the id as name. Unresolved values stay
// "Unknown".
SiteInfo infer_site_info(const std::string& source_path,
                         const std::vector<ChannelDescriptor>& channels);

} // namespace fdv
