#pragma once

#include <string>
#include <vector>

#include "hud/overlay_config.hpp"

namespace mo {

struct DiffEntry {
  std::string key;  // parameter key, "layout[<i>]" or "extra:<key>"
  std::string left;
  std::string right;
};

class ConfigDiffService {
 public:
  std::vector<DiffEntry> diff(const OverlayConfig& left,
                              const OverlayConfig& right) const;
};

}  // namespace mo
