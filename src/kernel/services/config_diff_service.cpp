#include "kernel/services/config_diff_service.hpp"

#include <algorithm>
#include <map>

#include "hud/param_registry.hpp"

namespace mo {

static const char* kUnset = "(unset)";

std::vector<DiffEntry> ConfigDiffService::diff(
    const OverlayConfig& left, const OverlayConfig& right) const {
  std::vector<DiffEntry> out;
  for (const auto& p : all_params()) {
    auto l = p.format(left);
    auto r = p.format(right);
    if (l != r) out.push_back({p.key, l.value_or(kUnset), r.value_or(kUnset)});
  }

  const size_t n = std::max(left.layout.size(), right.layout.size());
  for (size_t i = 0; i < n; ++i) {
    auto entry_text = [i](const OverlayConfig& c) -> std::string {
      if (i >= c.layout.size()) return kUnset;
      return c.layout[i].key + "=" + c.layout[i].value;
    };
    std::string l = entry_text(left);
    std::string r = entry_text(right);
    if (l != r) out.push_back({"layout[" + std::to_string(i) + "]", l, r});
  }

  std::map<std::string, std::pair<std::string, std::string>> extras;
  for (const auto& e : left.extras) extras[e.key] = {e.value, kUnset};
  for (const auto& e : right.extras) {
    auto it = extras.find(e.key);
    if (it == extras.end())
      extras[e.key] = {kUnset, e.value};
    else
      it->second.second = e.value;
  }
  for (const auto& kv : extras) {
    if (kv.second.first != kv.second.second)
      out.push_back({"extra:" + kv.first, kv.second.first, kv.second.second});
  }
  return out;
}

}  // namespace mo
