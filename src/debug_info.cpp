#include "debug_info.hpp"

namespace spvm {

void DebugInfo::add_breakpoint(Addr addr) {
  breakpoints_.insert(addr);
}

bool DebugInfo::breakpoint_at(Addr addr) const {
  return breakpoints_.count(addr) != 0;
}

// Si ya había un label en esa dirección, gana el último (varios labels seguidos)
void DebugInfo::add_label(Addr addr, const std::string& label) {
  labels_[addr] = label;
}

std::optional<std::string> DebugInfo::label_at(Addr addr) const {
  auto it = labels_.find(addr);
  if (it == labels_.end()) return std::nullopt;
  return it->second;
}

} // namespace spvm
