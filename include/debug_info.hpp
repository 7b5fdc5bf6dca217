#pragma once
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace spvm {

// Metadatos de depuración que arma el ensamblador y consulta la máquina.
// - breakpoints: direcciones donde se pausa (solo con verbose)
// - labels: dirección -> nombre, solo para el desensamblado
// Un programa cargado desde .SPVM arranca con DebugInfo vacío.
class DebugInfo {
public:
  void add_breakpoint(Addr addr);
  bool breakpoint_at(Addr addr) const;

  void add_label(Addr addr, const std::string& label);
  std::optional<std::string> label_at(Addr addr) const;

  bool verbose() const { return verbose_; }
  void set_verbose(bool v) { verbose_ = v; }

  std::size_t breakpoint_count() const { return breakpoints_.size(); }
  std::size_t label_count() const { return labels_.size(); }

private:
  std::unordered_set<Addr>              breakpoints_;
  std::unordered_map<Addr, std::string> labels_;
  bool                                  verbose_{false};
};

} // namespace spvm
