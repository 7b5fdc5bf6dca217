#pragma once
// Utilidades de impresión compactas para desensamblado y pila.
// Pensado para el modo verbose y los breakpoints.

#include "debug_info.hpp"
#include "isa.hpp"
#include <cstddef>
#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace spvm::dbg {

inline void print_header(std::ostream& os, const std::string& title) {
  os << "\n::::::::::::::::::: " << title << " :::::::::::::::::::\n\n";
}

// "0004 >> PUSH      5"
inline void print_instr(std::ostream& os, Addr addr, const Instr& ins, bool at_ip) {
  os << fmt_addr(addr) << ' ' << (at_ip ? ">>" : "  ") << ' '
     << std::left << std::setw(10) << mnemonic(ins.op) << std::right;
  if (has_operand(ins.op)) os << ins.arg;
  os << '\n';
}

// Programa completo; los labels conocidos van como "nombre:" arriba de su dirección.
inline void print_disassembly(std::ostream& os, const Program& p, const DebugInfo& info,
                              std::optional<Addr> ip = std::nullopt) {
  print_header(os, "Instrucciones");
  for (std::size_t i = 0; i < p.code.size(); ++i) {
    const auto addr = static_cast<Addr>(i);
    if (auto label = info.label_at(addr)) os << "     " << *label << ":\n";
    print_instr(os, addr, p.code[i], ip && *ip == addr);
  }
}

inline void print_stack(std::ostream& os, const std::vector<Value>& stack) {
  print_header(os, "Pila");
  if (stack.empty()) {
    os << "<sin entradas>\n\n";
    return;
  }
  for (std::size_t i = 0; i < stack.size(); ++i)
    os << std::left << std::setw(6) << fmt_addr(i) << std::right << stack[i] << '\n';
}

} // namespace spvm::dbg
