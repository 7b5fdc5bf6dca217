#include "stack_machine.hpp"
#include "config.hpp"
#include "debug_io.hpp"
#include <cctype>
#include <string>

namespace spvm {

using dbg::print_disassembly;
using dbg::print_stack;

void StackMachine::dump_state(const Program& p) const {
  print_disassembly(out_, p, debug_, ip_);
  print_stack(out_, stack_);
}

// Pausa en un breakpoint: n/no aborta, cualquier otra respuesta continúa.
void StackMachine::confirm_breakpoint(const Program& p) {
  const char* mn = mnemonic(p.code[static_cast<std::size_t>(ip_)].op);

  out_ << "\n===================== BREAKPOINT @" << fmt_addr(ip_) << " =====================\n";
  dump_state(p);
  out_ << "¿Continuar? [y/n] > " << std::flush;

  std::string line;
  if (!std::getline(in_, line)) {
    out_ << "\n";
    fault(mn, "entrada cerrada en el breakpoint");
  }

  std::string ans;
  for (char c : line) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      ans.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (ans == cfg::kAbortShort || ans == cfg::kAbortLong)
    fault(mn, "abortado por el usuario en el breakpoint");

  LOG_IF(cfg::kLogVM, "[VM] breakpoint @" << fmt_addr(ip_) << ": continuar");
}

} // namespace spvm
