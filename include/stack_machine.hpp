#pragma once
#include "types.hpp"
#include "isa.hpp"
#include "debug_info.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace spvm {

/**
 * Máquina de pila: intérprete fetch-eval sobre un Program.
 *
 * Estados: Running -> Halted (EXIT) | Faulted (cualquier falla).
 * Una falla deja exit_code = cfg::kFaultExitCode y lanza ExecutionFault.
 * Con verbose: desensamblado al arrancar, traza por instrucción y
 * pausa interactiva en cada breakpoint (stepping_ui.cpp).
 */
class StackMachine {
public:
  explicit StackMachine(DebugInfo debug = {},
                        std::ostream& out = std::cout,
                        std::istream& in = std::cin);

  // Ejecuta desde ip 0 hasta EXIT. Devuelve el código de salida.
  int run(const Program& p);

  // Un paso: breakpoint (si corresponde) + una instrucción.
  void step(const Program& p);

  // Vuelve al estado inicial (ip 0, pila vacía, sin código de salida)
  void reset();

  // Consultas
  bool                      is_running() const { return state_ == MachineState::Running; }
  MachineState              state() const { return state_; }
  Addr                      ip() const { return ip_; }
  const std::vector<Value>& stack() const { return stack_; }
  std::optional<int>        exit_code() const { return exit_; }
  const DebugInfo&          debug_info() const { return debug_; }

private:
  void exec_one(const Instr& ins);       // ejecuta ins (la de ip_)

  Value pop(const Instr& ins);           // falla con underflow
  void  binop(const Instr& ins);         // ADD/SUB/MUL/DIV
  void  jump_to(Value target, const Instr& ins);

  [[noreturn]] void fault(const std::string& mnemonic, const std::string& cause);

  // Implementados en stepping_ui.cpp
  void dump_state(const Program& p) const;
  void confirm_breakpoint(const Program& p);

  DebugInfo     debug_;
  std::ostream& out_;   // salida del programa (PRINTOUT/PRINTSTR) y dumps
  std::istream& in_;    // respuestas en breakpoints

  Addr               ip_ = 0;
  std::vector<Value> stack_;
  std::optional<int> exit_;
  MachineState       state_ = MachineState::Running;
};

} // namespace spvm
