#include "stack_machine.hpp"
#include "config.hpp"
#include <cstdint>
#include <limits>
#include <utility>

namespace spvm
{

  // CPU de pila:
  // - run(): ciclo hasta EXIT o falla
  // - step(): breakpoint + 1 instrucción
  // - las fallas pasan a Faulted y se propagan como ExecutionFault
  StackMachine::StackMachine(DebugInfo debug, std::ostream &out, std::istream &in)
      : debug_(std::move(debug)), out_(out), in_(in) {}

  void StackMachine::reset()
  {
    ip_ = 0;
    stack_.clear();
    exit_.reset();
    state_ = MachineState::Running;
  }

  int StackMachine::run(const Program &p)
  {
    reset();
    if (debug_.verbose())
      dump_state(p);

    while (is_running())
      step(p);

    LOG_IF(cfg::kLogVM && debug_.verbose(), "[VM] " << to_string(state_) << " @" << fmt_addr(ip_)
                                                    << " código=" << *exit_);
    return *exit_;
  }

  void StackMachine::fault(const std::string &mnemonic, const std::string &cause)
  {
    state_ = MachineState::Faulted;
    exit_ = cfg::kFaultExitCode;
    throw ExecutionFault(ip_, mnemonic, cause);
  }

  void StackMachine::step(const Program &p)
  {
    if (!is_running())
      return;

    if (ip_ >= p.code.size())
      fault("", "no hay instrucción en " + fmt_addr(ip_));

    if (debug_.verbose() && debug_.breakpoint_at(ip_))
      confirm_breakpoint(p);

    exec_one(p.code[static_cast<std::size_t>(ip_)]);
  }

  // ===== Pila =====
  Value StackMachine::pop(const Instr &ins)
  {
    if (stack_.empty())
      fault(mnemonic(ins.op), "no hay suficientes valores en la pila");
    Value v = stack_.back();
    stack_.pop_back();
    return v;
  }

  void StackMachine::jump_to(Value target, const Instr &ins)
  {
    if (target < 0)
      fault(mnemonic(ins.op), "dirección de salto inválida: " + std::to_string(target));
    ip_ = static_cast<Addr>(target);
  }

  // a = tope, b = el de abajo: SUB hace a - b, DIV hace a / b
  void StackMachine::binop(const Instr &ins)
  {
    const Value a = pop(ins);
    const Value b = pop(ins);

    // Aritmética modular de 64 bits (sin UB por overflow)
    const auto ua = static_cast<std::uint64_t>(a);
    const auto ub = static_cast<std::uint64_t>(b);
    Value r = 0;

    switch (ins.op)
    {
    case OpCode::ADD: r = static_cast<Value>(ua + ub); break;
    case OpCode::SUB: r = static_cast<Value>(ua - ub); break;
    case OpCode::MUL: r = static_cast<Value>(ua * ub); break;
    case OpCode::DIV:
      if (b == 0)
        fault(mnemonic(ins.op), "división por cero");
      if (a == std::numeric_limits<Value>::min() && b == -1)
        fault(mnemonic(ins.op), "desbordamiento en la división");
      r = a / b;
      break;
    default:
      fault(mnemonic(ins.op), "opcode inalcanzable en binop");
    }

    stack_.push_back(r);
  }

  // ===== Ejecución (una instrucción) =====
  void StackMachine::exec_one(const Instr &ins)
  {
    LOG_IF(cfg::kLogVM && debug_.verbose(), "[VM] " << fmt_addr(ip_) << "  " << to_source(ins)
                                                    << "  (pila=" << stack_.size() << ")");

    auto next = [&]{ ip_++; };

    switch (ins.op)
    {
    case OpCode::PUSH:
      stack_.push_back(ins.arg);
      next();
      break;

    case OpCode::POP:
      (void)pop(ins);
      next();
      break;

    case OpCode::DUP: {
      Value v = pop(ins);
      stack_.push_back(v);
      stack_.push_back(v);
      next();
      break;
    }
    case OpCode::SWAP: {
      Value a = pop(ins);
      Value b = pop(ins);
      stack_.push_back(a);
      stack_.push_back(b);
      next();
      break;
    }
    case OpCode::ADD:
    case OpCode::SUB:
    case OpCode::MUL:
    case OpCode::DIV:
      binop(ins);
      next();
      break;

    case OpCode::JZ:
    case OpCode::JNZ: {
      Value target = pop(ins);
      Value cond = pop(ins);
      bool take = (ins.op == OpCode::JZ) ? (cond == 0) : (cond != 0);
      if (take) jump_to(target, ins);
      else      next();
      break;
    }
    case OpCode::JMP:
      jump_to(pop(ins), ins);
      break;

    case OpCode::CALL: {
      // Dirección de retorno en la pila; se vuelve con PUSH/JMP, no hay RET
      Value target = pop(ins);
      stack_.push_back(static_cast<Value>(ip_ + 1));
      jump_to(target, ins);
      break;
    }
    case OpCode::PRINTOUT:
      out_ << pop(ins) << '\n';
      next();
      break;

    case OpCode::PRINTSTR: {
      // Caracteres hasta el terminador 0 (se consume, no se imprime)
      for (Value c = pop(ins); c != 0; c = pop(ins))
        out_.put(static_cast<char>(c));
      out_.flush();
      next();
      break;
    }
    case OpCode::EXIT: {
      Value code = 0;
      if (!stack_.empty()) {
        code = stack_.back();
        stack_.pop_back();
      }
      exit_ = static_cast<int>(code);
      state_ = MachineState::Halted;
      next();
      break;
    }
    default:
      fault(mnemonic(ins.op), "opcode desconocido");
    }
  }

} // namespace spvm
