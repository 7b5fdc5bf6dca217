#pragma once
#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spvm {

// ISA de la máquina de pila. El valor numérico es el id del formato binario.
// Los saltos y CALL no llevan destino: lo sacan de la pila en ejecución.
enum class OpCode : std::uint16_t {
  PUSH     = 0,  // PUSH imm64 | label
  POP      = 1,
  DUP      = 2,
  SWAP     = 3,
  JZ       = 4,  // pop dest, pop cond
  JNZ      = 5,  // pop dest, pop cond
  JMP      = 6,  // pop dest
  ADD      = 7,
  SUB      = 8,
  MUL      = 9,
  DIV      = 10,
  EXIT     = 11,
  PRINTOUT = 12,
  CALL     = 13, // pop dest, push ip+1
  PRINTSTR = 14  // pop hasta 0
};

inline constexpr std::uint16_t kOpCodeCount = 15;

// Instrucción: solo PUSH usa 'arg'.
struct Instr {
  OpCode op{};
  Value  arg = 0;

  // Parchea el operando de un PUSH (relocación). En otros opcodes no hace nada.
  void set_arg(Value v) {
    if (op == OpCode::PUSH) arg = v;
  }

  bool operator==(const Instr& o) const {
    return op == o.op && (op != OpCode::PUSH || arg == o.arg);
  }
  bool operator!=(const Instr& o) const { return !(*this == o); }
};

// Programa = lista plana de instrucciones; la dirección es el índice.
struct Program {
  std::vector<Instr> code;
};

// ---------- Tabla de opcodes ----------
const char*             mnemonic(OpCode op);
std::uint16_t           opcode_id(OpCode op);
std::optional<OpCode>   opcode_from_id(std::uint16_t id);
std::optional<OpCode>   opcode_from_mnemonic(const std::string& text); // sin mayúsculas/minúsculas
bool                    has_operand(OpCode op);

// ---------- Codificación binaria ----------
// [u16 LE id][i64 LE operando, solo PUSH]
std::size_t encoded_size(OpCode op);
void        encode(const Instr& ins, std::vector<std::uint8_t>& out);
std::vector<std::uint8_t> encode(const Instr& ins);

enum class DecodeStatus : std::uint8_t { Ok, Truncated, UnknownOpcode };

struct Decoded {
  DecodeStatus  status = DecodeStatus::Truncated;
  Instr         instr{};
  std::size_t   size = 0;  // bytes consumidos si status == Ok
  std::uint16_t id = 0;    // id leído (útil para reportar UnknownOpcode)
};

// Decodifica una instrucción al inicio de [data, data+size). No lanza.
Decoded decode(const std::uint8_t* data, std::size_t size);

// ---------- Texto ----------
// Forma ensamblable: "PUSH 5", "ADD".
std::string to_source(const Instr& ins);
// Una instrucción por línea; se puede volver a ensamblar tal cual.
std::string to_source(const Program& p);

} // namespace spvm
