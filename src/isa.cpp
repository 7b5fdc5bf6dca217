#include "isa.hpp"
#include "config.hpp"
#include <array>
#include <cctype>
#include <sstream>

namespace spvm
{

// Orden = id del opcode
static constexpr std::array<const char*, kOpCodeCount> kMnemonics = {
  "PUSH", "POP", "DUP", "SWAP", "JZ", "JNZ", "JMP",
  "ADD", "SUB", "MUL", "DIV", "EXIT", "PRINTOUT", "CALL", "PRINTSTR"
};

const char* mnemonic(OpCode op) {
  auto id = opcode_id(op);
  if (id >= kOpCodeCount) return "?";
  return kMnemonics[id];
}

std::uint16_t opcode_id(OpCode op) {
  return static_cast<std::uint16_t>(op);
}

std::optional<OpCode> opcode_from_id(std::uint16_t id) {
  if (id >= kOpCodeCount) return std::nullopt;
  return static_cast<OpCode>(id);
}

std::optional<OpCode> opcode_from_mnemonic(const std::string& text) {
  std::string up;
  up.reserve(text.size());
  for (char c : text) up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

  for (std::uint16_t id = 0; id < kOpCodeCount; ++id) {
    if (up == kMnemonics[id]) return static_cast<OpCode>(id);
  }
  return std::nullopt;
}

bool has_operand(OpCode op) {
  return op == OpCode::PUSH;
}

// ===== Codificación =====

std::size_t encoded_size(OpCode op) {
  return cfg::kOpcodeBytes + (has_operand(op) ? cfg::kOperandBytes : 0);
}

void encode(const Instr& ins, std::vector<std::uint8_t>& out) {
  const std::uint16_t id = opcode_id(ins.op);
  out.push_back(static_cast<std::uint8_t>(id));
  out.push_back(static_cast<std::uint8_t>(id >> 8));

  if (has_operand(ins.op)) {
    // complemento a dos, little-endian
    const auto u = static_cast<std::uint64_t>(ins.arg);
    for (std::size_t i = 0; i < cfg::kOperandBytes; ++i)
      out.push_back(static_cast<std::uint8_t>(u >> (8 * i)));
  }
}

std::vector<std::uint8_t> encode(const Instr& ins) {
  std::vector<std::uint8_t> out;
  out.reserve(encoded_size(ins.op));
  encode(ins, out);
  return out;
}

Decoded decode(const std::uint8_t* data, std::size_t size) {
  Decoded d;
  if (size < cfg::kOpcodeBytes) return d; // Truncated

  d.id = static_cast<std::uint16_t>(data[0] | (data[1] << 8));
  auto op = opcode_from_id(d.id);
  if (!op) {
    d.status = DecodeStatus::UnknownOpcode;
    return d;
  }

  const std::size_t need = encoded_size(*op);
  if (size < need) return d; // Truncated

  d.instr.op = *op;
  if (has_operand(*op)) {
    std::uint64_t u = 0;
    for (std::size_t i = 0; i < cfg::kOperandBytes; ++i)
      u |= static_cast<std::uint64_t>(data[cfg::kOpcodeBytes + i]) << (8 * i);
    d.instr.arg = static_cast<Value>(u);
  }
  d.size   = need;
  d.status = DecodeStatus::Ok;
  return d;
}

// ===== Texto =====

std::string to_source(const Instr& ins) {
  std::string s = mnemonic(ins.op);
  if (has_operand(ins.op)) s += " " + std::to_string(ins.arg);
  return s;
}

std::string to_source(const Program& p) {
  std::ostringstream os;
  for (const auto& ins : p.code) os << to_source(ins) << '\n';
  return os.str();
}

} // namespace spvm
