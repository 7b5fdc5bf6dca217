#include "assembler.hpp"
#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace spvm
{
// Ensamblador en una pasada con relocaciones:
// - label definido antes de usarse: se sustituye al toque
// - label usado antes de definirse: PUSH 0 + relocación, se parchea al definirlo
// Al final la tabla de relocaciones tiene que quedar vacía.

// ===== Utilidades locales =====

// Split por espacios (tabs incluidos)
static std::vector<std::string> split_tokens(const std::string& line) {
  std::vector<std::string> t;
  std::istringstream is(line);
  std::string cur;
  while (is >> cur) t.push_back(cur);
  return t;
}

// Corta en el primer token que arranca con ';'
static void drop_comment(std::vector<std::string>& tok) {
  auto it = std::find_if(tok.begin(), tok.end(),
                         [](const std::string& s) { return !s.empty() && s.front() == ';'; });
  tok.erase(it, tok.end());
}

static bool looks_numeric(const std::string& t) {
  if (t.empty()) return false;
  std::size_t i = (t[0] == '-') ? 1 : 0;
  return i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]));
}

// Inmediato decimal (con signo) o 0xHEX (64 bits, complemento a dos)
static std::optional<Value> parse_int(const std::string& t) {
  const char* first = t.data();
  const char* last  = t.data() + t.size();

  if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) {
    std::uint64_t u = 0;
    auto [p, ec] = std::from_chars(first + 2, last, u, 16);
    if (ec != std::errc() || p != last) return std::nullopt;
    return static_cast<Value>(u);
  }

  Value v = 0;
  auto [p, ec] = std::from_chars(first, last, v, 10);
  if (ec != std::errc() || p != last) return std::nullopt;
  return v;
}

static std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

// ===== Helpers privados de Assembler =====
std::string Assembler::trim(const std::string& s) {
  std::size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

bool Assembler::starts_with(const std::string& s, const std::string& p) {
  return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

bool Assembler::valid_label(const std::string& name) {
  if (name.empty()) return false;
  const auto c0 = static_cast<unsigned char>(name[0]);
  if (std::isdigit(c0) || name[0] == '-') return false;
  return name.find_first_of(";\":@") == std::string::npos;
}

void Assembler::error(const std::string& msg) const {
  throw AssemblyError(file_, lineno_, msg);
}

// ===== Ensamblado =====

Assembler::Assembler(std::string file) : file_(std::move(file)) {}

void Assembler::feed_line(const std::string& raw) {
  ++lineno_;
  const auto line = trim(raw);
  if (line.empty() || line.front() == ';') return;

  auto tok = split_tokens(line);

  // @PushStr puede llevar ';' dentro del literal: el comentario se corta después
  if (starts_with(tok[0], "@")) {
    parse_meta(tok);
    return;
  }

  drop_comment(tok);
  if (tok.empty()) return;

  if (tok[0].back() == ':') {
    parse_label(tok);
    return;
  }

  parse_instruction(tok);
}

void Assembler::parse_label(const Tokens& tok) {
  if (tok.size() != 1)
    error("texto extra después del label: `" + tok[1] + "`");

  const auto label = tok[0].substr(0, tok[0].size() - 1);
  if (!valid_label(label))
    error("nombre de label inválido: `" + label + "`");

  auto prev = labels_.find(label);
  if (prev != labels_.end())
    error("label duplicado: `" + label + "` (ya definido en " + fmt_addr(prev->second) + ")");

  const Addr addr = here();

  // Parchea todos los PUSH que esperaban este label
  auto rel = relocs_.find(label);
  if (rel != relocs_.end()) {
    for (Addr ri : rel->second) {
      prog_.code[static_cast<std::size_t>(ri)].set_arg(static_cast<Value>(addr));
      LOG_IF(cfg::kLogAsm, "[ASM] reloc " << label << " @" << fmt_addr(ri) << " -> " << fmt_addr(addr));
    }
    relocs_.erase(rel);
  }

  labels_[label] = addr;
  debug_.add_label(addr, label);
  LOG_IF(cfg::kLogAsm, "[ASM] label " << label << " = " << fmt_addr(addr));
}

void Assembler::parse_meta(const Tokens& tok) {
  const auto& name = tok[0];

  if (name == "@PushStr") {
    push_string(tok);
  }
  else if (name == "@Break") {
    if (tok.size() > 1 && tok[1].front() != ';')
      error("`@Break` no lleva argumentos");
    debug_.add_breakpoint(here());
    LOG_IF(cfg::kLogAsm, "[ASM] breakpoint @" << fmt_addr(here()));
  }
  else {
    error("no existe la metainstrucción `" + name + "`");
  }
}

void Assembler::push_string(const Tokens& tok) {
  if (tok.size() < 2 || tok[1].front() == ';')
    error("`@PushStr` espera un literal de cadena");
  if (tok[1].front() != '"')
    error("el literal de `@PushStr` tiene que empezar con '\"'");

  // Re-une tokens hasta encontrar la comilla de cierre
  auto closed = [](const std::string& s) { return s.size() >= 2 && s.back() == '"'; };
  std::size_t i = 1;
  std::string literal = tok[i];
  while (!closed(literal) && i + 1 < tok.size()) {
    literal += " " + tok[++i];
  }
  if (!closed(literal))
    error("literal de cadena sin cerrar: " + literal);
  if (i + 1 < tok.size() && tok[i + 1].front() != ';')
    error("demasiados argumentos: `" + tok[i + 1] + "`");

  auto bytes = unescape(literal);
  bytes.push_back('\0');

  // Al revés: el terminador queda abajo y el primer carácter arriba
  for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
    prog_.code.push_back(Instr{OpCode::PUSH, static_cast<Value>(static_cast<unsigned char>(*it))});
  }
}

std::string Assembler::unescape(const std::string& literal) const {
  const auto body = literal.substr(1, literal.size() - 2);
  std::string out;
  out.reserve(body.size());

  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\') {
      out.push_back(body[i]);
      continue;
    }
    if (i + 1 >= body.size())
      error("'\\' sin secuencia de escape al final del literal");

    const char e = body[++i];
    switch (e) {
      case 'n':  out.push_back('\n'); break;
      case 't':  out.push_back('\t'); break;
      case '0':  out.push_back('\0'); break;
      case '\\': out.push_back('\\'); break;
      default:
        error(std::string("secuencia de escape inválida: `\\") + e + "`");
    }
  }
  return out;
}

Value Assembler::label_addr(const std::string& label, Addr instruction_addr) {
  auto it = labels_.find(label);
  if (it != labels_.end()) return static_cast<Value>(it->second);

  relocs_[label].push_back(instruction_addr);
  return 0;
}

void Assembler::parse_instruction(const Tokens& tok) {
  auto op = opcode_from_mnemonic(tok[0]);
  if (!op)
    error("no existe el mnemónico `" + tok[0] + "`");
  if (tok.size() > 2)
    error("demasiados argumentos: `" + tok[2] + "`");

  const std::string mn = upper(tok[0]);
  const Addr addr = here();
  Instr ins{*op, 0};

  if (has_operand(*op)) {
    if (tok.size() != 2)
      error("`" + mn + "` espera un argumento");

    const auto& arg = tok[1];
    if (auto v = parse_int(arg)) {
      ins.arg = *v;
    } else if (looks_numeric(arg)) {
      error("inmediato inválido: `" + arg + "`");
    } else if (!valid_label(arg)) {
      error("nombre de label inválido: `" + arg + "`");
    } else {
      ins.arg = label_addr(arg, addr);
    }
  }
  else if (tok.size() == 2) {
    error("`" + mn + "` no lleva argumentos (el destino sale de la pila)");
  }

  prog_.code.push_back(ins);
}

Assembly Assembler::finish() {
  if (!relocs_.empty()) {
    std::ostringstream os;
    os << "no se pudieron resolver labels:";
    bool first = true;
    for (const auto& [name, uses] : relocs_) {
      os << (first ? " " : ", ") << "`" << name << "` (usado en";
      for (Addr a : uses) os << " " << fmt_addr(a);
      os << ")";
      first = false;
    }
    error(os.str());
  }

  Assembly out{std::move(prog_), std::move(debug_)};
  prog_ = Program{};
  debug_ = DebugInfo{};
  labels_.clear();
  return out;
}

Assembly Assembler::assemble_from_stream(std::istream& in, const std::string& name) {
  Assembler as(name);
  std::string line;
  while (std::getline(in, line)) as.feed_line(line);
  if (in.bad()) throw AssemblyError(name, as.lineno_, "error de lectura");
  return as.finish();
}

Assembly Assembler::assemble_from_string(const std::string& src, const std::string& name) {
  std::istringstream is(src);
  return assemble_from_stream(is, name);
}

// Ensambla desde archivo (abre y delega)
Assembly Assembler::assemble_from_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw AssemblyError(path, 0, "no se puede abrir el archivo");
  return assemble_from_stream(in, path);
}

} // namespace spvm
