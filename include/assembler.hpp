#pragma once
#include "isa.hpp"
#include "debug_info.hpp"
#include <istream>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

//
// Ensamblador de la máquina de pila.
// Toma texto (string, stream o archivo) y lo convierte en un Program + DebugInfo.
//
// Sintaxis por línea:
//   ; comentario
//   LABEL:
//   PUSH  IMM64          // decimal, -decimal o 0xHEX
//   PUSH  LABEL          // dirección del label (se reloca si aún no existe)
//   POP | DUP | SWAP | ADD | SUB | MUL | DIV
//   JZ | JNZ | JMP | CALL // destino desde la pila
//   PRINTOUT | PRINTSTR | EXIT
//   @PushStr "texto\n"   // empuja la cadena al revés, con terminador 0
//   @Break               // breakpoint en la dirección actual
//
// Notas rápidas:
// - Una sola pasada con tabla de relocaciones (equivale a dos pasadas)
// - Los mnemónicos no distinguen mayúsculas; labels y metainstrucciones sí
// - Cualquier error lanza AssemblyError con archivo y línea
//

namespace spvm {

// Resultado de ensamblar: código + metadatos de depuración.
struct Assembly {
  Program   program;
  DebugInfo debug;
};

class Assembler {
public:
  explicit Assembler(std::string file = "<string>");

  // Ensambla directamente desde una cadena completa.
  static Assembly assemble_from_string(const std::string& src,
                                       const std::string& name = "<string>");

  // Lee línea a línea desde un stream.
  static Assembly assemble_from_stream(std::istream& in, const std::string& name);

  // Abre el archivo y ensambla su contenido.
  static Assembly assemble_from_file(const std::string& path);

  // Procesa la siguiente línea de fuente (cuenta líneas desde 1).
  void feed_line(const std::string& line);

  // Cierra el ensamblado: falla si quedan labels sin resolver.
  Assembly finish();

private:
  using Tokens = std::vector<std::string>;

  void parse_label(const Tokens& tok);
  void parse_meta(const Tokens& tok);
  void parse_instruction(const Tokens& tok);

  void push_string(const Tokens& tok);

  // Dirección de un label; si no existe todavía registra la relocación y devuelve 0.
  Value label_addr(const std::string& label, Addr instruction_addr);

  // Literal "..." ya unido -> bytes sin comillas, con escapes resueltos.
  std::string unescape(const std::string& literal) const;

  [[noreturn]] void error(const std::string& msg) const;

  Addr here() const { return static_cast<Addr>(prog_.code.size()); }

  // Quita espacios al inicio y al final.
  static std::string trim(const std::string& s);

  // ¿s empieza con p?
  static bool        starts_with(const std::string& s, const std::string& p);

  // Nombre de label aceptable (no puede confundirse con un número).
  static bool        valid_label(const std::string& name);

  std::string file_;
  std::size_t lineno_ = 0;

  Program   prog_;
  DebugInfo debug_;

  std::unordered_map<std::string, Addr>     labels_; // label -> dirección
  std::map<std::string, std::vector<Addr>>  relocs_; // label pendiente -> PUSHs que lo usan
};

} // namespace spvm
