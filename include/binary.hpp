#pragma once
#include "isa.hpp"
#include <istream>
#include <ostream>
#include <string>

//
// Contenedor binario .SPVM
//
//   [5B magic ".SPVM"][8B u64 LE: cantidad de instrucciones][registros...]
//   registro = [2B u16 LE id][8B i64 LE operando, solo PUSH]
//
// Sin compresión, checksum ni versión. Labels y breakpoints no se guardan.
// Al cargar, cualquier problema (magic, truncado, opcode desconocido, E/S) lanza LoadError;
// al guardar, los fallos de creación/escritura lanzan SaveError.
//

namespace spvm {

class Binary {
public:
  static void    save(const Program& p, std::ostream& out, const std::string& name = "<stream>");
  static void    save_to_file(const Program& p, const std::string& path);

  static Program load(std::istream& in, const std::string& name = "<stream>");
  static Program load_from_file(const std::string& path);
};

} // namespace spvm
