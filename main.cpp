#include "assembler.hpp"
#include "binary.hpp"
#include "config.hpp"
#include "stack_machine.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

static void usage(std::ostream& os) {
  os << "uso: spvm [-a] [-r] [-v] [-d] [-o salida.spvm] <archivo>\n"
        "  -a, --assemble     el archivo es fuente (.spasm); si no, binario .SPVM\n"
        "  -r, --run          ejecuta el programa\n"
        "  -v, --verbose      desensamblado, traza y breakpoints interactivos\n"
        "  -d, --disassemble  imprime el programa como fuente ensamblable\n"
        "  -o <ruta>          guarda el programa como binario .SPVM\n"
        "  -h, --help         esta ayuda\n";
}

/**
 * Modos:
 *   - spvm -a prog.spasm -o prog.spvm   ensambla y guarda
 *   - spvm -a -r prog.spasm             ensambla y ejecuta
 *   - spvm -r prog.spvm                 carga el binario y ejecuta
 * Cualquier error de ensamblado/carga/ejecución -> stderr y código 1.
 */
int main(int argc, char **argv)
{
  bool assemble = false;
  bool run = false;
  bool verbose = false;
  bool disassemble = false;
  std::optional<std::string> outPath;
  std::string filePath;

  // Parse simple de argumentos: el primer no-flag es el path
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--assemble" || a == "-a") {
      assemble = true;
    } else if (a == "--run" || a == "-r") {
      run = true;
    } else if (a == "--verbose" || a == "-v") {
      verbose = true;
    } else if (a == "--disassemble" || a == "-d") {
      disassemble = true;
    } else if (a == "-o") {
      if (i + 1 >= argc) { usage(std::cerr); return 1; }
      outPath = argv[++i];
    } else if (a == "--help" || a == "-h") {
      usage(std::cout);
      return 0;
    } else if (!a.empty() && a.front() == '-') {
      SERR << "[Main] flag desconocido: " << a << "\n";
      usage(std::cerr);
      return 1;
    } else {
      filePath = a;
    }
  }

  if (filePath.empty()) {
    usage(std::cerr);
    return 1;
  }

  try {
    spvm::Program program;
    spvm::DebugInfo debug;

    if (assemble) {
      LOG_IF(cfg::kLogMain && verbose, "[Main] Ensamblando: " << filePath);
      auto res = spvm::Assembler::assemble_from_file(filePath);
      program = std::move(res.program);
      debug = std::move(res.debug);
    } else {
      LOG_IF(cfg::kLogMain && verbose, "[Main] Cargando binario: " << filePath);
      program = spvm::Binary::load_from_file(filePath);
    }
    debug.set_verbose(verbose);

    if (disassemble)
      std::cout << spvm::to_source(program);

    if (run) {
      spvm::StackMachine machine(std::move(debug));
      int code = machine.run(program);
      SOUT << "[simulación terminada con código " << code << "]\n";
    } else if (outPath) {
      spvm::Binary::save_to_file(program, *outPath);
      LOG_IF(cfg::kLogMain && verbose, "[Main] Guardado en: " << *outPath);
    }
  } catch (const std::runtime_error& e) {
    SERR << e.what() << "\n";
    return 1;
  }

  return 0;
}
