#pragma once
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace spvm {

using Value = std::int64_t;   // celda de la pila (entero con signo de 64 bits)
using Addr  = std::uint64_t;  // índice de instrucción dentro del Program

enum class MachineState : std::uint8_t { Running, Halted, Faulted };

inline const char* to_string(MachineState s) {
  switch (s) {
    case MachineState::Running: return "running";
    case MachineState::Halted:  return "halted";
    case MachineState::Faulted: return "faulted";
  }
  return "?";
}

// Dirección en el formato de los dumps: 4 dígitos hex
inline std::string fmt_addr(Addr a) {
  std::ostringstream os;
  os << std::hex << std::setw(4) << std::setfill('0') << a;
  return os.str();
}

// ---------- Errores ----------
// Todos derivan de std::runtime_error; el frontend los atrapa arriba de todo.

// Línea de fuente mal formada o labels sin resolver.
class AssemblyError : public std::runtime_error {
public:
  AssemblyError(const std::string& file, std::size_t line, const std::string& msg)
    : std::runtime_error("Error de ensamblado: " + file + ":" + std::to_string(line) + ": " + msg),
      file_(file), line_(line), msg_(msg) {}

  const std::string& file() const { return file_; }
  std::size_t        line() const { return line_; }
  const std::string& message() const { return msg_; }

private:
  std::string file_;
  std::size_t line_;
  std::string msg_;
};

// Contenedor binario inválido (magic, registros) o fallo de E/S.
class LoadError : public std::runtime_error {
public:
  LoadError(const std::string& file, const std::string& msg)
    : std::runtime_error("Error de carga: " + file + ": " + msg), file_(file), msg_(msg) {}

  const std::string& file() const { return file_; }
  const std::string& message() const { return msg_; }

private:
  std::string file_;
  std::string msg_;
};

// No se pudo crear o escribir el binario de salida.
class SaveError : public std::runtime_error {
public:
  SaveError(const std::string& file, const std::string& msg)
    : std::runtime_error("Error de escritura: " + file + ": " + msg), file_(file), msg_(msg) {}

  const std::string& file() const { return file_; }
  const std::string& message() const { return msg_; }

private:
  std::string file_;
  std::string msg_;
};

// Falla en ejecución. mnemonic vacío si no había instrucción en addr.
class ExecutionFault : public std::runtime_error {
public:
  ExecutionFault(Addr addr, const std::string& mnemonic, const std::string& cause)
    : std::runtime_error("Panic: (@" + fmt_addr(addr) + ") "
                         + (mnemonic.empty() ? std::string() : mnemonic + ": ") + cause),
      addr_(addr), mnemonic_(mnemonic), cause_(cause) {}

  Addr               addr() const { return addr_; }
  const std::string& mnemonic() const { return mnemonic_; }
  const std::string& cause() const { return cause_; }

private:
  Addr        addr_;
  std::string mnemonic_;
  std::string cause_;
};

} // namespace spvm
