#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream> // logs
#include <syncstream>

namespace cfg
{
    // Stdout/stderr sincronizados para logs
    #define SOUT  std::osyncstream(std::cout)
    #define SERR  std::osyncstream(std::cerr)

    // --- Formato binario (.SPVM) ---
    inline constexpr std::array<char, 5> kMagic = {'.', 'S', 'P', 'V', 'M'};
    inline constexpr std::size_t kHeaderBytes  = 8; // cantidad de instrucciones, u64 LE
    inline constexpr std::size_t kOpcodeBytes  = 2; // id de opcode, u16 LE
    inline constexpr std::size_t kOperandBytes = 8; // operando de PUSH, i64 LE

    // Código de salida cuando la máquina termina por falla
    inline constexpr int kFaultExitCode = 255;

    // Respuesta que aborta en un breakpoint (se compara sin mayúsculas)
    inline constexpr const char* kAbortShort = "n";
    inline constexpr const char* kAbortLong  = "no";

    // --- Flags de log rápidos ---
    inline constexpr bool kLogAsm    = false; // labels y relocaciones
    inline constexpr bool kLogVM     = true;  // traza por instrucción (solo con --verbose)
    inline constexpr bool kLogBinary = false; // guardado/carga de .SPVM
    inline constexpr bool kLogMain   = true;  // mensajes del frontend (solo con --verbose)

    // Macro simple de logging condicional
    #define LOG_IF(flag, msg)        \
        do {                         \
            if (flag) {              \
                SERR << msg << '\n'; \
            }                        \
        } while (0)
} // namespace cfg
