#include "binary.hpp"
#include "config.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <vector>

namespace spvm
{

// ---------- Guardado ----------

void Binary::save(const Program& p, std::ostream& out, const std::string& name) {
  std::vector<std::uint8_t> buf;
  buf.reserve(cfg::kMagic.size() + cfg::kHeaderBytes + p.code.size() * encoded_size(OpCode::PUSH));

  buf.insert(buf.end(), cfg::kMagic.begin(), cfg::kMagic.end());

  // Header de ancho fijo: u64 little-endian, no depende del host
  const auto count = static_cast<std::uint64_t>(p.code.size());
  for (std::size_t i = 0; i < cfg::kHeaderBytes; ++i)
    buf.push_back(static_cast<std::uint8_t>(count >> (8 * i)));

  for (const auto& ins : p.code) encode(ins, buf);

  out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  out.flush();
  if (!out) throw SaveError(name, "no se pudo escribir el binario");

  LOG_IF(cfg::kLogBinary, "[Binary] " << name << ": " << p.code.size()
                                      << " instrucciones, " << buf.size() << " bytes");
}

void Binary::save_to_file(const Program& p, const std::string& path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw SaveError(path, "no se puede crear el archivo");
  save(p, out, path);
}

// ---------- Carga ----------

Program Binary::load(std::istream& in, const std::string& name) {
  std::array<char, cfg::kMagic.size()> magic{};
  in.read(magic.data(), static_cast<std::streamsize>(magic.size()));
  if (in.gcount() != static_cast<std::streamsize>(magic.size()) || magic != cfg::kMagic)
    throw LoadError(name, "formato de archivo incorrecto");

  std::array<std::uint8_t, cfg::kHeaderBytes> hdr{};
  in.read(reinterpret_cast<char*>(hdr.data()), static_cast<std::streamsize>(hdr.size()));
  if (in.gcount() != static_cast<std::streamsize>(hdr.size()))
    throw LoadError(name, "archivo truncado en el header");

  std::uint64_t count = 0;
  for (std::size_t i = 0; i < cfg::kHeaderBytes; ++i)
    count |= static_cast<std::uint64_t>(hdr[i]) << (8 * i);

  // Resto del archivo a memoria y se decodifica registro por registro
  std::vector<std::uint8_t> body{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) throw LoadError(name, "error de lectura");

  Program p;
  // count viene del archivo: no reservar más de lo que el cuerpo puede contener
  p.code.reserve(static_cast<std::size_t>(
      std::min<std::uint64_t>(count, body.size() / cfg::kOpcodeBytes)));

  std::size_t off = 0;
  for (std::uint64_t i = 0; i < count; ++i) {
    auto d = decode(body.data() + off, body.size() - off);
    switch (d.status) {
      case DecodeStatus::Ok:
        break;
      case DecodeStatus::Truncated:
        throw LoadError(name, "archivo truncado en la instrucción " + std::to_string(i)
                              + " de " + std::to_string(count));
      case DecodeStatus::UnknownOpcode:
        throw LoadError(name, "no existe el opcode " + std::to_string(d.id)
                              + " (instrucción " + std::to_string(i) + ")");
    }
    p.code.push_back(d.instr);
    off += d.size;
  }

  LOG_IF(cfg::kLogBinary, "[Binary] " << name << ": cargadas " << p.code.size() << " instrucciones");
  return p;
}

Program Binary::load_from_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw LoadError(path, "no se puede abrir el archivo");
  return load(in, path);
}

} // namespace spvm
