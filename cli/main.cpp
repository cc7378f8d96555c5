/**
 * @file main.cpp
 * @brief unimix-cli - offline diagnostics for the unimix binary frame protocol.
 *
 * Responsibilities (exactly one per run):
 *  - --debug-binary <hex>   analyze one frame field by field (markers, length, CRC, payload).
 *  - --debug-file <path>    replay a capture through FrameAssembler; print every frame,
 *                           every counted error and the statistics summary.
 *  - --encode <json>        build a frame (type from --type, default 1) and analyze it.
 *  - --crc-variants <text>  the wire CRC next to the usual wrong variants.
 *  - --list-ports           candidate serial devices.
 *
 * Notes:
 *  - Hex input accepts "7E 07 00", "7E0700" and "7E-07-00".
 *  - Capture lines may start with "RX"; "TX" lines and '#' comments are skipped.
 *  - Errors go to stderr as "status=error reason=...", exit code 2.
 */

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "unimix/frame_assembler.hpp"
#include "unimix/frame_codec.hpp"
#include "unimix/frame_debug.hpp"
#include "unimix/log.hpp"
#include "unimix/protocol_statistics.hpp"
#include "unimix/serial_io.hpp"

using json = nlohmann::json;

// ---------- commands ----------

static int cmd_debug_binary(const std::string& hex) {
  std::vector<uint8_t> bytes;
  std::string err;
  if (!unimix::parse_hex_bytes(hex, bytes, err)) {
    std::cerr << "status=error " << err << "\n";
    return 2;
  }
  const auto a = unimix::analyze_frame(bytes);
  std::cout << "raw: " << unimix::to_hex(bytes) << "\n" << unimix::format_analysis(a);
  return a.ok() ? 0 : 1;
}

// "RX 7E 07 ..." -> "7E 07 ..."; TX and comment lines -> skipped (false)
static bool capture_line(std::string line, std::string& hex) {
  const auto hash = line.find('#');
  if (hash != std::string::npos) line.erase(hash);
  const auto b = line.find_first_not_of(" \t\r");
  if (b == std::string::npos) return false;
  line.erase(0, b);

  if (line.rfind("TX", 0) == 0) return false;
  if (line.rfind("RX", 0) == 0) {
    line.erase(0, 2);
    if (!line.empty() && line[0] == ':') line.erase(0, 1);
  }
  hex = line;
  return true;
}

static int cmd_debug_file(const std::string& path, size_t max_payload) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "status=error reason=cannot_open path=" << path << "\n";
    return 2;
  }

  unimix::ProtocolStatistics stats;
  unimix::FrameAssembler assembler(max_payload, /*timeout_ms*/0, &stats);

  std::string line, hex, err;
  size_t line_no = 0, frame_no = 0;
  std::vector<uint8_t> chunk;

  while (std::getline(in, line)) {
    ++line_no;
    if (!capture_line(line, hex)) continue;
    if (!unimix::parse_hex_bytes(hex, chunk, err)) {
      std::cerr << "status=error line=" << line_no << " " << err << "\n";
      return 2;
    }

    auto out = assembler.feed(chunk, line_no);
    for (const auto& e : out.errors)
      std::cout << "line " << line_no << ": error reason=" << unimix::to_string(e) << "\n";

    for (const auto& f : out.frames) {
      ++frame_no;
      const auto wire = unimix::frame::encode(f.type, f.payload.data(), f.payload.size());
      std::cout << "--- frame " << frame_no << " (line " << line_no << ") ---\n"
                << unimix::format_analysis(unimix::analyze_frame(wire));
    }
  }

  if (assembler.pending() > 0)
    std::cout << "unresolved bytes at end: " << assembler.pending() << "\n";
  std::cout << "summary: " << stats.summary() << "\n";
  return 0;
}

static int cmd_encode(const std::string& text, int type) {
  json doc = json::parse(text, nullptr, /*allow_exceptions*/false);
  if (doc.is_discarded()) {
    std::cerr << "status=error reason=invalid_json\n";
    return 2;
  }
  const std::string payload = doc.dump();
  if (payload.size() > unimix::frame::MAX_PAYLOAD_LIMIT) {
    std::cerr << "status=error reason=payload_too_large size=" << payload.size() << "\n";
    return 2;
  }

  const auto wire = unimix::frame::encode((uint8_t)type, payload);
  std::cout << "frame: " << unimix::to_hex(wire) << "\n"
            << unimix::format_analysis(unimix::analyze_frame(wire));
  return 0;
}

static int cmd_crc_variants(const std::string& text) {
  const auto* p = reinterpret_cast<const uint8_t*>(text.data());
  std::cout << "payload: " << text << "\n"
            << "bytes:   " << unimix::to_hex(p, text.size()) << "\n"
            << unimix::format_crc_variants(unimix::crc_variants(p, text.size()));
  return 0;
}

static int cmd_list_ports() {
  const auto ports = unimix::list_serial_ports();
  if (ports.empty()) {
    std::cerr << "status=error reason=no_ports\n";
    return 1;
  }
  for (const auto& p : ports)
    std::cout << "path=" << p.path << " dev=" << p.device << " stable=" << (p.stable ? 1 : 0) << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"unimix protocol diagnostics"};

  std::string debug_hex, debug_file, encode_json, crc_text;
  int type = unimix::frame::TYPE_JSON;
  size_t max_payload = unimix::frame::MAX_PAYLOAD_LIMIT;
  bool list_ports = false;

  app.add_option("--debug-binary", debug_hex, "Analyze one frame given as hex");
  app.add_option("--debug-file", debug_file, "Replay a hex capture through the frame assembler");
  app.add_option("--encode", encode_json, "Encode a JSON payload into a frame");
  app.add_option("--type", type, "Frame type byte for --encode")->check(CLI::Range(0, 255));
  app.add_option("--max-payload", max_payload, "Max payload for --debug-file")
      ->check(CLI::Range(size_t{1}, unimix::frame::MAX_PAYLOAD_LIMIT));
  app.add_option("--crc-variants", crc_text, "Compare CRC variants over this text");
  app.add_flag("--list-ports", list_ports, "List candidate serial devices");

  CLI11_PARSE(app, argc, argv);

  int cmds = 0;
  cmds += !debug_hex.empty() ? 1 : 0;
  cmds += !debug_file.empty() ? 1 : 0;
  cmds += !encode_json.empty() ? 1 : 0;
  cmds += !crc_text.empty() ? 1 : 0;
  cmds += list_ports ? 1 : 0;

  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }

  if (!debug_hex.empty())   return cmd_debug_binary(debug_hex);
  if (!debug_file.empty())  return cmd_debug_file(debug_file, max_payload);
  if (!encode_json.empty()) return cmd_encode(encode_json, type);
  if (!crc_text.empty())    return cmd_crc_variants(crc_text);
  return cmd_list_ports();
}
