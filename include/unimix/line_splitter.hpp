#pragma once
/**
 * @file line_splitter.hpp
 * @brief Text-mode framing: split inbound bytes into JSON lines.
 *
 * @details
 * Two framings, chosen by Protocol.TextFraming:
 *   Newline  one message per line; '\r' is stripped and blank lines skipped.
 *            A line is cut to start at its first '{'. Lines with no '{' at
 *            all are console chatter (boot banners, debug prints) and are
 *            skipped, not reported.
 *   Markers  one message per <MSG>...</MSG> pair; bytes outside a pair are
 *            ignored (newlines between messages included).
 *
 * Partial input is kept across feed() calls. A pending line (or open marker
 * body) longer than max_len is a BufferOverflow: it is discarded and the
 * splitter skips to the next delimiter.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "unimix/errors.hpp"

namespace unimix {

enum class TextFraming : uint8_t { Newline, Markers };

const char* to_string(TextFraming f);

/// "newline" / "markers" (case-insensitive). Returns false on anything else.
bool parse_text_framing(const std::string& s, TextFraming& out);

struct SplitOutput {
  std::vector<std::string> lines;
  std::vector<ErrorKind> errors;
  size_t skipped = 0;   ///< newline framing: lines without a JSON object
};

class LineSplitter {
public:
  static constexpr const char* OPEN_MARKER  = "<MSG>";
  static constexpr const char* CLOSE_MARKER = "</MSG>";

  LineSplitter(TextFraming framing, size_t max_len);

  SplitOutput feed(const uint8_t* data, size_t n);
  SplitOutput feed(const std::string& s) {
    return feed(reinterpret_cast<const uint8_t*>(s.data()), s.size());
  }

  void reset();

  size_t pending() const { return pending_.size(); }
  TextFraming framing() const { return framing_; }

  /// Wrap one outbound payload for this framing (adds the terminator).
  std::string wrap(const std::string& payload) const;

private:
  void feed_newline(char c, SplitOutput& out);
  void feed_markers(char c, SplitOutput& out);

  TextFraming framing_;
  size_t max_len_;
  std::string pending_;
  bool discarding_ = false;   // overflowed; skip until next delimiter
  bool in_body_ = false;      // markers: between <MSG> and </MSG>
};

} // namespace unimix
