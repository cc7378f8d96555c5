// ============================================================================
// line_splitter.cpp - implementation for unimix/line_splitter.hpp
// ============================================================================

#include "unimix/line_splitter.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace unimix {

const char* to_string(TextFraming f) {
  return f == TextFraming::Markers ? "markers" : "newline";
}

bool parse_text_framing(const std::string& s, TextFraming& out) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (v == "newline") { out = TextFraming::Newline; return true; }
  if (v == "markers") { out = TextFraming::Markers; return true; }
  return false;
}

static bool ends_with(const std::string& s, const char* suffix) {
  const size_t n = std::strlen(suffix);
  return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

static bool only_space(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

LineSplitter::LineSplitter(TextFraming framing, size_t max_len)
  : framing_(framing), max_len_(max_len) {}

void LineSplitter::reset() {
  pending_.clear();
  discarding_ = false;
  in_body_ = false;
}

std::string LineSplitter::wrap(const std::string& payload) const {
  if (framing_ == TextFraming::Markers)
    return std::string(OPEN_MARKER) + payload + CLOSE_MARKER + "\n";
  return payload + "\n";
}

SplitOutput LineSplitter::feed(const uint8_t* data, size_t n) {
  SplitOutput out;
  if (!data) return out;
  for (size_t i = 0; i < n; ++i) {
    const char c = (char)data[i];
    if (framing_ == TextFraming::Newline) feed_newline(c, out);
    else                                  feed_markers(c, out);
  }
  return out;
}

// ---------------------------------------------------------------------------
// feed_newline()
// --------------
// '\n' terminates; '\r' anywhere is dropped. Blank lines produce nothing,
// and noise ahead of the first '{' is cut off.
// ---------------------------------------------------------------------------
void LineSplitter::feed_newline(char c, SplitOutput& out) {
  if (c == '\n') {
    if (!discarding_ && !pending_.empty() && !only_space(pending_)) {
      const auto brace = pending_.find('{');
      if (brace == std::string::npos) ++out.skipped;
      else                            out.lines.push_back(pending_.substr(brace));
    }
    pending_.clear();
    discarding_ = false;
    return;
  }
  if (c == '\r' || discarding_) return;

  pending_.push_back(c);
  if (pending_.size() > max_len_) {
    out.errors.push_back(ErrorKind::BufferOverflow);
    pending_.clear();
    discarding_ = true;
  }
}

// ---------------------------------------------------------------------------
// feed_markers()
// --------------
// Outside a body, only the tail needed to recognize <MSG> is kept.
// Inside, bytes accumulate until the buffer ends with </MSG>.
// ---------------------------------------------------------------------------
void LineSplitter::feed_markers(char c, SplitOutput& out) {
  pending_.push_back(c);

  if (!in_body_) {
    if (ends_with(pending_, OPEN_MARKER)) {
      in_body_ = true;
      discarding_ = false;
      pending_.clear();
      return;
    }
    const size_t keep = std::strlen(OPEN_MARKER) - 1;
    if (pending_.size() > keep) pending_.erase(0, pending_.size() - keep);
    return;
  }

  if (ends_with(pending_, CLOSE_MARKER)) {
    if (!discarding_) {
      std::string body = pending_.substr(0, pending_.size() - std::strlen(CLOSE_MARKER));
      if (!only_space(body)) out.lines.push_back(body);
    }
    pending_.clear();
    in_body_ = false;
    discarding_ = false;
    return;
  }

  if (discarding_) {
    // keep only enough to spot the close marker
    const size_t keep = std::strlen(CLOSE_MARKER);
    if (pending_.size() > keep) pending_.erase(0, pending_.size() - keep);
    return;
  }

  if (pending_.size() > max_len_ + std::strlen(CLOSE_MARKER)) {
    out.errors.push_back(ErrorKind::BufferOverflow);
    discarding_ = true;
    pending_.erase(0, pending_.size() - std::strlen(CLOSE_MARKER));
  }
}

} // namespace unimix
