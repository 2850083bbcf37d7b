#pragma once
/**
 * @file slip.hpp
 * @brief SLIP framing (RFC 1055) for envelopes on byte-stream transports.
 *
 * TCP gives a byte stream; the engine wants whole envelopes. Each envelope is
 * wrapped as END payload END, with END/ESC bytes inside the payload escaped:
 *
 *   0xC0 (END) -> 0xDB 0xDC
 *   0xDB (ESC) -> 0xDB 0xDD
 *
 * Header-only.
 */

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace dtchat::slip {

constexpr uint8_t END     = 0xC0;
constexpr uint8_t ESC     = 0xDB;
constexpr uint8_t ESC_END = 0xDC;
constexpr uint8_t ESC_ESC = 0xDD;

/// Frame @p n bytes at @p in as one SLIP packet.
inline std::vector<uint8_t> encode(const uint8_t* in, size_t n) {
  std::vector<uint8_t> out;
  out.reserve(n + n / 8 + 2);
  out.push_back(END);
  for (size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];
    if (b == END)      { out.push_back(ESC); out.push_back(ESC_END); }
    else if (b == ESC) { out.push_back(ESC); out.push_back(ESC_ESC); }
    else               { out.push_back(b); }
  }
  out.push_back(END);
  return out;
}

inline std::vector<uint8_t> encode(const std::vector<uint8_t>& payload) {
  return encode(payload.data(), payload.size());
}

/**
 * @brief Incremental decoder. Feed whatever read() returned; collect frames.
 *
 * Empty frames (back-to-back END) are skipped. A bad escape drops the frame
 * in progress and the decoder waits for the next END.
 */
class Decoder {
public:
  /// Decode @p n bytes, appending every completed payload to @p frames.
  /// @return number of frames appended.
  size_t feed(const uint8_t* data, size_t n, std::vector<std::vector<uint8_t>>& frames) {
    size_t produced = 0;
    for (size_t i = 0; i < n; ++i) {
      if (push(data[i])) {
        frames.push_back(std::move(buf_));
        buf_.clear();
        ++produced;
      }
    }
    return produced;
  }

  /// Bytes buffered for the frame in progress.
  size_t pending() const { return buf_.size(); }

  void reset() {
    buf_.clear();
    esc_ = false;
    dropping_ = false;
  }

private:
  // true when a non-empty frame just closed in buf_
  bool push(uint8_t b) {
    if (b == END) {
      const bool complete = !dropping_ && !buf_.empty();
      if (!complete) buf_.clear();
      esc_ = false;
      dropping_ = false;
      return complete;
    }
    if (dropping_) return false;

    if (esc_) {
      esc_ = false;
      if      (b == ESC_END) buf_.push_back(END);
      else if (b == ESC_ESC) buf_.push_back(ESC);
      else { buf_.clear(); dropping_ = true; }   // protocol error
      return false;
    }
    if (b == ESC) { esc_ = true; return false; }
    buf_.push_back(b);
    return false;
  }

  std::vector<uint8_t> buf_;
  bool esc_{false};
  bool dropping_{false};
};

} // namespace dtchat::slip
