#pragma once

#include "util/branch.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

// namespace text — UTF-8 boundary repair for raw PTY byte streams.
//
// Terminal output arrives in arbitrary read-sized pieces, so a multi-byte code
// point is routinely split across two reads. The reassembler keeps such a tail
// for the next read and replaces malformed sequences with U+FFFD. Nothing else
// is interpreted: escape sequences pass through untouched.
namespace text {

inline constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

// Result of validating a byte range.
// - valid_up_to: length of the longest valid prefix
// - error_len: length of the malformed subsequence starting at valid_up_to, or
//   nullopt when the range is valid up to its end or ends inside a sequence
//   that may still be completed
struct Utf8Scan {
  std::size_t valid_up_to = 0;
  std::optional<std::size_t> error_len;
};

// Validates per the Unicode "maximal subpart" rule: each malformed run that is
// reported is 1..3 bytes long and is replaced by a single U+FFFD.
inline Utf8Scan ScanUtf8(std::string_view s) {
  const std::size_t len = s.size();
  auto byte = [&s](std::size_t k) { return static_cast<unsigned char>(s[k]); };
  std::size_t i = 0;
  while (i < len) {
    const unsigned char lead = byte(i);
    if (PTYRUN_LIKELY(lead < 0x80)) {
      ++i;
      continue;
    }
    std::size_t width = 0;
    // Allowed range of the first continuation byte; excludes overlong forms,
    // surrogates and code points above U+10FFFF.
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      width = 2;
    } else if (lead == 0xE0) {
      width = 3;
      lo = 0xA0;
    } else if (lead == 0xED) {
      width = 3;
      hi = 0x9F;
    } else if (lead >= 0xE1 && lead <= 0xEF) {
      width = 3;
    } else if (lead == 0xF0) {
      width = 4;
      lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
      width = 4;
    } else if (lead == 0xF4) {
      width = 4;
      hi = 0x8F;
    } else {
      return {i, 1};
    }
    if (i + 1 >= len) {
      return {i, std::nullopt};
    }
    if (byte(i + 1) < lo || byte(i + 1) > hi) {
      return {i, 1};
    }
    for (std::size_t k = 2; k < width; ++k) {
      if (i + k >= len) {
        return {i, std::nullopt};
      }
      if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) {
        return {i, k};
      }
    }
    i += width;
  }
  return {len, std::nullopt};
}

// Utf8Reassembler
// Usage (single thread):
//   n = read(fd, r.ReadPtr(), r.ReadCapacity());
//   out = r.Commit(n);      // valid text, possibly empty
//   ...
//   out = r.Finish();       // at EOF
// The buffer holds one read plus 4 bytes of slack. A carried tail is at most 3
// bytes (an incomplete 4-byte sequence), so a full read always fits behind it
// and every Commit makes progress.
class Utf8Reassembler {
public:
  static constexpr std::size_t kReadChunk = 4096;
  static constexpr std::size_t kSlack = 4;

  char *ReadPtr() { return buf_.data() + len_; }
  std::size_t ReadCapacity() const { return kReadChunk; }
  std::size_t Pending() const { return len_; }

  // Accounts for `n` bytes just written at ReadPtr() and returns every
  // complete character, with malformed runs replaced.
  std::string Commit(std::size_t n) {
    len_ += n;
    std::string out;
    std::size_t pos = 0;
    while (pos < len_) {
      const Utf8Scan scan = ScanUtf8(Window(pos));
      out.append(buf_.data() + pos, scan.valid_up_to);
      pos += scan.valid_up_to;
      if (!scan.error_len.has_value()) {
        break;
      }
      out.append(kReplacement);
      pos += *scan.error_len;
    }
    Consume(pos);
    return out;
  }

  // Copies `raw` through the buffer in read-sized pieces.
  std::string Feed(std::string_view raw) {
    std::string out;
    while (!raw.empty()) {
      const std::size_t n = std::min(raw.size(), ReadCapacity());
      std::memcpy(ReadPtr(), raw.data(), n);
      out += Commit(n);
      raw.remove_prefix(n);
    }
    return out;
  }

  // End of stream: whatever is still pending can no longer be completed and
  // becomes a replacement marker.
  std::string Finish() {
    std::string out;
    std::size_t pos = 0;
    while (pos < len_) {
      const Utf8Scan scan = ScanUtf8(Window(pos));
      out.append(buf_.data() + pos, scan.valid_up_to);
      pos += scan.valid_up_to;
      if (pos == len_) {
        break;
      }
      out.append(kReplacement);
      pos += scan.error_len.value_or(len_ - pos);
    }
    len_ = 0;
    return out;
  }

private:
  std::string_view Window(std::size_t pos) const {
    return {buf_.data() + pos, len_ - pos};
  }

  void Consume(std::size_t n) {
    if (n == 0) {
      return;
    }
    std::memmove(buf_.data(), buf_.data() + n, len_ - n);
    len_ -= n;
  }

  std::array<char, kReadChunk + kSlack> buf_{};
  std::size_t len_ = 0;
};

} // namespace text
