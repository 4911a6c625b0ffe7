/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file base64.hpp
 * @brief Strict RFC 4648 base64 (standard alphabet, '=' padding).
 *
 * The decoder never guesses: a truncated or corrupted payload is an error,
 * not a shorter buffer. Whitespace between characters is skipped because the
 * payload arrives over a line-oriented channel.
 */

#ifndef TETHER_BASE64_HPP_
#define TETHER_BASE64_HPP_

#include "tether/vocabulary.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace tether {

namespace detail {

constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int8_t kB64Invalid = -1;
constexpr int8_t kB64Pad = -2;
constexpr int8_t kB64Space = -3;

inline const std::array<int8_t, 256>& Base64DecodeTable() {
  static const std::array<int8_t, 256> table = [] {
    std::array<int8_t, 256> t{};
    t.fill(kB64Invalid);
    for (int8_t i = 0; i < 64; ++i) {
      t[static_cast<uint8_t>(kBase64Alphabet[i])] = i;
    }
    t[static_cast<uint8_t>('=')] = kB64Pad;
    for (char c : {' ', '\t', '\r', '\n', '\f', '\v'}) {
      t[static_cast<uint8_t>(c)] = kB64Space;
    }
    return t;
  }();
  return table;
}

}  // namespace detail

inline std::string Base64Encode(const uint8_t* data, size_t len) {
  std::string out;
  out.reserve(((len + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 2 < len; i += 3) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8) |
                       static_cast<uint32_t>(data[i + 2]);
    out.push_back(detail::kBase64Alphabet[(v >> 18) & 0x3F]);
    out.push_back(detail::kBase64Alphabet[(v >> 12) & 0x3F]);
    out.push_back(detail::kBase64Alphabet[(v >> 6) & 0x3F]);
    out.push_back(detail::kBase64Alphabet[v & 0x3F]);
  }
  const size_t rest = len - i;
  if (rest == 1) {
    const uint32_t v = static_cast<uint32_t>(data[i]) << 16;
    out.push_back(detail::kBase64Alphabet[(v >> 18) & 0x3F]);
    out.push_back(detail::kBase64Alphabet[(v >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8);
    out.push_back(detail::kBase64Alphabet[(v >> 18) & 0x3F]);
    out.push_back(detail::kBase64Alphabet[(v >> 12) & 0x3F]);
    out.push_back(detail::kBase64Alphabet[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

inline std::string Base64Encode(const std::vector<uint8_t>& data) {
  return Base64Encode(data.data(), data.size());
}

/**
 * @brief Decode @p text.
 *
 * Rejected with CodecError::kInvalidInput: characters outside the alphabet,
 * a symbol count that is not a multiple of 4, padding anywhere but the last
 * one or two positions, data after padding, and non-zero bits in the final
 * partial group.
 */
inline expected<std::vector<uint8_t>, CodecError> Base64Decode(
    const std::string& text) {
  using Result = expected<std::vector<uint8_t>, CodecError>;
  const auto& table = detail::Base64DecodeTable();

  std::vector<uint8_t> out;
  out.reserve((text.size() / 4) * 3);

  uint8_t quad[4];
  uint32_t filled = 0;
  uint32_t pads = 0;
  bool finished = false;

  for (char ch : text) {
    const int8_t v = table[static_cast<uint8_t>(ch)];
    if (v == detail::kB64Space) continue;
    if (v == detail::kB64Invalid || finished) {
      return Result::error(CodecError::kInvalidInput);
    }
    if (v == detail::kB64Pad) {
      // '=' may only fill positions 2 and 3 of a group.
      if (filled < 2) return Result::error(CodecError::kInvalidInput);
      ++pads;
      quad[filled++] = 0;
    } else {
      if (pads > 0) return Result::error(CodecError::kInvalidInput);
      quad[filled++] = static_cast<uint8_t>(v);
    }
    if (filled < 4) continue;

    const uint32_t bits = (static_cast<uint32_t>(quad[0]) << 18) |
                          (static_cast<uint32_t>(quad[1]) << 12) |
                          (static_cast<uint32_t>(quad[2]) << 6) |
                          static_cast<uint32_t>(quad[3]);
    out.push_back(static_cast<uint8_t>((bits >> 16) & 0xFF));
    if (pads < 2) out.push_back(static_cast<uint8_t>((bits >> 8) & 0xFF));
    if (pads < 1) out.push_back(static_cast<uint8_t>(bits & 0xFF));

    if (pads == 2 && (quad[1] & 0x0F) != 0) {
      return Result::error(CodecError::kInvalidInput);
    }
    if (pads == 1 && (quad[2] & 0x03) != 0) {
      return Result::error(CodecError::kInvalidInput);
    }
    if (pads > 0) finished = true;
    filled = 0;
  }

  if (filled != 0) {
    return Result::error(CodecError::kInvalidInput);
  }
  return Result::success(std::move(out));
}

}  // namespace tether

#endif  // TETHER_BASE64_HPP_
