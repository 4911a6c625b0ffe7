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
 * @file transfer.hpp
 * @brief Pull one remote file over the text channel.
 *
 * Four steps, each one exchange on the session:
 *   1. existence check   -- reply must contain the marker, else kNotFound
 *   2. size probe        -- advisory only, failure leaves the size unknown
 *   3. content transfer  -- base64 text, one or more long lines
 *   4. decode + persist  -- strict decode, exclusive create, never overwrite
 *
 * Any failure aborts the transfer but leaves the session usable.
 */

#ifndef TETHER_TRANSFER_HPP_
#define TETHER_TRANSFER_HPP_

#include "tether/base64.hpp"
#include "tether/channel.hpp"
#include "tether/log.hpp"
#include "tether/normalizer.hpp"
#include "tether/session.hpp"
#include "tether/vocabulary.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace tether {

constexpr uint32_t kMaxCollisionSuffix = 9999;

struct TransferOptions {
  std::string exists_command = "if exist \"{path}\" echo EXISTS";
  std::string exists_marker = "EXISTS";
  std::string size_command =
      "powershell -Command \"(Get-Item '{path}').Length\"";
  std::string content_command =
      "powershell -Command \"$b64=[Convert]::ToBase64String("
      "[IO.File]::ReadAllBytes('{path}'));Write-Output $b64\"";
  uint32_t probe_timeout_ms = 3000;
  uint32_t content_timeout_ms = 30000;
  size_t min_payload_line = 20;  ///< Shorter clean lines are prompt noise.
  size_t min_blob = 10;
  std::string output_dir = ".";
  size_t preview_lines = 20;
  std::vector<std::string> text_extensions = {"txt", "log", "csv", "ini",
                                              "cfg", "json", "xml"};
};

struct TransferResult {
  std::string remote_path;
  optional<uint64_t> remote_size;  ///< From the size probe, when it parsed.
  std::string local_path;
  size_t bytes_written = 0;
  std::vector<std::string> preview;
  bool preview_truncated = false;
};

// ============================================================================
// Helpers
// ============================================================================

/** @brief Replace every "{path}" in @p tmpl with @p path. */
inline std::string ExpandPath(const std::string& tmpl,
                              const std::string& path) {
  static const std::string kToken = "{path}";
  std::string out;
  out.reserve(tmpl.size() + path.size());
  size_t start = 0;
  size_t pos;
  while ((pos = tmpl.find(kToken, start)) != std::string::npos) {
    out.append(tmpl, start, pos - start);
    out += path;
    start = pos + kToken.size();
  }
  out.append(tmpl, start, std::string::npos);
  return out;
}

/** @brief Final component of a remote path ('\\' or '/' separated). */
inline std::string RemoteBasename(const std::string& remote_path) {
  const size_t sep = remote_path.find_last_of("\\/");
  std::string base = (sep == std::string::npos)
                         ? remote_path
                         : remote_path.substr(sep + 1);
  base = Trim(base);
  return base.empty() ? std::string("download.bin") : base;
}

/** @brief "downloaded_<YYYYmmdd_HHMMSS>_<basename>". */
inline std::string ArtifactName(const std::string& basename,
                                std::chrono::system_clock::time_point when) {
  return "downloaded_" + FormatWallclock(when, "%Y%m%d_%H%M%S") + "_" +
         basename;
}

/** @return {stem, ".ext"}; a leading dot does not start an extension. */
inline std::pair<std::string, std::string> SplitExtension(
    const std::string& name) {
  const size_t dot = name.find_last_of('.');
  if (dot == std::string::npos || dot == 0) {
    return {name, std::string()};
  }
  return {name.substr(0, dot), name.substr(dot)};
}

inline bool IsTextExtension(const std::string& name,
                            const std::vector<std::string>& extensions) {
  const std::string ext = SplitExtension(name).second;
  if (ext.size() < 2) return false;
  const std::string bare = ext.substr(1);
  for (const auto& e : extensions) {
    if (e.size() == bare.size() && ContainsIgnoreCase(bare, e)) return true;
  }
  return false;
}

/** @brief Non-negative decimal, nothing else on the line. */
inline optional<uint64_t> ParseSize(const std::string& line) {
  const std::string s = Trim(line);
  if (s.empty() || s.size() > 20) return optional<uint64_t>();
  for (char c : s) {
    if (c < '0' || c > '9') return optional<uint64_t>();
  }
  errno = 0;
  const unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
  if (errno == ERANGE) return optional<uint64_t>();
  return optional<uint64_t>(static_cast<uint64_t>(v));
}

/**
 * @brief Create @p name under @p dir without replacing anything.
 *
 * On a clash "-1", "-2", ... is inserted before the extension. The file is
 * opened with "wbx" so a concurrent writer cannot be clobbered either.
 * @return Path of the file written.
 */
inline expected<std::string, TransferError> WriteExclusive(
    const std::string& dir, const std::string& name,
    const std::vector<uint8_t>& data) {
  using Result = expected<std::string, TransferError>;
  const auto parts = SplitExtension(name);
  const std::string prefix =
      (dir.empty() || dir.back() == '/') ? dir : dir + "/";

  for (uint32_t n = 0; n <= kMaxCollisionSuffix; ++n) {
    const std::string candidate =
        (n == 0) ? name : parts.first + "-" + std::to_string(n) + parts.second;
    const std::string path = prefix + candidate;
    std::FILE* fp = std::fopen(path.c_str(), "wbx");
    if (fp == nullptr) {
      if (errno == EEXIST) continue;
      TETHER_LOG_ERROR("TRANSFER", "cannot create '%s' (errno=%d)",
                       path.c_str(), errno);
      return Result::error(TransferError::kWriteFailed);
    }
    const size_t written =
        data.empty() ? 0 : std::fwrite(data.data(), 1, data.size(), fp);
    const bool closed = (std::fclose(fp) == 0);
    if (written != data.size() || !closed) {
      (void)std::remove(path.c_str());
      TETHER_LOG_ERROR("TRANSFER", "short write to '%s'", path.c_str());
      return Result::error(TransferError::kWriteFailed);
    }
    return Result::success(path);
  }
  TETHER_LOG_ERROR("TRANSFER", "no free name for '%s'", name.c_str());
  return Result::error(TransferError::kWriteFailed);
}

// ============================================================================
// FileTransfer
// ============================================================================

class FileTransfer final {
 public:
  explicit FileTransfer(CommandChannel& channel,
                        TransferOptions options = TransferOptions())
      : channel_(channel), options_(std::move(options)) {}

  const TransferOptions& Options() const noexcept { return options_; }

  expected<TransferResult, TransferError> Fetch(
      Session& session, const std::string& remote_path) {
    using Result = expected<TransferResult, TransferError>;
    const std::string& sentinel = channel_.Options().sentinel;

    TransferResult result;
    result.remote_path = remote_path;

    // 1. existence
    const std::string exists = CleanOutput(
        channel_.Execute(session,
                         ExpandPath(options_.exists_command, remote_path),
                         options_.probe_timeout_ms),
        sentinel);
    if (!Contains(exists, options_.exists_marker)) {
      TETHER_LOG_WARN("TRANSFER", "session %u: '%s' not found", session.Id(),
                      remote_path.c_str());
      return Result::error(TransferError::kNotFound);
    }

    // 2. size (advisory)
    result.remote_size = ParseSize(FirstLine(
        channel_.Execute(session,
                         ExpandPath(options_.size_command, remote_path),
                         options_.probe_timeout_ms),
        sentinel));

    // 3. content
    const std::vector<std::string> lines = CleanLines(
        channel_.Execute(session,
                         ExpandPath(options_.content_command, remote_path),
                         options_.content_timeout_ms),
        sentinel);
    std::string blob;
    for (const auto& line : lines) {
      if (line.size() > options_.min_payload_line) blob += line;
    }
    if (blob.size() < options_.min_blob) {
      TETHER_LOG_WARN("TRANSFER", "session %u: no payload for '%s'",
                      session.Id(), remote_path.c_str());
      return Result::error(TransferError::kEmptyPayload);
    }

    // 4. decode + persist
    auto decoded = Base64Decode(blob);
    if (!decoded.has_value() || decoded.value().empty()) {
      TETHER_LOG_WARN("TRANSFER", "session %u: payload of %zu chars rejected",
                      session.Id(), blob.size());
      return Result::error(TransferError::kDecodeFailed);
    }
    const std::vector<uint8_t>& bytes = decoded.value();

    if (result.remote_size.has_value() &&
        result.remote_size.value() != bytes.size()) {
      TETHER_LOG_WARN("TRANSFER",
                      "'%s': remote reports %llu bytes, received %zu",
                      remote_path.c_str(),
                      static_cast<unsigned long long>(
                          result.remote_size.value()),
                      bytes.size());
    }

    const std::string basename = RemoteBasename(remote_path);
    auto written =
        WriteExclusive(options_.output_dir,
                       ArtifactName(basename, std::chrono::system_clock::now()),
                       bytes);
    if (!written.has_value()) {
      return Result::error(written.get_error());
    }
    result.local_path = std::move(written.value());
    result.bytes_written = bytes.size();

    if (IsTextExtension(basename, options_.text_extensions)) {
      BuildPreview(bytes, result);
    }

    TETHER_LOG_INFO("TRANSFER", "session %u: saved '%s' (%zu bytes)",
                    session.Id(), result.local_path.c_str(),
                    result.bytes_written);
    return Result::success(std::move(result));
  }

 private:
  void BuildPreview(const std::vector<uint8_t>& bytes,
                    TransferResult& result) const {
    std::string text(bytes.begin(), bytes.end());
    if (!text.empty() && text.back() == '\n') text.pop_back();
    size_t start = 0;
    while (start <= text.size()) {
      if (result.preview.size() == options_.preview_lines) {
        result.preview_truncated = true;
        break;
      }
      size_t end = text.find('\n', start);
      if (end == std::string::npos) end = text.size();
      std::string line = text.substr(start, end - start);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      result.preview.push_back(std::move(line));
      start = end + 1;
    }
  }

  CommandChannel& channel_;
  TransferOptions options_;
};

}  // namespace tether

#endif  // TETHER_TRANSFER_HPP_
