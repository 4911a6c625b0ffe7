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
 * @file channel.hpp
 * @brief Half-duplex command/response exchange over one session.
 *
 * Wire format: the command is written with a trailing '\n'; the reply is
 * every byte read until the sentinel shows up, the peer closes, or the
 * deadline elapses. Nothing at or after the sentinel is returned.
 *
 * A failed write or a broken read removes the session from the registry.
 * Removal happens after the exchange lock is released (Session::Close()
 * must not run under it).
 */

#ifndef TETHER_CHANNEL_HPP_
#define TETHER_CHANNEL_HPP_

#include "tether/log.hpp"
#include "tether/normalizer.hpp"
#include "tether/registry.hpp"
#include "tether/session.hpp"
#include "tether/vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace tether {

constexpr uint32_t kDefaultSettleMs = 400;
constexpr uint32_t kDefaultReplyTimeoutMs = 10000;
constexpr size_t kRecvChunkSize = 8192;

struct ChannelOptions {
  std::string sentinel = kDefaultSentinel;
  uint32_t settle_ms = kDefaultSettleMs;    ///< Pause after each write.
  uint32_t timeout_ms = kDefaultReplyTimeoutMs;
};

/** @brief Why a Receive() stopped reading. */
enum class ReplyEnd : uint8_t {
  kSentinel = 0,
  kTimeout,
  kPeerClosed,
  kError,
};

inline const char* ToString(ReplyEnd e) noexcept {
  switch (e) {
    case ReplyEnd::kSentinel: return "sentinel";
    case ReplyEnd::kTimeout: return "timeout";
    case ReplyEnd::kPeerClosed: return "peer closed";
    case ReplyEnd::kError: return "read error";
  }
  return "unknown";
}

struct Reply {
  std::string text;
  ReplyEnd end = ReplyEnd::kTimeout;

  /** @brief True when the connection is no longer usable. */
  bool Broken() const noexcept {
    return end == ReplyEnd::kPeerClosed || end == ReplyEnd::kError;
  }
};

class CommandChannel final {
 public:
  explicit CommandChannel(SessionRegistry& registry,
                          ChannelOptions options = ChannelOptions())
      : registry_(registry), options_(std::move(options)) {}

  const ChannelOptions& Options() const noexcept { return options_; }

  /**
   * @brief Write @p text plus '\n', then wait the settle delay.
   * @return false on any write error (the session is then removed).
   */
  bool Send(Session& session, const std::string& text) {
    bool ok;
    {
      std::lock_guard<std::mutex> lock(session.ExchangeMutex());
      ok = !session.IsClosed() && SendLocked(session, text);
    }
    if (!ok) Drop(session, "send failed");
    return ok;
  }

  /** @brief Read one reply; see ReplyEnd for the stop conditions. */
  Reply Receive(Session& session, uint32_t timeout_ms) {
    Reply reply;
    {
      std::lock_guard<std::mutex> lock(session.ExchangeMutex());
      if (session.IsClosed()) {
        reply.end = ReplyEnd::kError;
      } else {
        reply = ReceiveLocked(session, timeout_ms);
      }
    }
    if (reply.Broken()) Drop(session, ToString(reply.end));
    return reply;
  }

  Reply Receive(Session& session) {
    return Receive(session, options_.timeout_ms);
  }

  /**
   * @brief One send + receive pair, never interleaved with another exchange
   *        on the same session.
   *
   * A reply that ended by timeout is still a success; the caller gets the
   * partial text. A reply cut short by peer close or a read error is
   * kRecvFailed and the session is removed.
   */
  expected<Reply, ChannelError> Exchange(Session& session,
                                         const std::string& text,
                                         uint32_t timeout_ms) {
    using Result = expected<Reply, ChannelError>;
    Reply reply;
    bool send_failed = false;
    {
      std::lock_guard<std::mutex> lock(session.ExchangeMutex());
      if (session.IsClosed()) {
        return Result::error(ChannelError::kSessionClosed);
      }
      if (!SendLocked(session, text)) {
        send_failed = true;
      } else {
        reply = ReceiveLocked(session, timeout_ms);
      }
    }
    if (send_failed) {
      Drop(session, "send failed");
      return Result::error(ChannelError::kSendFailed);
    }
    if (reply.Broken()) {
      Drop(session, ToString(reply.end));
      return Result::error(ChannelError::kRecvFailed);
    }
    return Result::success(std::move(reply));
  }

  expected<Reply, ChannelError> Exchange(Session& session,
                                         const std::string& text) {
    return Exchange(session, text, options_.timeout_ms);
  }

  /** @return Reply text, or empty when the exchange failed. */
  std::string Execute(Session& session, const std::string& text,
                      uint32_t timeout_ms) {
    auto r = Exchange(session, text, timeout_ms);
    if (!r.has_value()) {
      TETHER_LOG_DEBUG("CHANNEL", "session %u: '%s' -> %s", session.Id(),
                       text.c_str(), ToString(r.get_error()));
      return std::string();
    }
    return std::move(r.value().text);
  }

  std::string Execute(Session& session, const std::string& text) {
    return Execute(session, text, options_.timeout_ms);
  }

 private:
  bool SendLocked(Session& session, const std::string& text) {
    TcpSocket& sock = session.Socket();
    const size_t stale = sock.DiscardPending();
    if (stale > 0) {
      TETHER_LOG_DEBUG("CHANNEL", "session %u: discarded %zu stale bytes",
                       session.Id(), stale);
    }
    std::string line = text;
    line.push_back('\n');
    auto r = sock.SendAll(line.data(), line.size());
    if (!r.has_value()) {
      return false;
    }
    if (options_.settle_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(options_.settle_ms));
    }
    return true;
  }

  Reply ReceiveLocked(Session& session, uint32_t timeout_ms) {
    using Clock = std::chrono::steady_clock;
    TcpSocket& sock = session.Socket();
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    const std::string& sentinel = options_.sentinel;

    Reply reply;
    char chunk[kRecvChunkSize];
    for (;;) {
      const auto now = Clock::now();
      if (now >= deadline) {
        reply.end = ReplyEnd::kTimeout;
        break;
      }
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - now);
      const int32_t wait_ms = static_cast<int32_t>(left.count()) + 1;

      auto ready = sock.WaitReadable(wait_ms);
      if (!ready.has_value()) {
        if (ready.get_error() == SocketError::kTimeout) continue;
        reply.end = ReplyEnd::kError;
        break;
      }
      auto n = sock.Recv(chunk, sizeof(chunk));
      if (!n.has_value()) {
        if (n.get_error() == SocketError::kWouldBlock) continue;
        reply.end = ReplyEnd::kError;
        break;
      }
      if (n.value() == 0) {
        reply.end = ReplyEnd::kPeerClosed;
        break;
      }
      reply.text.append(chunk, static_cast<size_t>(n.value()));
      if (!sentinel.empty()) {
        const size_t pos = reply.text.find(sentinel);
        if (pos != std::string::npos) {
          reply.text.resize(pos);
          reply.end = ReplyEnd::kSentinel;
          break;
        }
      }
    }
    return reply;
  }

  void Drop(Session& session, const char* reason) {
    if (registry_.Remove(session.Id())) {
      TETHER_LOG_WARN("CHANNEL", "session %u dropped: %s", session.Id(),
                      reason);
    }
  }

  SessionRegistry& registry_;
  ChannelOptions options_;
};

}  // namespace tether

#endif  // TETHER_CHANNEL_HPP_
