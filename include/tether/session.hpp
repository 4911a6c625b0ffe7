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
 * @file session.hpp
 * @brief One accepted remote endpoint: id, owned socket, peer, connect time.
 *
 * Every field is fixed at construction. The only state change is Close(),
 * guarded so that the socket is shut down exactly once no matter how many
 * paths (lifecycle monitor, operator, channel failure) race to close it.
 */

#ifndef TETHER_SESSION_HPP_
#define TETHER_SESSION_HPP_

#include "tether/platform.hpp"
#include "tether/socket.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>
#include <utility>

namespace tether {

using SessionId = uint32_t;

struct PeerAddress {
  std::string host;
  uint16_t port = 0;
};

/** @brief Immutable snapshot row for session listings. */
struct SessionInfo {
  SessionId id = 0;
  PeerAddress peer;
  std::string created;  ///< "YYYY-MM-DD HH:MM:SS", local time.
};

inline std::string FormatWallclock(std::chrono::system_clock::time_point tp,
                                   const char* fmt = "%Y-%m-%d %H:%M:%S") {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  struct tm tm_buf;
  ::localtime_r(&t, &tm_buf);
  char buf[64];
  size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_buf);
  return std::string(buf, n);
}

class Session final {
 public:
  Session(SessionId id, TcpSocket socket, PeerAddress peer,
          std::chrono::system_clock::time_point created)
      : id_(id),
        socket_(std::move(socket)),
        peer_(std::move(peer)),
        created_(created) {}

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  SessionId Id() const noexcept { return id_; }
  const PeerAddress& Peer() const noexcept { return peer_; }
  std::chrono::system_clock::time_point CreatedAt() const noexcept {
    return created_;
  }

  SessionInfo Info() const {
    SessionInfo info;
    info.id = id_;
    info.peer = peer_;
    info.created = FormatWallclock(created_);
    return info;
  }

  /**
   * @brief Terminate the connection.
   *
   * The first call shuts the socket down (waking a reader blocked on it) and
   * returns true; every later call is a no-op returning false. The fd itself
   * is released here when no exchange is in flight, otherwise when the last
   * owner drops the session. Must not be called by a thread that holds the
   * exchange lock.
   */
  bool Close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    socket_.Shutdown();
    std::unique_lock<std::mutex> lock(exchange_mtx_, std::try_to_lock);
    if (lock.owns_lock()) {
      socket_.Close();
    }
    return true;
  }

  bool IsClosed() const noexcept {
    return closed_.load(std::memory_order_acquire);
  }

  /// Serializes send + drain pairs; held by CommandChannel for one exchange.
  std::mutex& ExchangeMutex() noexcept { return exchange_mtx_; }

  /// Only valid while ExchangeMutex() is held.
  TcpSocket& Socket() noexcept { return socket_; }

 private:
  const SessionId id_;
  TcpSocket socket_;
  const PeerAddress peer_;
  const std::chrono::system_clock::time_point created_;
  std::atomic<bool> closed_{false};
  std::mutex exchange_mtx_;
};

}  // namespace tether

#endif  // TETHER_SESSION_HPP_
