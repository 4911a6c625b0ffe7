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
 * @file acceptor.hpp
 * @brief Listening endpoint: accept thread plus one lifecycle monitor per
 *        session.
 *
 * Usage:
 * @code
 *   tether::SessionRegistry registry;
 *   tether::AcceptorOptions opt;
 *   opt.port = 4444;
 *   tether::Acceptor acceptor(registry, opt);
 *   auto r = acceptor.Start();
 *   // ... operator console runs ...
 *   acceptor.Stop();
 * @endcode
 */

#ifndef TETHER_ACCEPTOR_HPP_
#define TETHER_ACCEPTOR_HPP_

#include "tether/log.hpp"
#include "tether/platform.hpp"
#include "tether/registry.hpp"
#include "tether/socket.hpp"
#include "tether/vocabulary.hpp"

#if TETHER_HAS_NETWORK

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tether {

constexpr uint16_t kDefaultListenPort = 4444;
constexpr uint32_t kDefaultMonitorIntervalMs = 1000;

struct AcceptorOptions {
  std::string host = "0.0.0.0";
  uint16_t port = kDefaultListenPort;  ///< 0 picks an ephemeral port.
  uint32_t monitor_interval_ms = kDefaultMonitorIntervalMs;
  int32_t backlog = kDefaultBacklog;
};

class Acceptor final {
 public:
  Acceptor(SessionRegistry& registry, AcceptorOptions options = AcceptorOptions())
      : registry_(registry), options_(std::move(options)) {}

  ~Acceptor() { Stop(); }

  Acceptor(const Acceptor&) = delete;
  Acceptor& operator=(const Acceptor&) = delete;

  /**
   * @brief Bind, listen and spawn the accept thread.
   * @return kAlreadyRunning when started twice; otherwise the failing step.
   */
  inline expected<void, AcceptorError> Start();

  /**
   * @brief Stop accepting, close every session and join every thread.
   *
   * Safe to call when not running.
   */
  inline void Stop();

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /** @brief Bound port (the real one when 0 was requested). */
  uint16_t Port() const noexcept { return bound_port_; }

  /** @brief Monitor threads not yet reaped (testing aid). */
  size_t MonitorCount() {
    std::lock_guard<std::mutex> lock(monitor_mtx_);
    return monitors_.size();
  }

 private:
  struct Monitor {
    SessionId id = 0;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  inline void AcceptLoop();
  inline void MonitorLoop(SessionId id, std::shared_ptr<std::atomic<bool>> done);
  inline void ReapMonitors();

  SessionRegistry& registry_;
  AcceptorOptions options_;
  TcpListener listener_;
  uint16_t bound_port_ = 0;
  std::thread accept_thread_;
  std::atomic<bool> running_{false};

  std::mutex monitor_mtx_;
  std::vector<Monitor> monitors_;

  std::mutex wake_mtx_;
  std::condition_variable wake_cv_;
};

// ============================================================================
// Acceptor inline implementation
// ============================================================================

inline expected<void, AcceptorError> Acceptor::Start() {
  using Result = expected<void, AcceptorError>;
  if (running_.load(std::memory_order_acquire)) {
    return Result::error(AcceptorError::kAlreadyRunning);
  }

  auto addr = SocketAddress::FromIpv4(options_.host.c_str(), options_.port);
  if (!addr.has_value()) {
    TETHER_LOG_ERROR("ACCEPTOR", "invalid listen address '%s'",
                     options_.host.c_str());
    return Result::error(AcceptorError::kAddressInvalid);
  }

  auto listener = TcpListener::Create();
  if (!listener.has_value()) {
    return Result::error(AcceptorError::kSocketFailed);
  }
  TcpListener sock = std::move(listener.value());

  if (!sock.SetReuseAddr(true).has_value()) {
    TETHER_LOG_WARN("ACCEPTOR", "SO_REUSEADDR not applied");
  }
  if (!sock.Bind(addr.value()).has_value()) {
    TETHER_LOG_ERROR("ACCEPTOR", "bind %s:%u failed (errno=%d)",
                     options_.host.c_str(), options_.port, errno);
    return Result::error(AcceptorError::kBindFailed);
  }
  if (!sock.Listen(options_.backlog).has_value()) {
    return Result::error(AcceptorError::kListenFailed);
  }

  listener_ = std::move(sock);
  bound_port_ = listener_.LocalPort();
  running_.store(true, std::memory_order_release);
  accept_thread_ = std::thread([this]() { AcceptLoop(); });

  TETHER_LOG_INFO("ACCEPTOR", "listening on %s:%u", options_.host.c_str(),
                  bound_port_);
  return Result::success();
}

inline void Acceptor::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  // Unblock accept() before joining, then release the fd.
  listener_.Shutdown();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  listener_.Close();

  {
    std::lock_guard<std::mutex> lock(wake_mtx_);
  }
  wake_cv_.notify_all();
  registry_.Clear();

  std::vector<Monitor> pending;
  {
    std::lock_guard<std::mutex> lock(monitor_mtx_);
    pending.swap(monitors_);
  }
  for (auto& m : pending) {
    if (m.thread.joinable()) m.thread.join();
  }
  TETHER_LOG_INFO("ACCEPTOR", "stopped");
}

inline void Acceptor::AcceptLoop() {
  while (running_.load(std::memory_order_acquire)) {
    SocketAddress peer_addr;
    auto accepted = listener_.Accept(peer_addr);
    if (!accepted.has_value()) {
      if (!running_.load(std::memory_order_acquire)) break;
      TETHER_LOG_WARN("ACCEPTOR", "accept failed (errno=%d)", errno);
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    if (!running_.load(std::memory_order_acquire)) {
      break;
    }

    PeerAddress peer{peer_addr.Host(), peer_addr.Port()};
    const SessionId id = registry_.Register(std::move(accepted.value()), peer);
    TETHER_LOG_INFO("ACCEPTOR", "session %u opened from %s:%u", id,
                    peer.host.c_str(), peer.port);

    ReapMonitors();
    auto done = std::make_shared<std::atomic<bool>>(false);
    Monitor m;
    m.id = id;
    m.done = done;
    m.thread = std::thread([this, id, done]() { MonitorLoop(id, done); });
    std::lock_guard<std::mutex> lock(monitor_mtx_);
    monitors_.push_back(std::move(m));
  }
}

inline void Acceptor::MonitorLoop(SessionId id,
                                  std::shared_ptr<std::atomic<bool>> done) {
  const auto interval = std::chrono::milliseconds(options_.monitor_interval_ms);
  for (;;) {
    if (!registry_.Contains(id)) break;
    std::unique_lock<std::mutex> lock(wake_mtx_);
    if (wake_cv_.wait_for(lock, interval, [this]() {
          return !running_.load(std::memory_order_acquire);
        })) {
      break;
    }
  }
  (void)registry_.Remove(id);
  TETHER_LOG_INFO("ACCEPTOR", "Session %u closed", id);
  done->store(true, std::memory_order_release);
}

inline void Acceptor::ReapMonitors() {
  std::vector<Monitor> finished;
  {
    std::lock_guard<std::mutex> lock(monitor_mtx_);
    for (auto it = monitors_.begin(); it != monitors_.end();) {
      if (it->done->load(std::memory_order_acquire)) {
        finished.push_back(std::move(*it));
        it = monitors_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& m : finished) {
    if (m.thread.joinable()) m.thread.join();
  }
}

}  // namespace tether

#endif  // TETHER_HAS_NETWORK

#endif  // TETHER_ACCEPTOR_HPP_
