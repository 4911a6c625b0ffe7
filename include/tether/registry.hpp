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
 * @file registry.hpp
 * @brief Thread-safe map from session id to live Session.
 *
 * Writers (Register / Remove / Clear) take the lock exclusively, readers
 * (Get / Contains / List / Size) share it. Ids start at 1, are allocated
 * under the writer lock and are never handed out twice, so the sequence is
 * strictly increasing even when several threads register at once.
 *
 * Sessions are handed out as shared_ptr: a caller mid-exchange keeps its
 * Session alive after Remove(); the socket is shut down by Remove() and the
 * fd released once the last owner lets go.
 */

#ifndef TETHER_REGISTRY_HPP_
#define TETHER_REGISTRY_HPP_

#include "tether/log.hpp"
#include "tether/session.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace tether {

class SessionRegistry final {
 public:
  SessionRegistry() = default;
  ~SessionRegistry() { Clear(); }

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  /**
   * @brief Take ownership of a connected socket and assign it an id.
   * @return The new session id (> 0).
   */
  SessionId Register(TcpSocket socket, const PeerAddress& peer) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    const SessionId id = next_id_++;
    sessions_.emplace(id, std::make_shared<Session>(
                              id, std::move(socket), peer,
                              std::chrono::system_clock::now()));
    return id;
  }

  /**
   * @brief Drop a session and close its connection.
   *
   * Idempotent: removing an unknown (or already removed) id returns false and
   * touches nothing.
   */
  bool Remove(SessionId id) {
    std::shared_ptr<Session> victim;
    {
      std::unique_lock<std::shared_mutex> lock(mtx_);
      auto it = sessions_.find(id);
      if (it == sessions_.end()) {
        return false;
      }
      victim = std::move(it->second);
      sessions_.erase(it);
    }
    (void)victim->Close();
    TETHER_LOG_DEBUG("REGISTRY", "session %u removed", id);
    return true;
  }

  /** @return The session, or nullptr when @p id is not registered. */
  std::shared_ptr<Session> Get(SessionId id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = sessions_.find(id);
    return (it != sessions_.end()) ? it->second : nullptr;
  }

  bool Contains(SessionId id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return sessions_.find(id) != sessions_.end();
  }

  /** @brief Snapshot of every live session, ordered by id. */
  std::vector<SessionInfo> List() const {
    std::vector<SessionInfo> out;
    std::shared_lock<std::shared_mutex> lock(mtx_);
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
      out.push_back(kv.second->Info());
    }
    return out;
  }

  size_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return sessions_.size();
  }

  /** @brief Remove every session (shutdown path). */
  void Clear() {
    std::map<SessionId, std::shared_ptr<Session>> drained;
    {
      std::unique_lock<std::shared_mutex> lock(mtx_);
      drained.swap(sessions_);
    }
    for (auto& kv : drained) {
      (void)kv.second->Close();
    }
  }

 private:
  mutable std::shared_mutex mtx_;
  std::map<SessionId, std::shared_ptr<Session>> sessions_;
  SessionId next_id_ = 1;
};

}  // namespace tether

#endif  // TETHER_REGISTRY_HPP_
