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
 * @file console.hpp
 * @brief Operator REPL over an input/output stream pair.
 *
 * Top level:
 *   sessions | interact <id> | kill <id> | help | exit
 *
 * Inside a session (prompt "tether[<id>]> "):
 *   background | help | modules | run <module> | download <path> | close
 *   anything else is sent verbatim and the reply printed.
 *
 * Everything runs on the caller's thread; Run() returns on "exit" or EOF.
 */

#ifndef TETHER_CONSOLE_HPP_
#define TETHER_CONSOLE_HPP_

#include "tether/channel.hpp"
#include "tether/log.hpp"
#include "tether/modules.hpp"
#include "tether/normalizer.hpp"
#include "tether/registry.hpp"
#include "tether/transfer.hpp"

#include <cstdint>
#include <cstdlib>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace tether {

namespace detail {

inline std::string ToLower(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
  }
  return s;
}

/**
 * @brief Split "verb rest of line" at the first blank.
 *
 * The verb is lowered; the remainder is trimmed and, when wrapped in double
 * quotes, unwrapped. Inner text is never re-tokenised.
 */
inline std::pair<std::string, std::string> SplitVerb(const std::string& line) {
  const std::string s = Trim(line);
  const size_t blank = s.find_first_of(" \t");
  if (blank == std::string::npos) {
    return {ToLower(s), std::string()};
  }
  std::string rest = Trim(s.substr(blank + 1));
  if (rest.size() >= 2 && rest.front() == '"' && rest.back() == '"') {
    rest = rest.substr(1, rest.size() - 2);
  }
  return {ToLower(s.substr(0, blank)), std::move(rest)};
}

/** @brief Positive decimal id; anything else is rejected. */
inline optional<SessionId> ParseSessionId(const std::string& text) {
  if (text.empty() || text.size() > 10) return optional<SessionId>();
  for (char c : text) {
    if (c < '0' || c > '9') return optional<SessionId>();
  }
  const unsigned long long v = std::strtoull(text.c_str(), nullptr, 10);
  if (v == 0 || v > 0xFFFFFFFFULL) return optional<SessionId>();
  return optional<SessionId>(static_cast<SessionId>(v));
}

}  // namespace detail

class Console final {
 public:
  Console(SessionRegistry& registry, CommandChannel& channel,
          ModuleDispatcher& dispatcher, FileTransfer& transfer,
          std::istream& in, std::ostream& out)
      : registry_(registry),
        channel_(channel),
        dispatcher_(dispatcher),
        transfer_(transfer),
        in_(in),
        out_(out) {}

  Console(const Console&) = delete;
  Console& operator=(const Console&) = delete;

  void Run() {
    out_ << "\n=== tether console ===\n"
         << "Commands: sessions, interact <id>, kill <id>, help, exit\n\n";
    std::string line;
    for (;;) {
      out_ << "tether> " << std::flush;
      if (!std::getline(in_, line)) break;
      if (!HandleLine(line)) break;
    }
  }

  /** @return false when the operator asked to exit. */
  bool HandleLine(const std::string& line) {
    const auto cmd = detail::SplitVerb(line);
    const std::string& verb = cmd.first;
    if (verb.empty()) return true;

    if (verb == "sessions") {
      ListSessions();
    } else if (verb == "interact") {
      if (cmd.second.empty()) {
        out_ << "[!] Usage: interact <id>\n";
      } else {
        auto id = detail::ParseSessionId(cmd.second);
        if (!id.has_value()) {
          out_ << "[!] Invalid ID\n";
        } else {
          Interact(id.value());
        }
      }
    } else if (verb == "kill") {
      auto id = detail::ParseSessionId(cmd.second);
      if (!id.has_value()) {
        out_ << "[!] Invalid ID\n";
      } else if (registry_.Remove(id.value())) {
        out_ << "[*] Session " << id.value() << " terminated\n";
      } else {
        out_ << "[!] Session " << id.value() << " not found\n";
      }
    } else if (verb == "help") {
      out_ << "Commands: sessions, interact <id>, kill <id>, help, exit\n";
    } else if (verb == "exit") {
      return false;
    } else {
      out_ << "[!] Unknown: " << Trim(line) << '\n';
    }
    return true;
  }

  void ListSessions() {
    const auto sessions = registry_.List();
    if (sessions.empty()) {
      out_ << "[*] No sessions\n";
      return;
    }
    out_ << "\nActive Sessions:\n" << std::string(70, '=') << '\n';
    for (const auto& s : sessions) {
      out_ << "  [" << s.id << "] " << s.peer.host << ':' << s.peer.port
           << " - " << s.created << '\n';
    }
    out_ << std::string(70, '=') << '\n';
  }

  /** @brief Session sub-loop; returns on background, close, EOF or loss. */
  void Interact(SessionId id) {
    std::shared_ptr<Session> session = registry_.Get(id);
    if (session == nullptr) {
      out_ << "[!] Session " << id << " not found\n";
      return;
    }
    out_ << "\n[*] Session " << id << '\n';
    PrintModules();

    std::string line;
    for (;;) {
      if (!registry_.Contains(id)) {
        out_ << "[!] Session " << id << " closed\n";
        return;
      }
      out_ << "tether[" << id << "]> " << std::flush;
      if (!std::getline(in_, line)) return;
      const auto cmd = detail::SplitVerb(line);
      const std::string& verb = cmd.first;
      if (verb.empty()) continue;

      if (verb == "background") {
        return;
      } else if (verb == "help") {
        out_ << "Commands: background, modules, run <module>, "
                "download <path>, close, <any remote command>\n";
      } else if (verb == "modules") {
        PrintModules();
      } else if (verb == "run" && !cmd.second.empty()) {
        RunModule(*session, detail::ToLower(cmd.second));
      } else if (verb == "download" && !cmd.second.empty()) {
        Download(*session, cmd.second);
      } else if (verb == "close") {
        (void)registry_.Remove(id);
        out_ << "[*] Session " << id << " terminated\n";
        return;
      } else {
        auto reply = channel_.Exchange(*session, line);
        if (!reply.has_value()) {
          out_ << "[!] " << ToString(reply.get_error()) << '\n';
          continue;
        }
        const std::string text =
            CleanOutput(reply.value().text, channel_.Options().sentinel);
        if (!text.empty()) out_ << text << '\n';
      }
    }
  }

 private:
  void PrintModules() {
    out_ << "[*] Modules:";
    for (const auto& name : ModuleDispatcher::ModuleNames()) {
      out_ << ' ' << name;
    }
    out_ << "\n";
  }

  void RunModule(Session& session, const std::string& name) {
    auto r = dispatcher_.Run(name, session);
    if (!r.has_value()) {
      out_ << "[!] Unknown module: " << name << '\n';
      return;
    }
    out_ << "\n[*] " << name << '\n';
    RenderFindings(r.value(), out_);
    out_ << "[+] Complete\n";
  }

  void Download(Session& session, const std::string& path) {
    out_ << "[*] Downloading: " << path << '\n';
    auto r = transfer_.Fetch(session, path);
    if (!r.has_value()) {
      out_ << "[!] " << ToString(r.get_error()) << '\n';
      return;
    }
    const TransferResult& res = r.value();
    if (res.remote_size.has_value()) {
      out_ << "[*] Remote size: " << res.remote_size.value() << " bytes\n";
    }
    out_ << "[+] Saved: " << res.local_path << " (" << res.bytes_written
         << " bytes)\n";
    if (!res.preview.empty()) {
      out_ << "[*] Preview:\n";
      for (const auto& l : res.preview) out_ << l << '\n';
      if (res.preview_truncated) out_ << "... (truncated)\n";
    }
  }

  SessionRegistry& registry_;
  CommandChannel& channel_;
  ModuleDispatcher& dispatcher_;
  FileTransfer& transfer_;
  std::istream& in_;
  std::ostream& out_;
};

}  // namespace tether

#endif  // TETHER_CONSOLE_HPP_
