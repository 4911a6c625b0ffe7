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
 * @file modules.hpp
 * @brief Named scripted operations: a fixed sequence of exchanges plus the
 *        heuristics that turn the replies into Findings.
 *
 * Each module kind is one alternative of ModuleKind; ModuleDispatcher maps a
 * name to the kind and std::visit runs it. A step whose exchange fails only
 * loses that step's data.
 */

#ifndef TETHER_MODULES_HPP_
#define TETHER_MODULES_HPP_

#include "tether/channel.hpp"
#include "tether/log.hpp"
#include "tether/normalizer.hpp"
#include "tether/registry.hpp"
#include "tether/session.hpp"
#include "tether/transfer.hpp"
#include "tether/vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace tether {

// ============================================================================
// Findings
// ============================================================================

struct Finding {
  std::string label;  ///< Empty for plain listing rows.
  std::string value;
  bool flagged = false;
};

struct FindingSection {
  std::string title;
  std::vector<Finding> items;
  std::string empty_note;    ///< Rendered when items is empty.
  bool unavailable = false;  ///< The exchange behind it failed.
};

struct Findings {
  std::string module;
  std::vector<FindingSection> sections;

  const FindingSection* Section(const std::string& title) const {
    for (const auto& s : sections) {
      if (s.title == title) return &s;
    }
    return nullptr;
  }
};

inline void RenderFindings(const Findings& findings, std::ostream& os) {
  for (const auto& section : findings.sections) {
    os << "[*] " << section.title;
    if (section.unavailable) os << " (unavailable)";
    os << '\n';
    if (section.items.empty()) {
      if (!section.empty_note.empty()) os << "    " << section.empty_note << '\n';
      continue;
    }
    for (const auto& item : section.items) {
      os << (item.flagged ? "[!] " : "    ");
      if (!item.label.empty()) os << item.label << ": ";
      os << item.value << '\n';
    }
  }
}

// ============================================================================
// Heuristics
// ============================================================================

enum class PrivilegeLevel : uint8_t {
  kUser = 0,
  kAdministrator,
};

inline const char* ToString(PrivilegeLevel level) noexcept {
  return (level == PrivilegeLevel::kUser) ? "USER" : "ADMINISTRATOR";
}

/** @brief An access-denied reply (English or French) means a plain user. */
inline PrivilegeLevel ClassifyPrivilege(const std::string& reply) {
  if (ContainsIgnoreCase(reply, "denied") || ContainsIgnoreCase(reply, "refus")) {
    return PrivilegeLevel::kUser;
  }
  return PrivilegeLevel::kAdministrator;
}

/** @brief Both the machine and the user policy value must read 0x1. */
inline bool IsAlwaysInstallElevated(const std::string& reply) {
  return CountOccurrences(reply, "0x1") >= 2;
}

inline bool IsImpersonateExploitable(const std::string& reply) {
  return Contains(reply, "SeImpersonate") && Contains(reply, "Enabled");
}

inline bool IsDangerousPrivilege(const std::string& line) {
  return Contains(line, "SeImpersonate") || Contains(line, "SeDebug");
}

// ============================================================================
// ModuleOptions
// ============================================================================

struct IdentityProbe {
  std::string command;
  std::string label;
};

/** @brief Remote command strings and limits; defaults target cmd.exe. */
struct ModuleOptions {
  // sysinfo
  std::vector<IdentityProbe> identity_probes = {
      {"hostname", "Hostname"},
      {"whoami", "User"},
      {"echo %COMPUTERNAME%", "Computer"},
      {"echo %USERDOMAIN%", "Domain"},
  };
  std::string privilege_command =
      "net session 2>&1 | findstr /C:\"Access is denied\" /C:\"accs refus\"";
  std::string os_command = "systeminfo | findstr /B /C:\"OS\" /C:\"System\"";
  size_t os_lines = 5;
  std::string av_command =
      "powershell -Command \"Get-CimInstance -Namespace "
      "root/SecurityCenter2 -ClassName AntivirusProduct | "
      "Select-Object -ExpandProperty displayName\" 2>$null";
  uint32_t av_timeout_ms = 8000;
  size_t av_lines = 3;

  // persist
  std::string run_key_command =
      "reg query HKCU\\Software\\Microsoft\\Windows\\CurrentVersion\\Run";
  size_t run_key_lines = 15;
  std::string startup_command =
      "dir \"%APPDATA%\\Microsoft\\Windows\\Start Menu\\Programs\\Startup\" /B";

  // privesc / autopwn
  std::string privileges_command = "whoami /priv | findstr /I \"Enabled\"";
  size_t privilege_lines = 15;
  std::string install_elevated_command =
      "reg query HKLM\\SOFTWARE\\Policies\\Microsoft\\Windows\\Installer "
      "/v AlwaysInstallElevated 2>nul && reg query "
      "HKCU\\SOFTWARE\\Policies\\Microsoft\\Windows\\Installer "
      "/v AlwaysInstallElevated 2>nul";
  std::string impersonate_command = "whoami /priv | findstr SeImpersonate";

  // network
  std::string connections_command =
      "netstat -ano | findstr ESTABLISHED | findstr /V \"127.0.0.1\"";
  size_t connection_lines = 20;

  // dump
  uint32_t pacing_ms = 1000;

  // collect (no default payload)
  std::string collect_command;
  std::string collect_marker;
  std::string collect_path;

  uint32_t timeout_ms = kDefaultReplyTimeoutMs;
};

// ============================================================================
// Module kinds
// ============================================================================

/** @brief Everything one module run needs; lives for a single dispatch. */
struct ModuleContext {
  CommandChannel& channel;
  FileTransfer& transfer;
  Session& session;
  const ModuleOptions& options;

  /** @return Clean reply lines, or the channel error. */
  expected<std::vector<std::string>, ChannelError> Lines(
      const std::string& command, uint32_t timeout_ms) {
    using Result = expected<std::vector<std::string>, ChannelError>;
    auto r = channel.Exchange(session, command, timeout_ms);
    if (!r.has_value()) return Result::error(r.get_error());
    return Result::success(CleanLines(r.value().text, channel.Options().sentinel));
  }

  expected<std::vector<std::string>, ChannelError> Lines(
      const std::string& command) {
    return Lines(command, options.timeout_ms);
  }

  /** @brief Clean text of the reply; empty on failure. */
  std::string Text(const std::string& command) {
    auto r = Lines(command);
    return r.has_value() ? JoinLines(r.value()) : std::string();
  }
};

namespace detail {

inline FindingSection ListingSection(
    std::string title, std::string empty_note,
    const expected<std::vector<std::string>, ChannelError>& lines,
    size_t limit) {
  FindingSection section;
  section.title = std::move(title);
  section.empty_note = std::move(empty_note);
  if (!lines.has_value()) {
    section.unavailable = true;
    return section;
  }
  for (const auto& line : lines.value()) {
    if (section.items.size() == limit) break;
    section.items.push_back(Finding{"", line, false});
  }
  return section;
}

}  // namespace detail

struct SysinfoModule {
  static constexpr const char* kName = "sysinfo";

  void Run(ModuleContext& ctx, Findings& out) const {
    const ModuleOptions& opt = ctx.options;

    FindingSection identity;
    identity.title = "System Information";
    for (const auto& probe : opt.identity_probes) {
      auto lines = ctx.Lines(probe.command);
      if (!lines.has_value()) identity.unavailable = true;
      if (lines.has_value() && !lines.value().empty()) {
        identity.items.push_back(
            Finding{probe.label, lines.value().front(), false});
      }
    }
    out.sections.push_back(std::move(identity));

    FindingSection privilege;
    privilege.title = "Privilege Level";
    auto reply = ctx.channel.Exchange(ctx.session, opt.privilege_command,
                                      opt.timeout_ms);
    if (reply.has_value()) {
      const PrivilegeLevel level = ClassifyPrivilege(reply.value().text);
      privilege.items.push_back(Finding{"Privileges", ToString(level),
                                        level == PrivilegeLevel::kAdministrator});
    } else {
      privilege.unavailable = true;
    }
    out.sections.push_back(std::move(privilege));

    out.sections.push_back(detail::ListingSection(
        "Operating System", "Unable to detect", ctx.Lines(opt.os_command),
        opt.os_lines));

    FindingSection av;
    av.title = "Antivirus";
    av.empty_note = "Unable to detect";
    auto av_lines = ctx.Lines(opt.av_command, opt.av_timeout_ms);
    av.unavailable = !av_lines.has_value();
    if (av_lines.has_value()) {
      for (const auto& line : av_lines.value()) {
        if (av.items.size() == opt.av_lines) break;
        if (Contains(line, "Get-CimInstance")) continue;
        av.items.push_back(Finding{"", line, false});
      }
    }
    out.sections.push_back(std::move(av));
  }
};

struct PersistModule {
  static constexpr const char* kName = "persist";

  void Run(ModuleContext& ctx, Findings& out) const {
    const ModuleOptions& opt = ctx.options;

    FindingSection run_keys;
    run_keys.title = "Registry Run Keys";
    run_keys.empty_note = "(Empty)";
    auto lines = ctx.Lines(opt.run_key_command);
    run_keys.unavailable = !lines.has_value();
    if (lines.has_value()) {
      for (const auto& line : lines.value()) {
        if (run_keys.items.size() == opt.run_key_lines) break;
        if (Contains(line, "REG_SZ")) {
          run_keys.items.push_back(Finding{"", line, false});
        }
      }
    }
    out.sections.push_back(std::move(run_keys));

    auto startup = ctx.Lines(opt.startup_command);
    out.sections.push_back(detail::ListingSection(
        "Startup Folder", "(Empty)", startup,
        startup.has_value() ? startup.value().size() : 0));
  }
};

struct PrivescModule {
  static constexpr const char* kName = "privesc";

  void Run(ModuleContext& ctx, Findings& out) const {
    const ModuleOptions& opt = ctx.options;

    FindingSection privs = detail::ListingSection(
        "Enabled Privileges", "No enabled privileges found",
        ctx.Lines(opt.privileges_command), opt.privilege_lines);
    for (auto& item : privs.items) {
      item.flagged = IsDangerousPrivilege(item.value);
    }
    out.sections.push_back(std::move(privs));

    FindingSection aie;
    aie.title = "AlwaysInstallElevated";
    auto reply = ctx.channel.Exchange(ctx.session, opt.install_elevated_command,
                                      opt.timeout_ms);
    if (reply.has_value()) {
      const bool vulnerable = IsAlwaysInstallElevated(reply.value().text);
      aie.items.push_back(Finding{"Status",
                                  vulnerable ? "VULNERABLE" : "Not vulnerable",
                                  vulnerable});
    } else {
      aie.unavailable = true;
    }
    out.sections.push_back(std::move(aie));
  }
};

struct AutopwnModule {
  static constexpr const char* kName = "autopwn";

  void Run(ModuleContext& ctx, Findings& out) const {
    const ModuleOptions& opt = ctx.options;

    FindingSection checks;
    checks.title = "Escalation Checks";

    // A check whose exchange failed reports nothing; the summary only
    // appears when every check ran.
    int hits = 0;
    auto aie = ctx.channel.Exchange(ctx.session, opt.install_elevated_command,
                                    opt.timeout_ms);
    if (aie.has_value()) {
      const bool hit = IsAlwaysInstallElevated(aie.value().text);
      hits += hit ? 1 : 0;
      checks.items.push_back(Finding{
          "AlwaysInstallElevated", hit ? "VULNERABLE" : "Not vulnerable", hit});
    } else {
      checks.unavailable = true;
    }

    auto imp = ctx.channel.Exchange(ctx.session, opt.impersonate_command,
                                    opt.timeout_ms);
    if (imp.has_value()) {
      const bool hit = IsImpersonateExploitable(imp.value().text);
      hits += hit ? 1 : 0;
      checks.items.push_back(Finding{
          "SeImpersonatePrivilege", hit ? "EXPLOITABLE" : "Not available", hit});
    } else {
      checks.unavailable = true;
    }

    if (!checks.unavailable) {
      checks.items.push_back(Finding{
          "Summary", std::to_string(hits) + " potential vector(s)", false});
    }
    out.sections.push_back(std::move(checks));
  }
};

struct NetworkModule {
  static constexpr const char* kName = "network";

  void Run(ModuleContext& ctx, Findings& out) const {
    out.sections.push_back(detail::ListingSection(
        "Active Connections", "No established connections",
        ctx.Lines(ctx.options.connections_command),
        ctx.options.connection_lines));
  }
};

struct DumpModule {
  static constexpr const char* kName = "dump";

  void Run(ModuleContext& ctx, Findings& out) const {
    SysinfoModule{}.Run(ctx, out);
    Pace(ctx);
    PersistModule{}.Run(ctx, out);
    Pace(ctx);
    PrivescModule{}.Run(ctx, out);
  }

 private:
  static void Pace(const ModuleContext& ctx) {
    if (ctx.options.pacing_ms > 0) {
      std::this_thread::sleep_for(
          std::chrono::milliseconds(ctx.options.pacing_ms));
    }
  }
};

/**
 * @brief Run an operator-configured command; when its reply carries the
 *        marker, pull the produced file with FileTransfer.
 */
struct CollectModule {
  static constexpr const char* kName = "collect";

  void Run(ModuleContext& ctx, Findings& out) const {
    const ModuleOptions& opt = ctx.options;
    FindingSection section;
    section.title = "Collect";
    if (opt.collect_command.empty()) {
      section.empty_note = "Not configured";
      out.sections.push_back(std::move(section));
      return;
    }

    auto lines = ctx.Lines(opt.collect_command);
    if (!lines.has_value()) {
      section.unavailable = true;
      out.sections.push_back(std::move(section));
      return;
    }
    const std::string text = JoinLines(lines.value());
    const bool produced = !opt.collect_marker.empty() &&
                          Contains(text, opt.collect_marker);
    if (!produced || opt.collect_path.empty()) {
      section.items.push_back(Finding{"Result", "No output produced", false});
      out.sections.push_back(std::move(section));
      return;
    }

    auto fetched = ctx.transfer.Fetch(ctx.session, opt.collect_path);
    if (fetched.has_value()) {
      section.items.push_back(
          Finding{"Saved", fetched.value().local_path, true});
      section.items.push_back(Finding{
          "Bytes", std::to_string(fetched.value().bytes_written), false});
    } else {
      section.items.push_back(
          Finding{"Transfer", ToString(fetched.get_error()), false});
    }
    out.sections.push_back(std::move(section));
  }
};

using ModuleKind =
    std::variant<SysinfoModule, PersistModule, PrivescModule, AutopwnModule,
                 NetworkModule, DumpModule, CollectModule>;

// ============================================================================
// ModuleDispatcher
// ============================================================================

class ModuleDispatcher final {
 public:
  ModuleDispatcher(SessionRegistry& registry, CommandChannel& channel,
                   FileTransfer& transfer,
                   ModuleOptions options = ModuleOptions())
      : registry_(registry),
        channel_(channel),
        transfer_(transfer),
        options_(std::move(options)) {}

  /** @brief Registered names, in menu order. */
  static const std::vector<std::string>& ModuleNames() {
    static const std::vector<std::string> names = {
        SysinfoModule::kName, PersistModule::kName, PrivescModule::kName,
        AutopwnModule::kName, NetworkModule::kName, DumpModule::kName,
        CollectModule::kName};
    return names;
  }

  static optional<ModuleKind> Lookup(const std::string& name) {
    if (name == SysinfoModule::kName) return ModuleKind(SysinfoModule{});
    if (name == PersistModule::kName) return ModuleKind(PersistModule{});
    if (name == PrivescModule::kName) return ModuleKind(PrivescModule{});
    if (name == AutopwnModule::kName) return ModuleKind(AutopwnModule{});
    if (name == NetworkModule::kName) return ModuleKind(NetworkModule{});
    if (name == DumpModule::kName) return ModuleKind(DumpModule{});
    if (name == CollectModule::kName) return ModuleKind(CollectModule{});
    return optional<ModuleKind>();
  }

  /** @brief kUnknownModule is decided before any channel I/O. */
  expected<Findings, DispatchError> Run(const std::string& name,
                                        Session& session) {
    using Result = expected<Findings, DispatchError>;
    optional<ModuleKind> kind = Lookup(name);
    if (!kind.has_value()) {
      return Result::error(DispatchError::kUnknownModule);
    }
    TETHER_LOG_INFO("MODULE", "session %u: running '%s'", session.Id(),
                    name.c_str());
    Findings findings;
    findings.module = name;
    ModuleContext ctx{channel_, transfer_, session, options_};
    std::visit([&ctx, &findings](const auto& m) { m.Run(ctx, findings); },
               kind.value());
    return Result::success(std::move(findings));
  }

  expected<Findings, DispatchError> Run(const std::string& name,
                                        SessionId id) {
    using Result = expected<Findings, DispatchError>;
    if (!Lookup(name).has_value()) {
      return Result::error(DispatchError::kUnknownModule);
    }
    std::shared_ptr<Session> session = registry_.Get(id);
    if (session == nullptr) {
      return Result::error(DispatchError::kSessionNotFound);
    }
    return Run(name, *session);
  }

  const ModuleOptions& Options() const noexcept { return options_; }

 private:
  SessionRegistry& registry_;
  CommandChannel& channel_;
  FileTransfer& transfer_;
  ModuleOptions options_;
};

}  // namespace tether

#endif  // TETHER_MODULES_HPP_
