/**
 * @file test_modules.cpp
 * @brief Tests for modules.hpp: heuristics, each module against a scripted
 *        agent, dispatch and rendering.
 */

#include "tether/modules.hpp"

#include <catch2/catch_test_macros.hpp>

#include "loopback.hpp"

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <sstream>
#include <string>
#include <thread>

using tether_test::AgentReply;
using tether_test::FastChannel;
using tether_test::SessionRig;

namespace {

/** @brief Exact-command lookup; unknown commands produce no output. */
tether_test::FakeAgent::Handler Script(
    std::map<std::string, std::string> replies) {
  return [replies](const std::string& cmd) -> AgentReply {
    auto it = replies.find(cmd);
    return (it == replies.end()) ? AgentReply("") : AgentReply(it->second);
  };
}

tether::ModuleOptions FastModules() {
  tether::ModuleOptions opt;
  opt.timeout_ms = 1000;
  opt.av_timeout_ms = 1000;
  opt.pacing_ms = 0;
  return opt;
}

/** @brief Channel, transfer and dispatcher wired to one SessionRig. */
struct ModuleRig {
  SessionRig rig;
  tether::CommandChannel channel;
  tether::FileTransfer transfer;
  tether::ModuleDispatcher dispatcher;

  ModuleRig(tether_test::FakeAgent::Handler handler,
            tether::ModuleOptions modules = FastModules(),
            tether::TransferOptions xfer = tether::TransferOptions())
      : rig(std::move(handler)),
        channel(rig.registry, FastChannel()),
        transfer(channel, xfer),
        dispatcher(rig.registry, channel, transfer, std::move(modules)) {}

  tether::Findings Run(const std::string& name) {
    auto r = dispatcher.Run(name, *rig.session);
    REQUIRE(r.has_value());
    return r.value();
  }
};

std::vector<std::string> Values(const tether::FindingSection* s) {
  std::vector<std::string> out;
  if (s == nullptr) return out;
  for (const auto& i : s->items) out.push_back(i.value);
  return out;
}

}  // namespace

// ============================================================================
// Heuristics
// ============================================================================

TEST_CASE("modules - privilege classification", "[modules][heuristics]") {
  REQUIRE(tether::ClassifyPrivilege("System error 5 has occurred.\r\n"
                                    "Access is denied.") ==
          tether::PrivilegeLevel::kUser);
  REQUIRE(tether::ClassifyPrivilege("Erreur systeme 5. Accs refus.") ==
          tether::PrivilegeLevel::kUser);
  REQUIRE(tether::ClassifyPrivilege("ACCESS IS DENIED") ==
          tether::PrivilegeLevel::kUser);
  REQUIRE(tether::ClassifyPrivilege("") ==
          tether::PrivilegeLevel::kAdministrator);
  REQUIRE(std::string(tether::ToString(tether::PrivilegeLevel::kUser)) == "USER");
  REQUIRE(std::string(tether::ToString(
              tether::PrivilegeLevel::kAdministrator)) == "ADMINISTRATOR");
}

TEST_CASE("modules - AlwaysInstallElevated needs both keys",
          "[modules][heuristics]") {
  const std::string one =
      "HKEY_LOCAL_MACHINE\\...\\Installer\n"
      "    AlwaysInstallElevated    REG_DWORD    0x1\n";
  REQUIRE(!tether::IsAlwaysInstallElevated(one));
  REQUIRE(tether::IsAlwaysInstallElevated(one + one));
  REQUIRE(!tether::IsAlwaysInstallElevated("ERROR: not found"));
}

TEST_CASE("modules - impersonation and dangerous privileges",
          "[modules][heuristics]") {
  REQUIRE(tether::IsImpersonateExploitable(
      "SeImpersonatePrivilege Impersonate a client  Enabled"));
  REQUIRE(!tether::IsImpersonateExploitable(
      "SeImpersonatePrivilege Impersonate a client  Disabled"));
  REQUIRE(!tether::IsImpersonateExploitable(""));
  REQUIRE(tether::IsDangerousPrivilege("SeDebugPrivilege  Enabled"));
  REQUIRE(tether::IsDangerousPrivilege("SeImpersonatePrivilege  Enabled"));
  REQUIRE(!tether::IsDangerousPrivilege("SeChangeNotifyPrivilege  Enabled"));
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("modules - names and lookup", "[modules][dispatch]") {
  const auto& names = tether::ModuleDispatcher::ModuleNames();
  REQUIRE(names.size() == 7);
  for (const auto& n : names) {
    REQUIRE(tether::ModuleDispatcher::Lookup(n).has_value());
  }
  REQUIRE(!tether::ModuleDispatcher::Lookup("harvest").has_value());
  REQUIRE(!tether::ModuleDispatcher::Lookup("").has_value());
}

TEST_CASE("modules - unknown module performs no I/O", "[modules][dispatch]") {
  ModuleRig m(Script({}));
  auto r = m.dispatcher.Run("bogus", *m.rig.session);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == tether::DispatchError::kUnknownModule);

  auto by_id = m.dispatcher.Run("bogus", m.rig.id);
  REQUIRE(by_id.get_error() == tether::DispatchError::kUnknownModule);

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(m.rig.agent->Commands().empty());
}

TEST_CASE("modules - run by id on a missing session", "[modules][dispatch]") {
  ModuleRig m(Script({}));
  auto r = m.dispatcher.Run("network", m.rig.id + 100);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == tether::DispatchError::kSessionNotFound);
}

// ============================================================================
// Modules
// ============================================================================

TEST_CASE("modules - sysinfo as a plain user", "[modules][sysinfo]") {
  const tether::ModuleOptions opt = FastModules();
  ModuleRig m(Script({
      {"hostname", "WS-042\r\n"},
      {"whoami", "corp\\alice\r\n"},
      {"echo %COMPUTERNAME%", "WS-042\r\n"},
      {"echo %USERDOMAIN%", "CORP\r\n"},
      {opt.privilege_command, "Access is denied.\r\n"},
      {opt.os_command,
       "OS Name: Microsoft Windows 10 Pro\r\nOS Version: 10.0.19045\r\n"
       "System Type: x64-based PC\r\n"},
      {opt.av_command, "Windows Defender\r\n"},
  }));

  const tether::Findings f = m.Run("sysinfo");
  REQUIRE(f.module == "sysinfo");

  const auto* identity = f.Section("System Information");
  REQUIRE(identity != nullptr);
  REQUIRE(identity->items.size() == 4);
  REQUIRE(identity->items[0].label == "Hostname");
  REQUIRE(identity->items[0].value == "WS-042");
  REQUIRE(identity->items[1].value == "corp\\alice");
  REQUIRE(identity->items[3].value == "CORP");

  const auto* priv = f.Section("Privilege Level");
  REQUIRE(priv != nullptr);
  REQUIRE(priv->items.size() == 1);
  REQUIRE(priv->items[0].value == "USER");
  REQUIRE(!priv->items[0].flagged);

  REQUIRE(Values(f.Section("Operating System")).size() == 3);
  REQUIRE(Values(f.Section("Antivirus")) ==
          std::vector<std::string>{"Windows Defender"});
}

TEST_CASE("modules - sysinfo as administrator without AV",
          "[modules][sysinfo]") {
  ModuleRig m(Script({{"hostname", "SRV01"}}));
  const tether::Findings f = m.Run("sysinfo");

  const auto* identity = f.Section("System Information");
  REQUIRE(identity->items.size() == 1);
  REQUIRE(identity->items[0].value == "SRV01");

  const auto* priv = f.Section("Privilege Level");
  REQUIRE(priv->items[0].value == "ADMINISTRATOR");
  REQUIRE(priv->items[0].flagged);

  const auto* av = f.Section("Antivirus");
  REQUIRE(av->items.empty());
  REQUIRE(av->empty_note == "Unable to detect");
}

TEST_CASE("modules - persist keeps only REG_SZ run entries",
          "[modules][persist]") {
  const tether::ModuleOptions opt = FastModules();
  ModuleRig m(Script({
      {opt.run_key_command,
       "\r\nHKEY_CURRENT_USER\\Software\\Microsoft\\Windows\\CurrentVersion\\Run\r\n"
       "    OneDrive    REG_SZ    \"C:\\OneDrive.exe\" /background\r\n"
       "    Updater    REG_EXPAND_SZ    %APPDATA%\\u.exe\r\n"
       "    Teams    REG_SZ    C:\\Teams.exe\r\n"},
  }));

  const tether::Findings f = m.Run("persist");
  const auto run_keys = Values(f.Section("Registry Run Keys"));
  REQUIRE(run_keys.size() == 2);
  REQUIRE(run_keys[0].find("OneDrive") != std::string::npos);
  REQUIRE(run_keys[1].find("Teams") != std::string::npos);

  const auto* startup = f.Section("Startup Folder");
  REQUIRE(startup != nullptr);
  REQUIRE(startup->items.empty());
  REQUIRE(startup->empty_note == "(Empty)");
}

TEST_CASE("modules - privesc flags dangerous privileges",
          "[modules][privesc]") {
  const tether::ModuleOptions opt = FastModules();
  const std::string aie_line = "AlwaysInstallElevated    REG_DWORD    0x1\r\n";
  ModuleRig m(Script({
      {opt.privileges_command,
       "SeChangeNotifyPrivilege   Bypass traverse checking   Enabled\r\n"
       "SeImpersonatePrivilege    Impersonate a client       Enabled\r\n"},
      {opt.install_elevated_command, aie_line + aie_line},
  }));

  const tether::Findings f = m.Run("privesc");
  const auto* privs = f.Section("Enabled Privileges");
  REQUIRE(privs->items.size() == 2);
  REQUIRE(!privs->items[0].flagged);
  REQUIRE(privs->items[1].flagged);

  const auto* aie = f.Section("AlwaysInstallElevated");
  REQUIRE(aie->items.size() == 1);
  REQUIRE(aie->items[0].value == "VULNERABLE");
  REQUIRE(aie->items[0].flagged);
}

TEST_CASE("modules - autopwn reports every check", "[modules][autopwn]") {
  const tether::ModuleOptions opt = FastModules();

  SECTION("nothing found") {
    ModuleRig m(Script({}));
    const tether::Findings f = m.Run("autopwn");
    const auto* checks = f.Section("Escalation Checks");
    REQUIRE(checks->items.size() == 3);
    REQUIRE(checks->items[0].value == "Not vulnerable");
    REQUIRE(checks->items[1].value == "Not available");
    REQUIRE(checks->items[2].value == "0 potential vector(s)");
    REQUIRE(!checks->unavailable);
  }

  SECTION("impersonation available") {
    ModuleRig m(Script({
        {opt.impersonate_command,
         "SeImpersonatePrivilege  Impersonate a client  Enabled\r\n"},
    }));
    const tether::Findings f = m.Run("autopwn");
    const auto* checks = f.Section("Escalation Checks");
    REQUIRE(checks->items[1].value == "EXPLOITABLE");
    REQUIRE(checks->items[1].flagged);
    REQUIRE(checks->items[2].value == "1 potential vector(s)");
  }
}

TEST_CASE("modules - network caps the listing", "[modules][network]") {
  const tether::ModuleOptions opt = FastModules();
  std::string reply;
  for (int i = 0; i < 30; ++i) {
    reply += "  TCP  10.0.0.5:" + std::to_string(50000 + i) +
             "  93.184.216.34:443  ESTABLISHED  4242\r\n";
  }
  ModuleRig m(Script({{opt.connections_command, reply}}));

  const tether::Findings f = m.Run("network");
  const auto rows = Values(f.Section("Active Connections"));
  REQUIRE(rows.size() == 20);
  REQUIRE(rows.front().find(":50000") != std::string::npos);
}

TEST_CASE("modules - dump runs sysinfo, persist and privesc in order",
          "[modules][dump]") {
  ModuleRig m(Script({}));
  const tether::Findings f = m.Run("dump");
  REQUIRE(f.module == "dump");
  REQUIRE(f.Section("System Information") != nullptr);
  REQUIRE(f.Section("Registry Run Keys") != nullptr);
  REQUIRE(f.Section("AlwaysInstallElevated") != nullptr);

  const auto cmds = m.rig.agent->Commands();
  const tether::ModuleOptions opt = FastModules();
  REQUIRE(cmds.size() == 11);
  REQUIRE(cmds.front() == "hostname");
  REQUIRE(cmds[7] == opt.run_key_command);
  REQUIRE(cmds.back() == opt.install_elevated_command);
}

TEST_CASE("modules - collect without a command", "[modules][collect]") {
  ModuleRig m(Script({}));
  const tether::Findings f = m.Run("collect");
  const auto* s = f.Section("Collect");
  REQUIRE(s != nullptr);
  REQUIRE(s->items.empty());
  REQUIRE(s->empty_note == "Not configured");
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(m.rig.agent->Commands().empty());
}

TEST_CASE("modules - collect without the marker", "[modules][collect]") {
  tether::ModuleOptions opt = FastModules();
  opt.collect_command = "tasklist > %TEMP%\\t.txt && echo DONE";
  opt.collect_marker = "DONE";
  opt.collect_path = "%TEMP%\\t.txt";
  ModuleRig m(Script({{opt.collect_command, "The system cannot find\r\n"}}),
              opt);

  const tether::Findings f = m.Run("collect");
  const auto* s = f.Section("Collect");
  REQUIRE(s->items.size() == 1);
  REQUIRE(s->items[0].value == "No output produced");
  REQUIRE(m.rig.agent->Commands().size() == 1);
}

TEST_CASE("modules - collect chains into a transfer", "[modules][collect]") {
  tether::ModuleOptions opt = FastModules();
  opt.collect_command = "tasklist > %TEMP%\\t.txt && echo DONE";
  opt.collect_marker = "DONE";
  opt.collect_path = "%TEMP%\\t.txt";

  char tmpl[] = "/tmp/tether_collect_XXXXXX";
  const char* dir = ::mkdtemp(tmpl);
  REQUIRE(dir != nullptr);
  tether::TransferOptions xfer;
  xfer.output_dir = dir;
  xfer.probe_timeout_ms = 500;
  xfer.content_timeout_ms = 1000;

  const std::string content = "Image Name   PID\r\nsvchost.exe  1024\r\n";
  const std::string b64 = tether::Base64Encode(
      reinterpret_cast<const uint8_t*>(content.data()), content.size());

  ModuleRig m(
      [&](const std::string& cmd) -> AgentReply {
        if (cmd == opt.collect_command) return "DONE\r\n";
        if (cmd.find("if exist") != std::string::npos) return "EXISTS\r\n";
        if (cmd.find("Get-Item") != std::string::npos) {
          return std::to_string(content.size()) + "\r\n";
        }
        if (cmd.find("ReadAllBytes") != std::string::npos) return b64 + "\r\n";
        return "";
      },
      opt, xfer);

  const tether::Findings f = m.Run("collect");
  const auto* s = f.Section("Collect");
  REQUIRE(s->items.size() == 2);
  REQUIRE(s->items[0].label == "Saved");
  REQUIRE(s->items[0].flagged);
  REQUIRE(s->items[1].value == std::to_string(content.size()));
  REQUIRE(m.rig.agent->Commands().size() == 4);

  (void)std::remove(s->items[0].value.c_str());
  (void)::rmdir(dir);
}

TEST_CASE("modules - lost session marks sections unavailable",
          "[modules][errors]") {
  ModuleRig m([](const std::string&) { return AgentReply::HangUp(); });
  const tether::Findings f = m.Run("privesc");

  const auto* privs = f.Section("Enabled Privileges");
  REQUIRE(privs->unavailable);
  REQUIRE(privs->items.empty());

  const auto* aie = f.Section("AlwaysInstallElevated");
  REQUIRE(aie->unavailable);
  REQUIRE(aie->items.empty());
  REQUIRE(!m.rig.registry.Contains(m.rig.id));
}

TEST_CASE("modules - hang-up during the privilege probe is not a verdict",
          "[modules][errors]") {
  const tether::ModuleOptions opt = FastModules();
  ModuleRig m([opt](const std::string& cmd) -> AgentReply {
    if (cmd == opt.privilege_command) return AgentReply::HangUp();
    if (cmd == "hostname") return "WS-042\r\n";
    return "";
  });
  const tether::Findings f = m.Run("sysinfo");

  const auto* identity = f.Section("System Information");
  REQUIRE(!identity->unavailable);
  REQUIRE(identity->items.size() == 1);

  const auto* priv = f.Section("Privilege Level");
  REQUIRE(priv->unavailable);
  REQUIRE(priv->items.empty());
  REQUIRE(f.Section("Operating System")->unavailable);
  REQUIRE(f.Section("Antivirus")->unavailable);

  std::ostringstream os;
  tether::RenderFindings(f, os);
  REQUIRE(os.str().find("[*] Privilege Level (unavailable)\n") !=
          std::string::npos);
  REQUIRE(os.str().find("ADMINISTRATOR") == std::string::npos);
  REQUIRE(os.str().find("USER") == std::string::npos);
}

TEST_CASE("modules - autopwn with a failed check has no summary",
          "[modules][errors]") {
  const tether::ModuleOptions opt = FastModules();
  ModuleRig m([opt](const std::string& cmd) -> AgentReply {
    if (cmd == opt.install_elevated_command) return AgentReply::HangUp();
    return "SeImpersonatePrivilege  Impersonate a client  Enabled\r\n";
  });
  const tether::Findings f = m.Run("autopwn");

  const auto* checks = f.Section("Escalation Checks");
  REQUIRE(checks->unavailable);
  for (const auto& item : checks->items) {
    REQUIRE(item.label != "AlwaysInstallElevated");
    REQUIRE(item.label != "Summary");
  }
  // The session is gone, so the impersonation check never reached the agent.
  REQUIRE(checks->items.empty());
  REQUIRE(m.rig.agent->Commands() ==
          std::vector<std::string>{opt.install_elevated_command});
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("modules - RenderFindings layout", "[modules][render]") {
  tether::Findings f;
  f.module = "demo";
  tether::FindingSection a;
  a.title = "Checks";
  a.items.push_back(tether::Finding{"Status", "VULNERABLE", true});
  a.items.push_back(tether::Finding{"", "plain row", false});
  tether::FindingSection b;
  b.title = "Startup Folder";
  b.empty_note = "(Empty)";
  tether::FindingSection c;
  c.title = "Lost";
  c.unavailable = true;
  f.sections = {a, b, c};

  std::ostringstream os;
  tether::RenderFindings(f, os);
  REQUIRE(os.str() ==
          "[*] Checks\n"
          "[!] Status: VULNERABLE\n"
          "    plain row\n"
          "[*] Startup Folder\n"
          "    (Empty)\n"
          "[*] Lost (unavailable)\n");
}
