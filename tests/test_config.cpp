/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and relay_config.hpp.
 */

#include "tether/config.hpp"
#include "tether/relay_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace {

/** @brief argv built from literals, kept alive for the call. */
struct Argv {
  std::vector<std::string> storage;
  std::vector<char*> ptrs;

  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& s : storage) ptrs.push_back(&s[0]);
    ptrs.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(storage.size()); }
  char** argv() { return ptrs.data(); }
};

}  // namespace

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef TETHER_CONFIG_INI_ENABLED

using IniCfg = tether::Config<tether::IniBackend>;

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const std::string ini_data =
      "[listener]\n"
      "port = 5555\n"
      "host = 127.0.0.1\n"
      "[log]\n"
      "level = WARN\n";

  IniCfg cfg;
  auto result = cfg.LoadBuffer(ini_data, tether::ConfigFormat::kIni);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetPort("listener", "port") == 5555);
  REQUIRE(cfg.GetString("listener", "host") == "127.0.0.1");
  REQUIRE(cfg.GetString("log", "level") == "WARN");
  REQUIRE(cfg.EntryCount() == 3);
}

TEST_CASE("INI lookup is case-insensitive", "[config][ini]") {
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer("[Channel]\nTimeout_MS = 250\n",
                         tether::ConfigFormat::kIni)
              .has_value());
  REQUIRE(cfg.HasSection("channel"));
  REQUIRE(cfg.HasKey("CHANNEL", "timeout_ms"));
  REQUIRE(cfg.GetUint("channel", "timeout_ms", 0) == 250);
}

TEST_CASE("INI LoadFile missing file", "[config][ini]") {
  IniCfg cfg;
  auto r = cfg.LoadFile("/nonexistent/tether.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == tether::ConfigError::kFileNotFound);
}

TEST_CASE("INI LoadFile reads disk", "[config][ini]") {
  const char* path = "/tmp/tether_test_config.ini";
  std::FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs("[listener]\nport = 7001\n", f);
  std::fclose(f);

  IniCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetPort("listener", "port") == 7001);
  std::remove(path);
}

TEST_CASE("ApplyConfig maps every section", "[config][relay]") {
  IniCfg store;
  REQUIRE(store.LoadBuffer(
                   "[listener]\n"
                   "host = 10.0.0.5\n"
                   "port = 9001\n"
                   "monitor_interval_ms = 250\n"
                   "[channel]\n"
                   "sentinel = \"PS> \"\n"
                   "settle_ms = 5\n"
                   "timeout_ms = 1500\n"
                   "[transfer]\n"
                   "output_dir = /tmp/loot\n"
                   "text_extensions = md, TXT ,, conf\n"
                   "preview_lines = 3\n"
                   "[modules]\n"
                   "pacing_ms = 0\n"
                   "collect_command = run-report\n"
                   "collect_marker = DONE\n"
                   "collect_path = C:\\out\\report.txt\n"
                   "[log]\n"
                   "level = error\n",
                   tether::ConfigFormat::kIni)
              .has_value());

  tether::RelayConfig cfg;
  tether::ApplyConfig(store, cfg);

  REQUIRE(cfg.listener.host == "10.0.0.5");
  REQUIRE(cfg.listener.port == 9001);
  REQUIRE(cfg.listener.monitor_interval_ms == 250);
  REQUIRE(cfg.channel.sentinel == "PS> ");
  REQUIRE(cfg.channel.settle_ms == 5);
  REQUIRE(cfg.channel.timeout_ms == 1500);
  REQUIRE(cfg.transfer.output_dir == "/tmp/loot");
  REQUIRE(cfg.transfer.text_extensions ==
          std::vector<std::string>{"md", "TXT", "conf"});
  REQUIRE(cfg.transfer.preview_lines == 3);
  REQUIRE(cfg.modules.pacing_ms == 0);
  REQUIRE(cfg.modules.timeout_ms == 1500);
  REQUIRE(cfg.modules.collect_command == "run-report");
  REQUIRE(cfg.modules.collect_marker == "DONE");
  REQUIRE(cfg.modules.collect_path == "C:\\out\\report.txt");
  REQUIRE(cfg.log_level == tether::log::Level::kError);
}

TEST_CASE("ApplyConfig keeps defaults for absent keys", "[config][relay]") {
  IniCfg store;
  REQUIRE(store.LoadBuffer("[listener]\nport = 4000\n",
                           tether::ConfigFormat::kIni)
              .has_value());
  tether::RelayConfig cfg;
  tether::ApplyConfig(store, cfg);
  REQUIRE(cfg.listener.port == 4000);
  REQUIRE(cfg.listener.host == "0.0.0.0");
  REQUIRE(cfg.channel.sentinel == "shell> ");
  REQUIRE(cfg.channel.settle_ms == 400);
  REQUIRE(cfg.transfer.exists_marker == "EXISTS");
  REQUIRE(cfg.modules.collect_command.empty());
}

#endif  // TETHER_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef TETHER_CONFIG_JSON_ENABLED

using JsonCfg = tether::Config<tether::JsonBackend>;

TEST_CASE("JSON LoadBuffer sections and scalars", "[config][json]") {
  JsonCfg cfg;
  auto r = cfg.LoadBuffer(
      R"({"listener": {"port": 4445, "host": "0.0.0.0"},
          "channel": {"timeout_ms": 2000},
          "verbose": true})",
      tether::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetPort("listener", "port") == 4445);
  REQUIRE(cfg.GetString("listener", "host") == "0.0.0.0");
  REQUIRE(cfg.GetUint("channel", "timeout_ms") == 2000);
  REQUIRE(cfg.GetBool("", "verbose"));
}

TEST_CASE("JSON malformed input is a parse error", "[config][json]") {
  JsonCfg cfg;
  auto r = cfg.LoadBuffer("{\"listener\": ", tether::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == tether::ConfigError::kParseError);
}

TEST_CASE("JSON feeds ApplyConfig", "[config][json][relay]") {
  JsonCfg store;
  REQUIRE(store.LoadBuffer(R"({"channel": {"sentinel": "$ "}})",
                           tether::ConfigFormat::kJson)
              .has_value());
  tether::RelayConfig cfg;
  tether::ApplyConfig(store, cfg);
  REQUIRE(cfg.channel.sentinel == "$ ");
}

#endif  // TETHER_CONFIG_JSON_ENABLED

// ============================================================================
// Typed getters
// ============================================================================

#if defined(TETHER_CONFIG_INI_ENABLED)

TEST_CASE("Getters reject malformed numbers", "[config][getters]") {
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer("[a]\nneg = -5\nbad = abc\nbig = 70000\nyes = on\n",
                         tether::ConfigFormat::kIni)
              .has_value());
  REQUIRE(cfg.GetUint("a", "neg", 9) == 9);
  REQUIRE(cfg.GetInt("a", "neg", 0) == -5);
  REQUIRE(cfg.GetInt("a", "bad", 3) == 3);
  REQUIRE(cfg.GetPort("a", "big", 1) == 65535);
  REQUIRE(cfg.GetBool("a", "yes"));
  REQUIRE(cfg.GetString("a", "missing", "dflt") == "dflt");
}

#endif

// ============================================================================
// Command line
// ============================================================================

TEST_CASE("FindConfigArg", "[config][cli]") {
  Argv with({"tether_server", "-p", "1", "--config", "x.ini"});
  REQUIRE(std::string(tether::FindConfigArg(with.argc(), with.argv())) ==
          "x.ini");
  Argv without({"tether_server", "--config"});
  REQUIRE(tether::FindConfigArg(without.argc(), without.argv()) == nullptr);
}

TEST_CASE("ApplyCommandLine overrides host and port", "[config][cli]") {
  tether::RelayConfig cfg;
  Argv args({"tether_server", "--config", "a.ini", "-H", "127.0.0.1", "-p",
             "5000"});
  REQUIRE(tether::ApplyCommandLine(args.argc(), args.argv(), cfg));
  REQUIRE(cfg.listener.host == "127.0.0.1");
  REQUIRE(cfg.listener.port == 5000);
}

TEST_CASE("ApplyCommandLine rejects bad input", "[config][cli]") {
  tether::RelayConfig cfg;
  Argv bad_port({"tether_server", "-p", "70000"});
  REQUIRE(!tether::ApplyCommandLine(bad_port.argc(), bad_port.argv(), cfg));
  Argv junk_port({"tether_server", "-p", "44x"});
  REQUIRE(!tether::ApplyCommandLine(junk_port.argc(), junk_port.argv(), cfg));
  Argv unknown({"tether_server", "--verbose"});
  REQUIRE(!tether::ApplyCommandLine(unknown.argc(), unknown.argv(), cfg));
  Argv dangling({"tether_server", "-H"});
  REQUIRE(!tether::ApplyCommandLine(dangling.argc(), dangling.argv(), cfg));
  REQUIRE(cfg.listener.port == 4444);
}
