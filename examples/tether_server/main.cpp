/**
 * @file main.cpp
 * @brief tether_server -- session relay with an interactive operator console.
 *
 * Architecture:
 *   - Acceptor (default 0.0.0.0:4444): one session per connection, one
 *     lifecycle monitor thread per session
 *   - Operator console on stdin/stdout: sessions, interact, modules, download
 *
 * Usage:
 *   tether_server [--config tether.ini] [-H host] [-p port]
 *
 * tether components used:
 *   - tether::Acceptor / SessionRegistry  -- connection lifecycle
 *   - tether::CommandChannel              -- sentinel-framed exchanges
 *   - tether::ModuleDispatcher            -- scripted audit modules
 *   - tether::FileTransfer                -- base64 file retrieval
 *   - tether::Console                     -- operator REPL
 *   - tether::Config (inih / nlohmann)    -- INI or JSON configuration
 *   - tether::log                         -- structured logging
 */

#include "tether/acceptor.hpp"
#include "tether/channel.hpp"
#include "tether/console.hpp"
#include "tether/log.hpp"
#include "tether/modules.hpp"
#include "tether/registry.hpp"
#include "tether/relay_config.hpp"
#include "tether/transfer.hpp"
#include "tether/vocabulary.hpp"

#include <cstdio>
#include <iostream>

static void PrintUsage(const char* prog) {
  std::printf("Usage: %s [--config tether.ini] [-H host] [-p port]\n", prog);
  std::printf("  -H host   Listen address (default 0.0.0.0)\n");
  std::printf("  -p port   Listen port (default %u)\n",
              static_cast<unsigned>(tether::kDefaultListenPort));
}

int main(int argc, char* argv[]) {
  tether::log::Init();
  TETHER_SCOPE_EXIT(tether::log::Shutdown());

  // --- Config: --config path or default tether.ini, then CLI overrides ---
  tether::RelayConfig cfg;
  const char* cfg_path = tether::FindConfigArg(argc, argv);
#if defined(TETHER_CONFIG_INI_ENABLED) || defined(TETHER_CONFIG_JSON_ENABLED)
  (void)tether::LoadRelayConfig(cfg_path ? cfg_path : "tether.ini", cfg);
#else
  if (cfg_path != nullptr) {
    TETHER_LOG_WARN("SERVER", "No config backend built in, ignoring '%s'",
                    cfg_path);
  }
#endif
  if (!tether::ApplyCommandLine(argc, argv, cfg)) {
    PrintUsage(argv[0]);
    return 1;
  }
  tether::log::SetLevel(cfg.log_level);

  tether::SessionRegistry registry;
  tether::CommandChannel channel(registry, cfg.channel);
  tether::FileTransfer transfer(channel, cfg.transfer);
  tether::ModuleDispatcher dispatcher(registry, channel, transfer, cfg.modules);

  tether::Acceptor acceptor(registry, cfg.listener);
  auto r = acceptor.Start();
  if (!r.has_value()) {
    TETHER_LOG_ERROR("SERVER", "Failed to listen on %s:%u: %s",
                     cfg.listener.host.c_str(),
                     static_cast<unsigned>(cfg.listener.port),
                     tether::ToString(r.get_error()));
    return 1;
  }
  TETHER_SCOPE_EXIT(acceptor.Stop());
  TETHER_LOG_INFO("SERVER", "Listener on %s:%u", cfg.listener.host.c_str(),
                  static_cast<unsigned>(acceptor.Port()));

  tether::Console console(registry, channel, dispatcher, transfer, std::cin,
                          std::cout);
  console.Run();

  TETHER_LOG_INFO("SERVER", "Shutting down (%zu session(s) open)",
                  registry.Size());
  return 0;
}
