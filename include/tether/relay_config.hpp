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
 * @file relay_config.hpp
 * @brief Typed server configuration and its mapping from a ConfigStore.
 *
 * Sections: [listener] [channel] [transfer] [modules] [log]. Missing keys
 * keep the compiled-in defaults; a missing file is not an error.
 */

#ifndef TETHER_RELAY_CONFIG_HPP_
#define TETHER_RELAY_CONFIG_HPP_

#include "tether/acceptor.hpp"
#include "tether/channel.hpp"
#include "tether/config.hpp"
#include "tether/log.hpp"
#include "tether/modules.hpp"
#include "tether/normalizer.hpp"
#include "tether/transfer.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace tether {

struct RelayConfig {
  AcceptorOptions listener;
  ChannelOptions channel;
  TransferOptions transfer;
  ModuleOptions modules;
  log::Level log_level = log::GetLevel();
};

namespace detail {

inline std::vector<std::string> SplitCsv(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) comma = text.size();
    std::string item = Trim(text.substr(start, comma - start));
    if (!item.empty()) out.push_back(std::move(item));
    start = comma + 1;
  }
  return out;
}

inline void OverrideString(const ConfigStore& store, const char* section,
                           const char* key, std::string& field) {
  if (store.HasKey(section, key)) {
    field = store.GetString(section, key);
  }
}

/** @brief Strip one pair of surrounding double quotes. */
inline std::string Unquote(const std::string& text) {
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

}  // namespace detail

/** @brief Copy every recognised key of @p store into @p cfg. */
inline void ApplyConfig(const ConfigStore& store, RelayConfig& cfg) {
  using detail::OverrideString;

  // [listener]
  OverrideString(store, "listener", "host", cfg.listener.host);
  cfg.listener.port = store.GetPort("listener", "port", cfg.listener.port);
  cfg.listener.monitor_interval_ms = store.GetUint(
      "listener", "monitor_interval_ms", cfg.listener.monitor_interval_ms);

  // [channel]
  // Quoted so the trailing blank survives INI trimming.
  if (store.HasKey("channel", "sentinel")) {
    cfg.channel.sentinel =
        detail::Unquote(store.GetString("channel", "sentinel"));
  }
  cfg.channel.settle_ms =
      store.GetUint("channel", "settle_ms", cfg.channel.settle_ms);
  cfg.channel.timeout_ms =
      store.GetUint("channel", "timeout_ms", cfg.channel.timeout_ms);

  // [transfer]
  TransferOptions& t = cfg.transfer;
  OverrideString(store, "transfer", "exists_command", t.exists_command);
  OverrideString(store, "transfer", "exists_marker", t.exists_marker);
  OverrideString(store, "transfer", "size_command", t.size_command);
  OverrideString(store, "transfer", "content_command", t.content_command);
  OverrideString(store, "transfer", "output_dir", t.output_dir);
  t.probe_timeout_ms =
      store.GetUint("transfer", "probe_timeout_ms", t.probe_timeout_ms);
  t.content_timeout_ms =
      store.GetUint("transfer", "content_timeout_ms", t.content_timeout_ms);
  t.preview_lines = store.GetUint("transfer", "preview_lines",
                                  static_cast<uint32_t>(t.preview_lines));
  if (store.HasKey("transfer", "text_extensions")) {
    t.text_extensions =
        detail::SplitCsv(store.GetString("transfer", "text_extensions"));
  }

  // [modules]
  ModuleOptions& m = cfg.modules;
  OverrideString(store, "modules", "privilege_command", m.privilege_command);
  OverrideString(store, "modules", "os_command", m.os_command);
  OverrideString(store, "modules", "av_command", m.av_command);
  OverrideString(store, "modules", "run_key_command", m.run_key_command);
  OverrideString(store, "modules", "startup_command", m.startup_command);
  OverrideString(store, "modules", "privileges_command", m.privileges_command);
  OverrideString(store, "modules", "install_elevated_command",
                 m.install_elevated_command);
  OverrideString(store, "modules", "impersonate_command",
                 m.impersonate_command);
  OverrideString(store, "modules", "connections_command",
                 m.connections_command);
  OverrideString(store, "modules", "collect_command", m.collect_command);
  OverrideString(store, "modules", "collect_marker", m.collect_marker);
  OverrideString(store, "modules", "collect_path", m.collect_path);
  m.pacing_ms = store.GetUint("modules", "pacing_ms", m.pacing_ms);
  m.timeout_ms = store.GetUint("modules", "timeout_ms", cfg.channel.timeout_ms);
  m.av_timeout_ms = store.GetUint("modules", "av_timeout_ms", m.av_timeout_ms);

  // [log]
  if (store.HasKey("log", "level")) {
    cfg.log_level = log::ParseLevel(store.GetString("log", "level").c_str(),
                                    cfg.log_level);
  }
}

#if defined(TETHER_CONFIG_INI_ENABLED) || defined(TETHER_CONFIG_JSON_ENABLED)

/**
 * @brief Load @p path (INI or JSON by extension) into @p cfg.
 * @return true when the file was loaded; defaults stay in place otherwise.
 */
inline bool LoadRelayConfig(const char* path, RelayConfig& cfg) {
  MultiConfig store;
  auto r = store.LoadFile(path);
  if (!r.has_value()) {
    TETHER_LOG_WARN("CONFIG", "Cannot load '%s', using defaults", path);
    return false;
  }
  TETHER_LOG_INFO("CONFIG", "Loaded configuration from '%s'", path);
  ApplyConfig(store, cfg);
  return true;
}

#endif

/** @return Value following "--config", or nullptr. */
inline const char* FindConfigArg(int argc, char* argv[]) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      return argv[i + 1];
    }
  }
  return nullptr;
}

/**
 * @brief Apply "-H <host>" and "-p <port>" on top of the loaded config.
 * @return false on an unknown flag, a missing value or a bad port.
 */
inline bool ApplyCommandLine(int argc, char* argv[], RelayConfig& cfg) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    const bool has_value = (i + 1 < argc);
    if (std::strcmp(arg, "--config") == 0 && has_value) {
      ++i;
    } else if ((std::strcmp(arg, "-H") == 0 ||
                std::strcmp(arg, "--host") == 0) && has_value) {
      cfg.listener.host = argv[++i];
    } else if ((std::strcmp(arg, "-p") == 0 ||
                std::strcmp(arg, "--port") == 0) && has_value) {
      char* end = nullptr;
      const long port = std::strtol(argv[++i], &end, 10);
      if (end == argv[i] || *end != '\0' || port < 0 || port > 65535) {
        return false;
      }
      cfg.listener.port = static_cast<uint16_t>(port);
    } else {
      return false;
    }
  }
  return true;
}

}  // namespace tether

#endif  // TETHER_RELAY_CONFIG_HPP_
