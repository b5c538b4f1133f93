#pragma once

#include "moly/config.hpp"
#include "moly/data/chats.hpp"
#include "moly/data/mcp_servers.hpp"
#include "moly/data/moly_client.hpp"
#include "moly/data/preferences.hpp"
#include "moly/data/providers_manager.hpp"

#include <filesystem>
#include <string>

namespace moly::data {

// Application state constructed once at startup and passed by reference.
class Store {
public:
  explicit Store(Config config, ClientFactory factory = {},
                 ai::HttpTransport server_transport = {});

  // Loads preferences, chats and the MCP configuration from the data dir.
  void load();

  const Config &config() const noexcept { return config_; }
  std::filesystem::path data_dir() const { return config_.data_dir; }

  Preferences &preferences() noexcept { return preferences_; }
  const Preferences &preferences() const noexcept { return preferences_; }
  Chats &chats() noexcept { return chats_; }
  const Chats &chats() const noexcept { return chats_; }
  ProvidersManager &providers_manager() noexcept { return providers_manager_; }
  MolyClient &moly_client() noexcept { return moly_client_; }

  const McpServersConfig &mcp_servers() const noexcept { return mcp_servers_; }
  std::string get_mcp_servers_config_json() const;
  bool update_mcp_servers_from_json(const std::string &json,
                                    std::string *error_message = nullptr);
  bool set_mcp_servers_enabled(bool enabled);
  bool set_mcp_servers_dangerous_mode_enabled(bool enabled);

private:
  std::filesystem::path mcp_servers_path() const;

  Config config_;
  Preferences preferences_;
  Chats chats_;
  ProvidersManager providers_manager_;
  McpServersConfig mcp_servers_;
  MolyClient moly_client_;
};

} // namespace moly::data
