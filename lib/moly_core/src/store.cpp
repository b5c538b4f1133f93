#include "moly/data/store.hpp"

#include "moly/log.hpp"

#include <utility>

namespace moly::data {

namespace {
ClientFactory factory_or_default(ClientFactory factory, const Config &config) {
  if (factory)
    return factory;
  return default_client_factory(config.http_timeout_seconds,
                                config.connect_timeout_seconds);
}
} // namespace

Store::Store(Config config, ClientFactory factory,
             ai::HttpTransport server_transport)
    : config_(std::move(config)),
      preferences_(config_.data_dir / Preferences::kFileName),
      chats_(config_.data_dir / "chats"),
      providers_manager_(factory_or_default(std::move(factory), config_)),
      moly_client_(config_.server_port, std::move(server_transport)) {}

void Store::load() {
  log::info("store", "data directory: " + config_.data_dir.string());
  preferences_.load();
  chats_.load();
  mcp_servers_ = McpServersConfig::load_file(mcp_servers_path());
}

std::filesystem::path Store::mcp_servers_path() const {
  return config_.data_dir / McpServersConfig::kFileName;
}

std::string Store::get_mcp_servers_config_json() const {
  return mcp_servers_.to_json();
}

bool Store::update_mcp_servers_from_json(const std::string &json,
                                         std::string *error_message) {
  McpServersConfig updated = mcp_servers_;
  if (!updated.from_json(json, error_message))
    return false;
  mcp_servers_ = std::move(updated);
  return mcp_servers_.save_file(mcp_servers_path());
}

bool Store::set_mcp_servers_enabled(bool enabled) {
  mcp_servers_.enabled = enabled;
  return mcp_servers_.save_file(mcp_servers_path());
}

bool Store::set_mcp_servers_dangerous_mode_enabled(bool enabled) {
  mcp_servers_.dangerous_mode_enabled = enabled;
  return mcp_servers_.save_file(mcp_servers_path());
}

} // namespace moly::data
