#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace moly::data {

using StringPairs = std::vector<std::pair<std::string, std::string>>;

struct McpInput {
  std::string id;
  std::string type;
  std::string description;
  bool password = false;
};

// One MCP server entry. Stdio servers set command, network servers set url.
struct McpServer {
  std::optional<std::string> command;
  std::vector<std::string> args;
  StringPairs env;

  std::optional<std::string> url;
  std::optional<std::string> transport_type; // "http" or "sse"
  StringPairs headers;

  bool enabled = true;
  std::optional<std::string> working_directory;

  static McpServer stdio(std::string command, std::vector<std::string> args);
  static McpServer http(std::string url);
  static McpServer sse(std::string url);

  bool is_stdio() const noexcept { return command.has_value(); }
  bool is_network() const noexcept { return url.has_value(); }
};

// Contents of mcp_servers.json. Server order is preserved.
class McpServersConfig {
public:
  static constexpr const char *kFileName = "mcp_servers.json";

  std::vector<std::pair<std::string, McpServer>> servers;
  std::vector<McpInput> inputs;
  bool enabled = true;
  bool dangerous_mode_enabled = false;

  // Replaces an existing entry in place, otherwise appends.
  void add_server(const std::string &id, McpServer server);
  bool remove_server(const std::string &id);
  const McpServer *get_server(const std::string &id) const;
  std::vector<std::pair<std::string, McpServer>> list_enabled_servers() const;

  std::string to_json() const;
  bool from_json(const std::string &text, std::string *error_message = nullptr);

  static McpServersConfig create_sample();

  // A missing file yields the empty default config.
  static McpServersConfig load_file(const std::filesystem::path &path);
  bool save_file(const std::filesystem::path &path) const;
};

} // namespace moly::data
