#include "moly/data/mcp_servers.hpp"

#include "moly/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace moly::data {

namespace {
using ordered_json = nlohmann::ordered_json;

ordered_json pairs_to_json(const StringPairs &pairs) {
  ordered_json object = ordered_json::object();
  for (const auto &[key, value] : pairs)
    object[key] = value;
  return object;
}

StringPairs pairs_from_json(const ordered_json &object) {
  StringPairs pairs;
  for (auto it = object.begin(); it != object.end(); ++it)
    pairs.emplace_back(it.key(), it.value().get<std::string>());
  return pairs;
}

std::optional<std::string> optional_string(const ordered_json &object,
                                           const char *key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null())
    return std::nullopt;
  return it->get<std::string>();
}

ordered_json server_to_json(const McpServer &server) {
  ordered_json j = ordered_json::object();
  if (server.command)
    j["command"] = *server.command;
  if (!server.args.empty())
    j["args"] = server.args;
  if (!server.env.empty())
    j["env"] = pairs_to_json(server.env);
  if (server.url)
    j["url"] = *server.url;
  if (server.transport_type)
    j["type"] = *server.transport_type;
  if (!server.headers.empty())
    j["headers"] = pairs_to_json(server.headers);
  if (!server.enabled)
    j["enabled"] = false;
  if (server.working_directory)
    j["working_directory"] = *server.working_directory;
  return j;
}

McpServer server_from_json(const ordered_json &j) {
  McpServer server;
  server.command = optional_string(j, "command");
  if (auto args = j.find("args"); args != j.end())
    server.args = args->get<std::vector<std::string>>();
  if (auto env = j.find("env"); env != j.end())
    server.env = pairs_from_json(*env);
  server.url = optional_string(j, "url");
  server.transport_type = optional_string(j, "type");
  if (auto headers = j.find("headers"); headers != j.end())
    server.headers = pairs_from_json(*headers);
  server.enabled = j.value("enabled", true);
  server.working_directory = optional_string(j, "working_directory");
  return server;
}
} // namespace

McpServer McpServer::stdio(std::string command, std::vector<std::string> args) {
  McpServer server;
  server.command = std::move(command);
  server.args = std::move(args);
  return server;
}

McpServer McpServer::http(std::string url) {
  McpServer server;
  server.url = std::move(url);
  server.transport_type = "http";
  return server;
}

McpServer McpServer::sse(std::string url) {
  McpServer server;
  server.url = std::move(url);
  server.transport_type = "sse";
  return server;
}

void McpServersConfig::add_server(const std::string &id, McpServer server) {
  auto it = std::find_if(servers.begin(), servers.end(),
                         [&](const auto &entry) { return entry.first == id; });
  if (it != servers.end())
    it->second = std::move(server);
  else
    servers.emplace_back(id, std::move(server));
}

bool McpServersConfig::remove_server(const std::string &id) {
  auto it = std::find_if(servers.begin(), servers.end(),
                         [&](const auto &entry) { return entry.first == id; });
  if (it == servers.end())
    return false;
  servers.erase(it);
  return true;
}

const McpServer *McpServersConfig::get_server(const std::string &id) const {
  auto it = std::find_if(servers.begin(), servers.end(),
                         [&](const auto &entry) { return entry.first == id; });
  return it == servers.end() ? nullptr : &it->second;
}

std::vector<std::pair<std::string, McpServer>>
McpServersConfig::list_enabled_servers() const {
  std::vector<std::pair<std::string, McpServer>> enabled_servers;
  for (const auto &entry : servers) {
    if (entry.second.enabled)
      enabled_servers.push_back(entry);
  }
  return enabled_servers;
}

std::string McpServersConfig::to_json() const {
  ordered_json document = ordered_json::object();
  ordered_json server_map = ordered_json::object();
  for (const auto &[id, server] : servers)
    server_map[id] = server_to_json(server);
  document["servers"] = std::move(server_map);

  if (!inputs.empty()) {
    ordered_json input_list = ordered_json::array();
    for (const auto &input : inputs) {
      input_list.push_back({{"id", input.id},
                            {"type", input.type},
                            {"description", input.description},
                            {"password", input.password}});
    }
    document["inputs"] = std::move(input_list);
  }

  document["enabled"] = enabled;
  document["dangerous_mode_enabled"] = dangerous_mode_enabled;
  return document.dump(2);
}

bool McpServersConfig::from_json(const std::string &text,
                                 std::string *error_message) {
  McpServersConfig parsed;
  try {
    auto document = ordered_json::parse(text);
    const auto &server_map = document.at("servers");
    if (!server_map.is_object())
      throw std::runtime_error("\"servers\" must be an object");
    for (auto it = server_map.begin(); it != server_map.end(); ++it)
      parsed.servers.emplace_back(it.key(), server_from_json(it.value()));

    if (auto list = document.find("inputs"); list != document.end()) {
      for (const auto &entry : *list) {
        McpInput input;
        input.id = entry.at("id").get<std::string>();
        input.type = entry.at("type").get<std::string>();
        input.description = entry.at("description").get<std::string>();
        input.password = entry.value("password", false);
        parsed.inputs.push_back(std::move(input));
      }
    }

    parsed.enabled = document.value("enabled", true);
    parsed.dangerous_mode_enabled =
        document.value("dangerous_mode_enabled", false);
  } catch (const std::exception &e) {
    if (error_message)
      *error_message = e.what();
    return false;
  }

  *this = std::move(parsed);
  return true;
}

McpServersConfig McpServersConfig::create_sample() {
  McpServersConfig config;
  config.add_server("my-mcp-server", McpServer::http("http://localhost:8931"));

  McpServer filesystem = McpServer::stdio(
      "npx", {"-y", "@modelcontextprotocol/server-filesystem",
              "/home/username/Desktop"});
  filesystem.enabled = false;
  config.add_server("filesystem", std::move(filesystem));
  return config;
}

McpServersConfig McpServersConfig::load_file(const std::filesystem::path &path) {
  McpServersConfig config;
  std::ifstream file(path);
  if (!file.is_open())
    return config;

  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string error;
  if (!config.from_json(buffer.str(), &error))
    log::error("mcp", "failed to parse " + path.string() + ": " + error);
  return config;
}

bool McpServersConfig::save_file(const std::filesystem::path &path) const {
  std::error_code ec;
  if (path.has_parent_path())
    std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    log::error("mcp", "failed to create directory: " + ec.message());
    return false;
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    log::error("mcp", "failed to write " + path.string());
    return false;
  }
  file << to_json();
  return static_cast<bool>(file);
}

} // namespace moly::data
