#pragma once

#include "moly/ai/http.hpp"
#include "moly/ai/result_slot.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace moly::data {

constexpr std::uint16_t kDefaultServerPort = 8765;

struct ServerFile {
  std::string id;
  std::string name;
  std::string size;
  std::string quantization;
  bool downloaded = false;
};

struct ServerModel {
  std::string id;
  std::string name;
  std::string summary;
  std::string author;
  std::string size;
  std::vector<ServerFile> files;
};

struct DownloadedFile {
  ServerFile file;
  std::string model_id;
  std::string model_name;
  std::string downloaded_at;
};

struct PendingDownload {
  ServerFile file;
  std::string model_id;
  std::string model_name;
  double progress = 0.0;
  std::string status;
};

enum class ServerConnectionState {
  Disconnected,
  Connecting,
  Connected,
  Error,
};

struct ServerConnectionStatus {
  ServerConnectionState state = ServerConnectionState::Disconnected;
  std::string error;
};

// Client for the local model server: discovery, search and downloads.
// Calls block; the loop thread goes through ServerRequestRunner.
class MolyClient {
public:
  explicit MolyClient(std::uint16_t port = kDefaultServerPort,
                      ai::HttpTransport transport = {});

  const std::string &base_url() const noexcept { return base_url_; }
  ServerConnectionStatus connection_status() const;

  bool test_connection(std::string *error_message = nullptr);
  bool get_featured_models(std::vector<ServerModel> &models,
                           std::string *error_message = nullptr) const;
  bool search_models(std::string_view query, std::vector<ServerModel> &models,
                     std::string *error_message = nullptr) const;
  bool get_downloaded_files(std::vector<DownloadedFile> &files,
                            std::string *error_message = nullptr) const;
  bool get_pending_downloads(std::vector<PendingDownload> &downloads,
                             std::string *error_message = nullptr) const;
  bool download_file(const std::string &file_id,
                     std::string *error_message = nullptr) const;
  bool pause_download(const std::string &file_id,
                      std::string *error_message = nullptr) const;
  bool cancel_download(const std::string &file_id,
                       std::string *error_message = nullptr) const;
  bool delete_file(const std::string &file_id,
                   std::string *error_message = nullptr) const;

private:
  bool get_json(const std::string &path, std::string &body,
                std::string *error_message) const;
  bool send(const std::string &method, const std::string &path,
            const std::string &body, const char *failure_prefix,
            std::string *error_message) const;
  void set_status(ServerConnectionState state, std::string error = {});

  std::string base_url_;
  ai::HttpTransport transport_;
  mutable std::mutex status_mutex_;
  ServerConnectionStatus status_;
};

enum class ServerRequest {
  Ping,
  FeaturedModels,
  SearchModels,
  DownloadedFiles,
  PendingDownloads,
  DownloadFile,
  PauseDownload,
  CancelDownload,
  DeleteFile,
};

struct ServerOutcome {
  ServerRequest request = ServerRequest::Ping;
  // Search query or file id, as passed to start().
  std::string argument;
  bool ok = false;
  std::string error;
  std::vector<ServerModel> models;
  std::vector<DownloadedFile> downloaded;
  std::vector<PendingDownload> pending;
};

// Runs one MolyClient call at a time on a worker thread. Results are
// collected from the loop thread through poll().
class ServerRequestRunner {
public:
  explicit ServerRequestRunner(MolyClient &client) : client_(client) {}
  ~ServerRequestRunner();

  ServerRequestRunner(const ServerRequestRunner &) = delete;
  ServerRequestRunner &operator=(const ServerRequestRunner &) = delete;

  // Refused while a previous request has not been polled.
  bool start(ServerRequest request, std::string argument = {});
  bool running() const noexcept { return worker_.joinable(); }
  std::optional<ServerOutcome> poll();

private:
  ServerOutcome execute(ServerRequest request, const std::string &argument);

  MolyClient &client_;
  std::thread worker_;
  std::atomic<bool> finished_{false};
  ai::ResultSlot<ServerOutcome> slot_;
};

} // namespace moly::data
