#include "moly/data/moly_client.hpp"

#include "moly/log.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

namespace moly::data {

namespace {
constexpr long kServerTimeoutSeconds = 30;

std::string loose_string(const nlohmann::json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null())
    return {};
  if (it->is_string())
    return it->get<std::string>();
  return it->dump();
}

ServerFile parse_file(const nlohmann::json &j) {
  ServerFile file;
  file.id = loose_string(j, "id");
  file.name = loose_string(j, "name");
  file.size = loose_string(j, "size");
  file.quantization = loose_string(j, "quantization");
  file.downloaded = j.value("downloaded", false);
  return file;
}

ServerModel parse_model(const nlohmann::json &j) {
  ServerModel model;
  model.id = loose_string(j, "id");
  model.name = loose_string(j, "name");
  model.summary = loose_string(j, "summary");
  model.size = loose_string(j, "size");
  if (auto author = j.find("author"); author != j.end()) {
    model.author = author->is_object() ? loose_string(*author, "name")
                                       : loose_string(j, "author");
  }
  if (auto files = j.find("files"); files != j.end() && files->is_array()) {
    for (const auto &entry : *files)
      model.files.push_back(parse_file(entry));
  }
  return model;
}

void parse_model_ref(const nlohmann::json &j, std::string &id,
                     std::string &name) {
  auto model = j.find("model");
  if (model == j.end() || !model->is_object())
    return;
  id = loose_string(*model, "id");
  name = loose_string(*model, "name");
}

template <typename T, typename Parse>
bool parse_list(const std::string &body, std::vector<T> &out, Parse parse,
                std::string *error_message) {
  try {
    auto document = nlohmann::json::parse(body);
    if (!document.is_array())
      throw std::runtime_error("expected a JSON array");
    std::vector<T> parsed;
    for (const auto &entry : document)
      parsed.push_back(parse(entry));
    out = std::move(parsed);
  } catch (const std::exception &e) {
    if (error_message)
      *error_message = std::string("Failed to parse response: ") + e.what();
    return false;
  }
  return true;
}
} // namespace

MolyClient::MolyClient(std::uint16_t port, ai::HttpTransport transport)
    : base_url_("http://localhost:" + std::to_string(port)),
      transport_(std::move(transport)) {
  if (!transport_)
    transport_ = ai::curl_transport;
}

ServerConnectionStatus MolyClient::connection_status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

void MolyClient::set_status(ServerConnectionState state, std::string error) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  status_.state = state;
  status_.error = std::move(error);
}

bool MolyClient::test_connection(std::string *error_message) {
  set_status(ServerConnectionState::Connecting);

  ai::HttpRequest request;
  request.url = ai::join_url(base_url_, "ping");
  request.timeout_seconds = kServerTimeoutSeconds;
  ai::HttpResponse response;
  std::string error;

  if (!transport_(request, response, &error)) {
    if (error == "Failed to connect to server")
      error = "Failed to connect to Moly Server. Is it running?";
    set_status(ServerConnectionState::Error, error);
    if (error_message)
      *error_message = error;
    return false;
  }
  if (!response.ok()) {
    error = "Server returned status: " + std::to_string(response.status);
    set_status(ServerConnectionState::Error, error);
    if (error_message)
      *error_message = error;
    return false;
  }

  set_status(ServerConnectionState::Connected);
  log::info("moly-server", "connected to " + base_url_);
  return true;
}

bool MolyClient::get_json(const std::string &path, std::string &body,
                          std::string *error_message) const {
  ai::HttpRequest request;
  request.url = ai::join_url(base_url_, path);
  request.timeout_seconds = kServerTimeoutSeconds;
  ai::HttpResponse response;
  std::string error;

  if (!transport_(request, response, &error)) {
    if (error_message)
      *error_message = "Request failed: " + error;
    return false;
  }
  if (!response.ok()) {
    if (error_message)
      *error_message =
          "Server returned status: " + std::to_string(response.status);
    return false;
  }
  body = std::move(response.body);
  return true;
}

bool MolyClient::send(const std::string &method, const std::string &path,
                      const std::string &body, const char *failure_prefix,
                      std::string *error_message) const {
  ai::HttpRequest request;
  request.method = method;
  request.url = ai::join_url(base_url_, path);
  request.timeout_seconds = kServerTimeoutSeconds;
  if (!body.empty()) {
    request.headers.push_back("Content-Type: application/json");
    request.body = body;
  }
  ai::HttpResponse response;
  std::string error;

  if (!transport_(request, response, &error)) {
    if (error_message)
      *error_message = "Request failed: " + error;
    return false;
  }
  if (!response.ok()) {
    if (error_message) {
      *error_message = std::string(failure_prefix) +
                       (response.body.empty() ? std::to_string(response.status)
                                              : response.body);
    }
    return false;
  }
  return true;
}

bool MolyClient::get_featured_models(std::vector<ServerModel> &models,
                                     std::string *error_message) const {
  std::string body;
  return get_json("models/featured", body, error_message) &&
         parse_list(body, models, parse_model, error_message);
}

bool MolyClient::search_models(std::string_view query,
                               std::vector<ServerModel> &models,
                               std::string *error_message) const {
  std::string body;
  return get_json("models/search?q=" + ai::url_encode(query), body,
                  error_message) &&
         parse_list(body, models, parse_model, error_message);
}

bool MolyClient::get_downloaded_files(std::vector<DownloadedFile> &files,
                                      std::string *error_message) const {
  std::string body;
  auto parse = [](const nlohmann::json &j) {
    DownloadedFile file;
    if (auto inner = j.find("file"); inner != j.end() && inner->is_object())
      file.file = parse_file(*inner);
    parse_model_ref(j, file.model_id, file.model_name);
    file.downloaded_at = loose_string(j, "downloaded_at");
    return file;
  };
  return get_json("files", body, error_message) &&
         parse_list(body, files, parse, error_message);
}

bool MolyClient::get_pending_downloads(std::vector<PendingDownload> &downloads,
                                       std::string *error_message) const {
  std::string body;
  auto parse = [](const nlohmann::json &j) {
    PendingDownload download;
    if (auto inner = j.find("file"); inner != j.end() && inner->is_object())
      download.file = parse_file(*inner);
    parse_model_ref(j, download.model_id, download.model_name);
    if (auto progress = j.find("progress");
        progress != j.end() && progress->is_number())
      download.progress = progress->get<double>();
    download.status = loose_string(j, "status");
    return download;
  };
  return get_json("downloads", body, error_message) &&
         parse_list(body, downloads, parse, error_message);
}

bool MolyClient::download_file(const std::string &file_id,
                               std::string *error_message) const {
  nlohmann::json body = {{"file_id", file_id}};
  return send("POST", "downloads", body.dump(), "Failed to start download: ",
              error_message);
}

bool MolyClient::pause_download(const std::string &file_id,
                                std::string *error_message) const {
  return send("POST", "downloads/" + ai::url_encode(file_id), {},
              "Failed to pause download: ", error_message);
}

bool MolyClient::cancel_download(const std::string &file_id,
                                 std::string *error_message) const {
  return send("DELETE", "downloads/" + ai::url_encode(file_id), {},
              "Failed to cancel download: ", error_message);
}

bool MolyClient::delete_file(const std::string &file_id,
                             std::string *error_message) const {
  return send("DELETE", "files/" + ai::url_encode(file_id), {},
              "Failed to delete file: ", error_message);
}

ServerRequestRunner::~ServerRequestRunner() {
  if (worker_.joinable())
    worker_.join();
}

bool ServerRequestRunner::start(ServerRequest request, std::string argument) {
  if (worker_.joinable()) {
    log::warn("server", "request already running");
    return false;
  }

  finished_.store(false, std::memory_order_release);
  worker_ = std::thread([this, request, argument = std::move(argument)]() {
    slot_.put(execute(request, argument));
    finished_.store(true, std::memory_order_release);
  });
  return true;
}

std::optional<ServerOutcome> ServerRequestRunner::poll() {
  if (!worker_.joinable() || !finished_.load(std::memory_order_acquire))
    return std::nullopt;
  worker_.join();
  return slot_.take();
}

ServerOutcome ServerRequestRunner::execute(ServerRequest request,
                                           const std::string &argument) {
  ServerOutcome outcome;
  outcome.request = request;
  outcome.argument = argument;

  switch (request) {
  case ServerRequest::Ping:
    outcome.ok = client_.test_connection(&outcome.error);
    break;
  case ServerRequest::FeaturedModels:
    outcome.ok = client_.get_featured_models(outcome.models, &outcome.error);
    break;
  case ServerRequest::SearchModels:
    outcome.ok = client_.search_models(argument, outcome.models, &outcome.error);
    break;
  case ServerRequest::DownloadedFiles:
    outcome.ok = client_.get_downloaded_files(outcome.downloaded, &outcome.error);
    break;
  case ServerRequest::PendingDownloads:
    outcome.ok = client_.get_pending_downloads(outcome.pending, &outcome.error);
    break;
  case ServerRequest::DownloadFile:
    outcome.ok = client_.download_file(argument, &outcome.error);
    break;
  case ServerRequest::PauseDownload:
    outcome.ok = client_.pause_download(argument, &outcome.error);
    break;
  case ServerRequest::CancelDownload:
    outcome.ok = client_.cancel_download(argument, &outcome.error);
    break;
  case ServerRequest::DeleteFile:
    outcome.ok = client_.delete_file(argument, &outcome.error);
    break;
  }
  return outcome;
}

} // namespace moly::data
