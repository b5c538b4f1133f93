#include "moly/ai/connection_test.hpp"

#include "moly/log.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <utility>

namespace moly::ai {

namespace {
std::vector<std::string> parse_model_names(const std::string &body) {
  std::vector<std::string> names;
  try {
    auto document = nlohmann::json::parse(body);
    auto data = document.find("data");
    if (data == document.end() || !data->is_array())
      return names;
    for (const auto &entry : *data) {
      if (!entry.is_object())
        continue;
      auto id = entry.find("id");
      if (id != entry.end() && id->is_string())
        names.push_back(id->get<std::string>());
    }
  } catch (const std::exception &e) {
    log::debug("connection", std::string("models body not parseable: ") +
                                 e.what());
    names.clear();
  }
  return names;
}
} // namespace

ConnectionResult test_provider_connection(std::string_view url,
                                          std::string_view api_key,
                                          const HttpTransport &transport,
                                          ConnectionTimeouts timeouts) {
  ConnectionResult result;
  if (api_key.empty()) {
    result.error = "No API key provided";
    return result;
  }

  std::string base = join_url(url, "");
  const std::array<std::string, 3> candidates = {
      join_url(base, "models"), join_url(base, "v1/models"), base};

  std::string last_error;
  for (const auto &candidate : candidates) {
    HttpRequest request;
    request.url = candidate;
    request.headers.push_back(bearer_header(api_key));
    request.timeout_seconds = timeouts.timeout_seconds;
    request.connect_timeout_seconds = timeouts.connect_timeout_seconds;

    HttpResponse response;
    std::string error;
    if (!transport(request, response, &error)) {
      log::debug("connection", candidate + ": " + error);
      last_error = error;
      continue;
    }

    if (response.status == 404) {
      last_error = "Endpoint not found: " + candidate;
      continue;
    }

    if (!response.ok()) {
      result.error = describe_status(response.status, response.body);
      return result;
    }

    result.ok = true;
    result.models = parse_model_names(response.body);
    return result;
  }

  result.error =
      last_error.empty() ? "Could not find models endpoint" : last_error;
  return result;
}

ConnectionTester::ConnectionTester(HttpTransport transport,
                                   ConnectionTimeouts timeouts)
    : transport_(std::move(transport)), timeouts_(timeouts) {
  if (!transport_)
    transport_ = curl_transport;
}

ConnectionTester::~ConnectionTester() {
  if (worker_.joinable())
    worker_.join();
}

bool ConnectionTester::start(std::string provider_id, std::string url,
                             std::string api_key) {
  if (worker_.joinable()) {
    log::warn("connection", "test already running, ignoring " + provider_id);
    return false;
  }

  finished_.store(false, std::memory_order_release);
  worker_ = std::thread([this, provider_id = std::move(provider_id),
                         url = std::move(url),
                         api_key = std::move(api_key)]() mutable {
    Outcome outcome;
    outcome.result =
        test_provider_connection(url, api_key, transport_, timeouts_);
    outcome.provider_id = std::move(provider_id);
    slot_.put(std::move(outcome));
    finished_.store(true, std::memory_order_release);
  });
  return true;
}

std::optional<ConnectionTester::Outcome> ConnectionTester::poll() {
  if (!worker_.joinable() || !finished_.load(std::memory_order_acquire))
    return std::nullopt;
  worker_.join();
  return slot_.take();
}

} // namespace moly::ai
