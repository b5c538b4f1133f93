#include "moly/ai/openai_client.hpp"

#include "moly/log.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace moly::ai {

namespace {
constexpr std::string_view kDataPrefix = "data:";
constexpr std::string_view kDoneMarker = "[DONE]";

std::optional<std::string_view> role_for(EntityKind kind) {
  switch (kind) {
  case EntityKind::User:
    return "user";
  case EntityKind::Bot:
    return "assistant";
  case EntityKind::System:
    return "system";
  case EntityKind::App:
    return std::nullopt;
  }
  return std::nullopt;
}

std::string string_field(const nlohmann::json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string())
    return {};
  return it->get<std::string>();
}
} // namespace

std::vector<std::string> SseLineBuffer::feed(std::string_view bytes) {
  std::vector<std::string> payloads;
  pending_.append(bytes);

  std::size_t start = 0;
  for (;;) {
    auto newline = pending_.find('\n', start);
    if (newline == std::string::npos)
      break;
    take_line(std::string_view(pending_).substr(start, newline - start),
              payloads);
    start = newline + 1;
  }
  pending_.erase(0, start);
  return payloads;
}

std::vector<std::string> SseLineBuffer::finish() {
  std::vector<std::string> payloads;
  if (!pending_.empty())
    take_line(pending_, payloads);
  pending_.clear();
  return payloads;
}

void SseLineBuffer::take_line(std::string_view line,
                              std::vector<std::string> &out) {
  if (!line.empty() && line.back() == '\r')
    line.remove_suffix(1);
  if (line.substr(0, kDataPrefix.size()) != kDataPrefix)
    return;
  line.remove_prefix(kDataPrefix.size());
  if (!line.empty() && line.front() == ' ')
    line.remove_prefix(1);
  out.emplace_back(line);
}

OpenAiClient::OpenAiClient(std::string url, std::string api_key)
    : OpenAiClient(std::move(url), std::move(api_key), Options{}) {}

OpenAiClient::OpenAiClient(std::string url, std::string api_key,
                           Options options, HttpTransport transport)
    : url_(std::move(url)), api_key_(std::move(api_key)),
      options_(std::move(options)), transport_(std::move(transport)) {
  if (!transport_)
    transport_ = curl_transport;
}

bool OpenAiClient::is_valid_key(std::string_view key) {
  for (unsigned char c : key) {
    if (c < 0x20 || c == 0x7f)
      return false;
  }
  return true;
}

HttpRequest OpenAiClient::make_request(std::string method,
                                       std::string_view path) const {
  HttpRequest request;
  request.method = std::move(method);
  request.url = join_url(url_, path);
  request.timeout_seconds = options_.timeout_seconds;
  request.connect_timeout_seconds = options_.connect_timeout_seconds;
  if (!api_key_.empty())
    request.headers.push_back(bearer_header(api_key_));
  return request;
}

std::optional<ClientError>
OpenAiClient::parse_models(const std::string &body,
                           const std::string &provider_url,
                           std::vector<Bot> &bots) {
  try {
    auto document = nlohmann::json::parse(body);
    auto data = document.find("data");
    if (data == document.end() || !data->is_array())
      return ClientError{ErrorKind::Parse, "Response has no data array", 0};

    for (const auto &entry : *data) {
      if (!entry.is_object())
        continue;
      std::string model = string_field(entry, "id");
      if (model.empty())
        continue;
      Bot bot;
      bot.id = BotId(model, provider_url);
      bot.name = model;
      bots.push_back(std::move(bot));
    }
  } catch (const std::exception &e) {
    return ClientError{ErrorKind::Parse,
                       std::string("Failed to parse models: ") + e.what(), 0};
  }
  return std::nullopt;
}

ModelsResult OpenAiClient::list_models() const {
  ModelsResult result;
  HttpRequest request = make_request("GET", "models");
  HttpResponse response;
  std::string error;

  if (!transport_(request, response, &error)) {
    result.error = ClientError{ErrorKind::Network, error, response.status};
    return result;
  }
  if (!response.ok()) {
    result.error = status_error(response.status, response.body);
    return result;
  }

  result.error = parse_models(response.body, url_, result.bots);
  if (result.error)
    result.bots.clear();
  return result;
}

std::string
OpenAiClient::build_completion_body(const BotId &bot,
                                    const std::vector<Message> &history) const {
  nlohmann::json messages = nlohmann::json::array();
  if (options_.system_prompt && !options_.system_prompt->empty())
    messages.push_back({{"role", "system"}, {"content", *options_.system_prompt}});

  for (const auto &message : history) {
    auto role = role_for(message.from);
    if (!role || message.is_writing || message.content.text.empty())
      continue;
    messages.push_back(
        {{"role", std::string(*role)}, {"content", message.content.text}});
  }

  nlohmann::json body;
  body["model"] = bot.id();
  body["messages"] = std::move(messages);
  body["stream"] = true;
  return body.dump();
}

std::optional<ClientError>
OpenAiClient::stream_completion(const BotId &bot,
                                const std::vector<Message> &history,
                                const ChunkCallback &on_chunk,
                                const CancelCheck &is_cancelled) const {
  HttpRequest request = make_request("POST", "chat/completions");
  request.headers.push_back("Content-Type: application/json");
  request.headers.push_back("Accept: text/event-stream");
  request.body = build_completion_body(bot, history);
  request.idle_timeout_seconds = options_.timeout_seconds;
  request.should_abort = is_cancelled;

  SseLineBuffer lines;
  bool done = false;
  bool cancelled = false;
  std::optional<ClientError> stream_error;

  auto handle_payload = [&](const std::string &payload) {
    if (done)
      return true;
    if (payload == kDoneMarker) {
      done = true;
      return true;
    }

    MessageContent delta;
    try {
      auto event = nlohmann::json::parse(payload);
      if (auto err = event.find("error"); err != event.end()) {
        std::string text = err->is_object() ? string_field(*err, "message")
                                            : err->dump();
        stream_error = ClientError{ErrorKind::Http, text, 0};
        return false;
      }
      auto choices = event.find("choices");
      if (choices == event.end() || !choices->is_array() || choices->empty())
        return true;
      auto delta_json = (*choices)[0].find("delta");
      if (delta_json == (*choices)[0].end() || !delta_json->is_object())
        return true;
      delta.text = string_field(*delta_json, "content");
      delta.reasoning = string_field(*delta_json, "reasoning_content");
    } catch (const std::exception &e) {
      stream_error = ClientError{
          ErrorKind::Parse, std::string("Malformed stream event: ") + e.what(),
          0};
      return false;
    }

    if (delta.text.empty() && delta.reasoning.empty())
      return true;
    if (!on_chunk(delta)) {
      cancelled = true;
      return false;
    }
    return true;
  };

  request.on_data = [&](std::string_view bytes) {
    for (const auto &payload : lines.feed(bytes)) {
      if (!handle_payload(payload))
        return false;
    }
    return true;
  };

  HttpResponse response;
  std::string error;
  bool transferred = transport_(request, response, &error);

  if (!transferred && is_cancelled && is_cancelled())
    cancelled = true;
  if (cancelled)
    return ClientError{ErrorKind::Cancelled, "Cancelled", response.status};
  if (stream_error)
    return stream_error;
  if (!transferred)
    return ClientError{ErrorKind::Network, error, response.status};
  if (!response.ok())
    return status_error(response.status, response.body);

  for (const auto &payload : lines.finish()) {
    if (!handle_payload(payload))
      break;
  }
  if (cancelled)
    return ClientError{ErrorKind::Cancelled, "Cancelled", response.status};
  if (stream_error)
    return stream_error;

  if (!done)
    log::debug("openai", "stream for " + bot.id() + " ended without [DONE]");
  return std::nullopt;
}

} // namespace moly::ai
