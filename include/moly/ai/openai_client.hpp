#pragma once

#include "moly/ai/http.hpp"
#include "moly/ai/provider_client.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moly::ai {

// Splits a server-sent event stream into the payloads of its "data:"
// lines. Bytes may arrive cut at any position.
class SseLineBuffer {
public:
  std::vector<std::string> feed(std::string_view bytes);
  std::vector<std::string> finish();

private:
  void take_line(std::string_view line, std::vector<std::string> &out);

  std::string pending_;
};

// Client for OpenAI compatible endpoints: GET /models and streaming
// POST /chat/completions.
class OpenAiClient : public ProviderClient {
public:
  struct Options {
    // Total limit for /models. Streams use it as an idle limit instead.
    long timeout_seconds = 60;
    long connect_timeout_seconds = 10;
    std::optional<std::string> system_prompt;
  };

  OpenAiClient(std::string url, std::string api_key);
  OpenAiClient(std::string url, std::string api_key, Options options,
               HttpTransport transport = {});

  // Keys end up in a header line, so control characters are rejected.
  static bool is_valid_key(std::string_view key);

  const std::string &url() const override { return url_; }
  ModelsResult list_models() const override;
  std::optional<ClientError>
  stream_completion(const BotId &bot, const std::vector<Message> &history,
                    const ChunkCallback &on_chunk,
                    const CancelCheck &is_cancelled) const override;

  // Parses a /models response body into bots owned by provider_url.
  static std::optional<ClientError>
  parse_models(const std::string &body, const std::string &provider_url,
               std::vector<Bot> &bots);
  // Builds the JSON request body for a streamed completion.
  std::string build_completion_body(const BotId &bot,
                                    const std::vector<Message> &history) const;

private:
  HttpRequest make_request(std::string method, std::string_view path) const;

  std::string url_;
  std::string api_key_;
  Options options_;
  HttpTransport transport_;
};

} // namespace moly::ai
