#pragma once

#include "moly/ai/bot.hpp"
#include "moly/ai/http.hpp"
#include "moly/ai/message.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace moly::ai {

struct ModelsResult {
  std::vector<Bot> bots;
  std::optional<ClientError> error;

  bool ok() const noexcept { return !error.has_value(); }
};

// Receives one streamed delta. Returning false cancels the stream.
using ChunkCallback = std::function<bool(const MessageContent &delta)>;
// Polled from the streaming thread while it waits on the network.
using CancelCheck = std::function<bool()>;

// A configured connection to one provider. Implementations are immutable
// after construction so a worker thread may call them while the loop
// thread still holds a handle.
class ProviderClient {
public:
  virtual ~ProviderClient() = default;

  virtual const std::string &url() const = 0;
  virtual ModelsResult list_models() const = 0;
  // Returns std::nullopt when the stream ran to completion. A stream
  // stopped by on_chunk or is_cancelled reports ErrorKind::Cancelled.
  virtual std::optional<ClientError>
  stream_completion(const BotId &bot, const std::vector<Message> &history,
                    const ChunkCallback &on_chunk,
                    const CancelCheck &is_cancelled) const = 0;
};

} // namespace moly::ai
