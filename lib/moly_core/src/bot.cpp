#include "moly/ai/bot.hpp"

#include <charconv>

namespace moly::ai {

ParsedBotId parse_bot_id(std::string_view raw) {
  auto separator = raw.find(';');
  if (separator == std::string_view::npos || separator == 0)
    return {};

  std::size_t length = 0;
  auto digits = raw.substr(0, separator);
  auto rc =
      std::from_chars(digits.data(), digits.data() + digits.size(), length);
  if (rc.ec != std::errc() || rc.ptr != digits.data() + digits.size())
    return {};

  auto rest = raw.substr(separator + 1);
  if (rest.size() < length + 1 || rest[length] != '@')
    return {};

  return {std::string(rest.substr(0, length)),
          std::string(rest.substr(length + 1))};
}

BotId::BotId(std::string_view model, std::string_view provider) {
  value_.reserve(model.size() + provider.size() + 8);
  value_.append(std::to_string(model.size()));
  value_.push_back(';');
  value_.append(model);
  value_.push_back('@');
  value_.append(provider);
}

BotId BotId::from_string(std::string raw) {
  BotId id;
  id.value_ = std::move(raw);
  return id;
}

std::string BotId::id() const { return parse_bot_id(value_).model; }

std::string BotId::provider() const { return parse_bot_id(value_).provider; }

} // namespace moly::ai
