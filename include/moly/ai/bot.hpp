#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace moly::ai {

struct ParsedBotId {
  std::string model;    // Model name as the provider reports it
  std::string provider; // Provider token (base URL)
};

// Splits "<len>;<model>@<provider>". The length prefix keeps model names
// containing '@' unambiguous. Malformed input yields empty fields.
ParsedBotId parse_bot_id(std::string_view raw);

class BotId {
public:
  BotId() = default;
  BotId(std::string_view model, std::string_view provider);

  static BotId from_string(std::string raw);

  const std::string &as_str() const noexcept { return value_; }
  bool empty() const noexcept { return value_.empty(); }

  std::string id() const;
  std::string provider() const;

  bool operator==(const BotId &other) const noexcept {
    return value_ == other.value_;
  }
  bool operator!=(const BotId &other) const noexcept {
    return value_ != other.value_;
  }

private:
  std::string value_;
};

struct Bot {
  BotId id;
  std::string name;
  std::optional<std::string> avatar; // Image path or glyph
};

} // namespace moly::ai

template <> struct std::hash<moly::ai::BotId> {
  std::size_t operator()(const moly::ai::BotId &id) const noexcept {
    return std::hash<std::string>{}(id.as_str());
  }
};
