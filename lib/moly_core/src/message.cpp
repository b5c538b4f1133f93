#include "moly/ai/message.hpp"

#include <utility>

namespace moly::ai {

std::string_view entity_kind_name(EntityKind kind) noexcept {
  switch (kind) {
  case EntityKind::User:
    return "user";
  case EntityKind::Bot:
    return "bot";
  case EntityKind::System:
    return "system";
  case EntityKind::App:
    return "app";
  }
  return "user";
}

std::optional<EntityKind> parse_entity_kind(std::string_view name) {
  if (name == "user")
    return EntityKind::User;
  if (name == "bot" || name == "assistant")
    return EntityKind::Bot;
  if (name == "system")
    return EntityKind::System;
  if (name == "app")
    return EntityKind::App;
  return std::nullopt;
}

Message Message::user(std::string text) {
  Message message;
  message.from = EntityKind::User;
  message.content.text = std::move(text);
  return message;
}

Message Message::bot(const BotId &id, std::string text) {
  Message message;
  message.from = EntityKind::Bot;
  message.bot_id = id;
  message.content.text = std::move(text);
  return message;
}

} // namespace moly::ai
