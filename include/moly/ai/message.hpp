#pragma once

#include "moly/ai/bot.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace moly::ai {

enum class EntityKind {
  User,
  Bot,
  System,
  App,
};

std::string_view entity_kind_name(EntityKind kind) noexcept;
std::optional<EntityKind> parse_entity_kind(std::string_view name);

struct MessageContent {
  std::string text;
  std::string reasoning;
};

struct Message {
  EntityKind from = EntityKind::User;
  std::optional<BotId> bot_id; // Set for EntityKind::Bot
  MessageContent content;
  bool is_writing = false;     // Transient, never persisted

  static Message user(std::string text);
  static Message bot(const BotId &id, std::string text = {});
};

} // namespace moly::ai
