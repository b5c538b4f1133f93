#pragma once

#include "moly/ai/bot.hpp"
#include "moly/ai/message.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moly::data {

using ChatId = std::uint64_t;
using Timestamp = std::chrono::system_clock::time_point;

constexpr const char *kDefaultChatTitle = "New Chat";
constexpr std::size_t kMaxTitleBytes = 50;

// RFC 3339 in UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
std::string format_timestamp(Timestamp time);
std::optional<Timestamp> parse_timestamp(const std::string &text);

// Decimal chat id. Rejects signs, stray characters and values that do not
// fit a ChatId.
std::optional<ChatId> parse_chat_id(std::string_view text);

// Trimmed text cut to kMaxTitleBytes on a UTF-8 boundary, plus "..." when
// something was cut.
std::string derive_title(const std::string &text);

struct ChatData {
  ChatId id = 0;
  std::string title = kDefaultChatTitle;
  std::optional<ai::BotId> bot_id;
  std::vector<ai::Message> messages;
  Timestamp created_at;
  Timestamp accessed_at;

  std::string file_name() const;
  // Only replaces the default title, using the first user message.
  void maybe_update_title_from_messages();
};

void to_json(nlohmann::json &j, const ChatData &chat);
void from_json(const nlohmann::json &j, ChatData &chat);

// Chat sessions, one <id>.chat.json file each under a directory.
class Chats {
public:
  explicit Chats(std::filesystem::path chats_dir);

  // Scans the directory. Unreadable files are logged and skipped.
  void load();

  const std::filesystem::path &chats_dir() const noexcept { return chats_dir_; }
  const std::vector<ChatData> &saved_chats() const noexcept {
    return saved_chats_;
  }
  std::optional<ChatId> current_chat_id() const noexcept {
    return current_chat_id_;
  }

  const ChatData *get_current_chat() const;
  const ChatData *get_chat_by_id(ChatId id) const;
  std::vector<const ChatData *> get_sorted_chats() const;

  // Without a bot id the new chat inherits the most recent chat's bot.
  ChatId create_chat(std::optional<ai::BotId> bot_id = std::nullopt);
  void set_current_chat(std::optional<ChatId> id);
  bool update_chat_messages(ChatId id, std::vector<ai::Message> messages);
  bool update_chat_bot(ChatId id, std::optional<ai::BotId> bot_id);
  bool delete_chat(ChatId id);
  bool save_chat(ChatId id) const;

private:
  ChatData *find_chat(ChatId id);
  bool write_chat(const ChatData &chat) const;
  ChatId next_chat_id() const;

  std::filesystem::path chats_dir_;
  std::vector<ChatData> saved_chats_;
  std::optional<ChatId> current_chat_id_;
};

} // namespace moly::data
