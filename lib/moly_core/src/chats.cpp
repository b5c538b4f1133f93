#include "moly/data/chats.hpp"

#include "moly/data/providers.hpp"
#include "moly/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace moly::data {

namespace {
constexpr const char *kChatSuffix = ".chat.json";

Timestamp now_millis() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

std::uint64_t to_millis(Timestamp time) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          time.time_since_epoch())
          .count());
}

bool has_suffix(const std::string &text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

nlohmann::json message_to_json(const ai::Message &message) {
  nlohmann::json j;
  j["from"] = std::string(ai::entity_kind_name(message.from));
  j["bot_id"] = message.bot_id ? nlohmann::json(message.bot_id->as_str())
                               : nlohmann::json(nullptr);
  j["content"] = {{"text", message.content.text},
                  {"reasoning", message.content.reasoning}};
  return j;
}

ai::Message message_from_json(const nlohmann::json &j) {
  ai::Message message;
  auto from = ai::parse_entity_kind(j.at("from").get<std::string>());
  if (!from)
    throw std::runtime_error("unknown message sender");
  message.from = *from;
  if (auto bot = j.find("bot_id"); bot != j.end() && bot->is_string())
    message.bot_id = ai::BotId::from_string(bot->get<std::string>());
  if (auto content = j.find("content"); content != j.end()) {
    message.content.text = content->value("text", std::string());
    message.content.reasoning = content->value("reasoning", std::string());
  }
  message.is_writing = false;
  return message;
}
} // namespace

std::optional<ChatId> parse_chat_id(std::string_view text) {
  ChatId id = 0;
  auto rc = std::from_chars(text.data(), text.data() + text.size(), id);
  if (text.empty() || rc.ec != std::errc() || rc.ptr != text.data() + text.size())
    return std::nullopt;
  return id;
}

std::string format_timestamp(Timestamp time) {
  auto millis = to_millis(time);
  std::time_t seconds = static_cast<std::time_t>(millis / 1000);
  unsigned fraction = static_cast<unsigned>(millis % 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, fraction);
  return buffer;
}

std::optional<Timestamp> parse_timestamp(const std::string &text) {
  std::tm utc{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &utc.tm_year,
                  &utc.tm_mon, &utc.tm_mday, &utc.tm_hour, &utc.tm_min,
                  &utc.tm_sec, &consumed) != 6)
    return std::nullopt;

  std::string_view rest(text);
  rest.remove_prefix(static_cast<std::size_t>(consumed));

  long millis = 0;
  if (!rest.empty() && rest.front() == '.') {
    rest.remove_prefix(1);
    int digits = 0;
    while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9') {
      if (digits < 3)
        millis = millis * 10 + (rest.front() - '0');
      ++digits;
      rest.remove_prefix(1);
    }
    if (digits == 0)
      return std::nullopt;
    for (; digits < 3; ++digits)
      millis *= 10;
  }

  long offset_seconds = 0;
  if (rest == "Z" || rest == "z") {
    offset_seconds = 0;
  } else if (rest.size() == 6 && (rest[0] == '+' || rest[0] == '-') &&
             rest[3] == ':') {
    int hours = 0;
    int minutes = 0;
    if (std::sscanf(std::string(rest.substr(1)).c_str(), "%2d:%2d", &hours,
                    &minutes) != 2)
      return std::nullopt;
    offset_seconds = (hours * 3600L + minutes * 60L) * (rest[0] == '-' ? -1 : 1);
  } else {
    return std::nullopt;
  }

  utc.tm_year -= 1900;
  utc.tm_mon -= 1;
  std::time_t seconds = timegm(&utc);
  if (seconds == static_cast<std::time_t>(-1))
    return std::nullopt;

  return Timestamp(std::chrono::seconds(seconds - offset_seconds) +
                   std::chrono::milliseconds(millis));
}

std::string derive_title(const std::string &text) {
  std::string trimmed = trim_copy(text);
  if (trimmed.size() <= kMaxTitleBytes)
    return trimmed;

  std::size_t cut = kMaxTitleBytes;
  while (cut > 0 && (static_cast<unsigned char>(trimmed[cut]) & 0xC0) == 0x80)
    --cut;
  return trimmed.substr(0, cut) + "...";
}

std::string ChatData::file_name() const {
  return std::to_string(id) + kChatSuffix;
}

void ChatData::maybe_update_title_from_messages() {
  if (title != kDefaultChatTitle)
    return;
  auto first_user =
      std::find_if(messages.begin(), messages.end(), [](const ai::Message &m) {
        return m.from == ai::EntityKind::User;
      });
  if (first_user == messages.end())
    return;
  std::string derived = derive_title(first_user->content.text);
  if (!derived.empty())
    title = std::move(derived);
}

void to_json(nlohmann::json &j, const ChatData &chat) {
  j = nlohmann::json::object();
  j["id"] = chat.id;
  j["title"] = chat.title;
  j["bot_id"] = chat.bot_id ? nlohmann::json(chat.bot_id->as_str())
                            : nlohmann::json(nullptr);
  nlohmann::json messages = nlohmann::json::array();
  for (const auto &message : chat.messages)
    messages.push_back(message_to_json(message));
  j["messages"] = std::move(messages);
  j["created_at"] = format_timestamp(chat.created_at);
  j["accessed_at"] = format_timestamp(chat.accessed_at);
}

void from_json(const nlohmann::json &j, ChatData &chat) {
  chat = ChatData{};
  const auto &id = j.at("id");
  if (!id.is_number_unsigned())
    throw std::invalid_argument("chat id is not a 64-bit unsigned integer");
  chat.id = id.get<ChatId>();
  chat.title = j.value("title", std::string(kDefaultChatTitle));
  if (auto bot = j.find("bot_id"); bot != j.end() && bot->is_string())
    chat.bot_id = ai::BotId::from_string(bot->get<std::string>());
  if (auto messages = j.find("messages");
      messages != j.end() && messages->is_array()) {
    for (const auto &entry : *messages)
      chat.messages.push_back(message_from_json(entry));
  }

  auto created = parse_timestamp(j.at("created_at").get<std::string>());
  auto accessed = parse_timestamp(j.at("accessed_at").get<std::string>());
  if (!created || !accessed)
    throw std::runtime_error("invalid chat timestamp");
  chat.created_at = *created;
  chat.accessed_at = std::max(*accessed, *created);
}

Chats::Chats(std::filesystem::path chats_dir)
    : chats_dir_(std::move(chats_dir)) {}

void Chats::load() {
  saved_chats_.clear();
  current_chat_id_.reset();

  std::error_code ec;
  std::filesystem::create_directories(chats_dir_, ec);
  if (ec) {
    log::error("chats", "failed to create chats directory: " + ec.message());
    return;
  }

  std::filesystem::directory_iterator it(chats_dir_, ec);
  if (ec) {
    log::warn("chats", "could not read chats directory: " + ec.message());
    return;
  }

  for (const auto &entry : it) {
    if (!entry.is_regular_file())
      continue;
    const auto path = entry.path();
    if (!has_suffix(path.filename().string(), kChatSuffix))
      continue;

    std::ifstream file(path);
    if (!file.is_open()) {
      log::error("chats", "failed to open " + path.string());
      continue;
    }
    try {
      nlohmann::json document;
      file >> document;
      saved_chats_.push_back(document.get<ChatData>());
    } catch (const std::exception &e) {
      log::error("chats", "skipping " + path.string() + ": " + e.what());
    }
  }

  std::stable_sort(saved_chats_.begin(), saved_chats_.end(),
                   [](const ChatData &a, const ChatData &b) {
                     return a.accessed_at > b.accessed_at;
                   });
  if (!saved_chats_.empty())
    current_chat_id_ = saved_chats_.front().id;

  log::info("chats", "loaded " + std::to_string(saved_chats_.size()) +
                         " chats from " + chats_dir_.string());
}

ChatData *Chats::find_chat(ChatId id) {
  auto it = std::find_if(saved_chats_.begin(), saved_chats_.end(),
                         [id](const ChatData &chat) { return chat.id == id; });
  return it == saved_chats_.end() ? nullptr : &*it;
}

const ChatData *Chats::get_chat_by_id(ChatId id) const {
  auto it = std::find_if(saved_chats_.begin(), saved_chats_.end(),
                         [id](const ChatData &chat) { return chat.id == id; });
  return it == saved_chats_.end() ? nullptr : &*it;
}

const ChatData *Chats::get_current_chat() const {
  if (!current_chat_id_)
    return nullptr;
  return get_chat_by_id(*current_chat_id_);
}

std::vector<const ChatData *> Chats::get_sorted_chats() const {
  std::vector<const ChatData *> sorted;
  sorted.reserve(saved_chats_.size());
  for (const auto &chat : saved_chats_)
    sorted.push_back(&chat);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const ChatData *a, const ChatData *b) {
                     return a->accessed_at > b->accessed_at;
                   });
  return sorted;
}

ChatId Chats::next_chat_id() const {
  ChatId id = to_millis(now_millis());
  ChatId newest = 0;
  bool taken = false;
  for (const auto &chat : saved_chats_) {
    newest = std::max(newest, chat.id);
    taken = taken || chat.id == id;
  }
  return taken ? newest + 1 : id;
}

bool Chats::write_chat(const ChatData &chat) const {
  std::error_code ec;
  std::filesystem::create_directories(chats_dir_, ec);
  if (ec) {
    log::error("chats", "failed to create chats directory: " + ec.message());
    return false;
  }

  auto path = chats_dir_ / chat.file_name();
  std::ofstream file(path);
  if (!file.is_open()) {
    log::error("chats", "failed to write " + path.string());
    return false;
  }
  nlohmann::json document = chat;
  file << document.dump(2);
  return static_cast<bool>(file);
}

ChatId Chats::create_chat(std::optional<ai::BotId> bot_id) {
  ChatData chat;
  chat.id = next_chat_id();
  chat.created_at = now_millis();
  chat.accessed_at = chat.created_at;
  if (bot_id)
    chat.bot_id = std::move(bot_id);
  else if (!saved_chats_.empty())
    chat.bot_id = saved_chats_.front().bot_id;

  ChatId id = chat.id;
  write_chat(chat);
  saved_chats_.insert(saved_chats_.begin(), std::move(chat));
  current_chat_id_ = id;
  log::info("chats", "created chat " + std::to_string(id));
  return id;
}

void Chats::set_current_chat(std::optional<ChatId> id) {
  current_chat_id_ = id;
  if (!id)
    return;
  if (auto *chat = find_chat(*id)) {
    chat->accessed_at = std::max(now_millis(), chat->created_at);
    write_chat(*chat);
  }
}

bool Chats::update_chat_messages(ChatId id, std::vector<ai::Message> messages) {
  auto *chat = find_chat(id);
  if (!chat)
    return false;
  for (auto &message : messages)
    message.is_writing = false;
  chat->messages = std::move(messages);
  chat->maybe_update_title_from_messages();
  return write_chat(*chat);
}

bool Chats::update_chat_bot(ChatId id, std::optional<ai::BotId> bot_id) {
  auto *chat = find_chat(id);
  if (!chat)
    return false;
  chat->bot_id = std::move(bot_id);
  return write_chat(*chat);
}

bool Chats::delete_chat(ChatId id) {
  auto it = std::find_if(saved_chats_.begin(), saved_chats_.end(),
                         [id](const ChatData &chat) { return chat.id == id; });
  if (it == saved_chats_.end())
    return false;

  std::error_code ec;
  std::filesystem::remove(chats_dir_ / it->file_name(), ec);
  if (ec)
    log::error("chats", "failed to delete chat file: " + ec.message());
  saved_chats_.erase(it);
  log::info("chats", "deleted chat " + std::to_string(id));

  if (current_chat_id_ == id) {
    if (saved_chats_.empty())
      current_chat_id_.reset();
    else
      current_chat_id_ = saved_chats_.front().id;
  }
  return true;
}

bool Chats::save_chat(ChatId id) const {
  const auto *chat = get_chat_by_id(id);
  return chat ? write_chat(*chat) : false;
}

} // namespace moly::data
