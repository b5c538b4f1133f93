#include "moly/chat/chat_screen.hpp"

#include "moly/data/providers.hpp"
#include "moly/log.hpp"

#include <algorithm>
#include <vector>

namespace moly::chat
{

ChatScreen::ChatScreen(data::Store &store)
    : store_(store),
      resolver_(controller_, store.providers_manager(), store.preferences()),
      orchestrator_(controller_, store.providers_manager(), store.preferences(), resolver_)
{
}

void ChatScreen::tick()
{
    if (controller_.poll())
        log::debug("chat", "response updated");
    orchestrator_.tick();
    if (!chatInitialized_)
        initializeChat();
    resolver_.track_model_selection();
    syncMessages();
    syncBotId();
}

ChatScreen::SyncState ChatScreen::currentSyncState() const
{
    const auto &messages = controller_.messages();
    SyncState state;
    state.count = messages.size();
    if (!messages.empty())
    {
        const auto &last = messages.back();
        state.lastLength = last.content.text.size() + last.content.reasoning.size();
        state.writing = last.is_writing;
    }
    return state;
}

void ChatScreen::initializeChat()
{
    chatInitialized_ = true;
    auto &chats = store_.chats();
    if (const auto *chat = chats.get_current_chat())
    {
        log::info("chat", "resuming chat " + std::to_string(chat->id));
        controller_.set_messages(chat->messages);
        lastSync_ = currentSyncState();
        return;
    }
    create_new_chat();
}

void ChatScreen::loadChatIntoController(const data::ChatData &chat)
{
    std::vector<ai::Message> messages = chat.messages;
    for (auto &message : messages)
        message.is_writing = false;
    controller_.set_messages(std::move(messages));
    if (chat.bot_id)
        controller_.set_bot_id(chat.bot_id);
    lastSync_ = currentSyncState();
}

void ChatScreen::syncMessages()
{
    auto current = store_.chats().current_chat_id();
    if (!current)
        return;

    SyncState state = currentSyncState();
    if (state == lastSync_)
        return;
    lastSync_ = state;
    store_.chats().update_chat_messages(*current, controller_.messages());
}

void ChatScreen::syncBotId()
{
    const auto *chat = store_.chats().get_current_chat();
    const auto &bot_id = controller_.bot_id();
    if (!chat || !bot_id)
        return;
    if (chat->bot_id && *chat->bot_id == *bot_id)
        return;
    store_.chats().update_chat_bot(chat->id, bot_id);
}

data::ChatId ChatScreen::create_new_chat()
{
    controller_.cancel_response();
    syncMessages();

    data::ChatId id = store_.chats().create_chat(controller_.bot_id());
    controller_.clear_messages();
    lastSync_ = currentSyncState();
    return id;
}

bool ChatScreen::switch_to_chat(data::ChatId id)
{
    auto &chats = store_.chats();
    if (chats.current_chat_id() == id)
        return false;
    if (!chats.get_chat_by_id(id))
    {
        log::warn("chat", "unknown chat " + std::to_string(id));
        return false;
    }

    controller_.cancel_response();
    syncMessages();

    chats.set_current_chat(id);
    loadChatIntoController(*chats.get_chat_by_id(id));
    return true;
}

bool ChatScreen::delete_chat(data::ChatId id)
{
    auto &chats = store_.chats();
    bool was_current = chats.current_chat_id() == id;
    if (was_current)
        controller_.cancel_response();
    if (!chats.delete_chat(id))
        return false;
    if (!was_current)
        return true;

    if (const auto *chat = chats.get_current_chat())
    {
        loadChatIntoController(*chat);
    }
    else
    {
        controller_.clear_messages();
        lastSync_ = currentSyncState();
    }
    return true;
}

bool ChatScreen::send_prompt(const std::string &text)
{
    std::string prompt = data::trim_copy(text);
    if (prompt.empty())
        return false;
    if (!controller_.bot_id())
    {
        log::warn("chat", "select a model before sending a prompt");
        return false;
    }
    if (!store_.chats().current_chat_id())
        create_new_chat();
    return controller_.send_message(std::move(prompt));
}

bool ChatScreen::select_bot(const ai::BotId &bot_id)
{
    const auto &bots = controller_.bots();
    bool known = std::any_of(bots.begin(), bots.end(),
                             [&](const ai::Bot &bot) { return bot.id == bot_id; });
    if (!known)
    {
        log::warn("chat", "unknown model " + bot_id.as_str());
        return false;
    }
    controller_.set_bot_id(bot_id);
    return true;
}

} // namespace moly::chat
