#pragma once

#include "moly/ai/chat_controller.hpp"
#include "moly/chat/fetch_orchestrator.hpp"
#include "moly/chat/saved_model_resolver.hpp"
#include "moly/data/chats.hpp"
#include "moly/data/store.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace moly::chat
{

// Per-frame glue between the chat controller and the stores. Owns the
// controller, the resolver and the fetch orchestrator; all of them live on
// the thread that calls tick().
class ChatScreen
{
public:
    explicit ChatScreen(data::Store &store);

    void tick();

    data::ChatId create_new_chat();
    bool switch_to_chat(data::ChatId id);
    bool delete_chat(data::ChatId id);
    bool send_prompt(const std::string &text);
    bool select_bot(const ai::BotId &bot_id);

    ai::ChatController &controller() noexcept { return controller_; }
    const ai::ChatController &controller() const noexcept { return controller_; }
    FetchOrchestrator &orchestrator() noexcept { return orchestrator_; }
    SavedModelResolver &resolver() noexcept { return resolver_; }
    bool chat_initialized() const noexcept { return chatInitialized_; }

private:
    struct SyncState
    {
        std::size_t count = 0;
        std::size_t lastLength = 0;
        bool writing = false;

        bool operator==(const SyncState &other) const
        {
            return count == other.count && lastLength == other.lastLength &&
                   writing == other.writing;
        }
        bool operator!=(const SyncState &other) const { return !(*this == other); }
    };

    SyncState currentSyncState() const;
    void initializeChat();
    void loadChatIntoController(const data::ChatData &chat);
    void syncMessages();
    void syncBotId();

    data::Store &store_;
    ai::ChatController controller_;
    SavedModelResolver resolver_;
    FetchOrchestrator orchestrator_;
    bool chatInitialized_ = false;
    SyncState lastSync_;
};

} // namespace moly::chat
