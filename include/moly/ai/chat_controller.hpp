#pragma once

#include "moly/ai/bot.hpp"
#include "moly/ai/message.hpp"
#include "moly/ai/provider_client.hpp"
#include "moly/ai/result_slot.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace moly::ai
{

    // Chat state owned by the loop thread. Model loads and completions run
    // on worker threads that hand back results through mailboxes only.
    class ChatController
    {
    public:
        struct LoadResult
        {
            std::string provider_url;
            ModelsResult models;
        };

        ChatController() = default;
        ~ChatController();

        ChatController(const ChatController &) = delete;
        ChatController &operator=(const ChatController &) = delete;

        const std::vector<Bot> &bots() const noexcept { return bots_; }
        void set_bots(std::vector<Bot> bots);
        void clear_bots();

        const std::optional<BotId> &bot_id() const noexcept { return botId_; }
        void set_bot_id(std::optional<BotId> id);

        const std::vector<Message> &messages() const noexcept { return messages_; }
        void set_messages(std::vector<Message> messages);
        void clear_messages();

        std::shared_ptr<const ProviderClient> client() const { return client_; }
        void set_client(std::shared_ptr<const ProviderClient> client);

        // Starts listing the current client's models. Refused without a
        // client or while a previous load has not been taken.
        bool dispatch_load();
        bool load_in_flight() const noexcept { return loadWorker_.joinable(); }
        std::optional<LoadResult> take_load_result();

        // Appends the user message and a writing placeholder, then streams
        // the reply for the selected bot.
        bool send_message(std::string text);
        bool response_in_progress() const noexcept { return activeResponse_ != nullptr; }
        // Moves streamed text into the placeholder. Returns true when the
        // message list changed.
        bool poll();
        // Stops the reply where it is. Does not wait for the worker; it is
        // joined by a later poll() once the transfer has wound down.
        void cancel_response();

    private:
        struct ResponseTask
        {
            std::thread worker;
            std::atomic<bool> cancel{false};
            std::atomic<bool> finished{false};
            std::size_t messageIndex = 0;

            std::mutex mutex;
            std::string pendingText;
            std::string pendingReasoning;
            std::optional<ClientError> error;
        };

        bool drainResponse(ResponseTask &task);
        void finishResponse();
        void reapCancelled(bool wait);

        std::vector<Bot> bots_;
        std::optional<BotId> botId_;
        std::vector<Message> messages_;
        std::shared_ptr<const ProviderClient> client_;

        std::thread loadWorker_;
        std::atomic<bool> loadFinished_{false};
        ResultSlot<LoadResult> loadSlot_;

        std::unique_ptr<ResponseTask> activeResponse_;
        std::vector<std::unique_ptr<ResponseTask>> cancelledResponses_;
    };

} // namespace moly::ai
