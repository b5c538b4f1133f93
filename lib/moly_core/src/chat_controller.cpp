#include "moly/ai/chat_controller.hpp"

#include "moly/log.hpp"

#include <utility>

namespace moly::ai
{

    ChatController::~ChatController()
    {
        cancel_response();
        reapCancelled(true);
        if (loadWorker_.joinable())
            loadWorker_.join();
    }

    void ChatController::set_bots(std::vector<Bot> bots)
    {
        bots_ = std::move(bots);
    }

    void ChatController::clear_bots()
    {
        bots_.clear();
    }

    void ChatController::set_bot_id(std::optional<BotId> id)
    {
        botId_ = std::move(id);
    }

    void ChatController::set_messages(std::vector<Message> messages)
    {
        cancel_response();
        messages_ = std::move(messages);
    }

    void ChatController::clear_messages()
    {
        cancel_response();
        messages_.clear();
    }

    void ChatController::set_client(std::shared_ptr<const ProviderClient> client)
    {
        client_ = std::move(client);
    }

    bool ChatController::dispatch_load()
    {
        if (!client_)
        {
            log::warn("controller", "no client to load models from");
            return false;
        }
        if (loadWorker_.joinable())
        {
            log::warn("controller", "model load already in flight");
            return false;
        }

        loadFinished_.store(false, std::memory_order_release);
        loadWorker_ = std::thread([this, client = client_]() {
            LoadResult result;
            result.provider_url = client->url();
            result.models = client->list_models();
            loadSlot_.put(std::move(result));
            loadFinished_.store(true, std::memory_order_release);
        });
        return true;
    }

    std::optional<ChatController::LoadResult> ChatController::take_load_result()
    {
        if (!loadWorker_.joinable() || !loadFinished_.load(std::memory_order_acquire))
            return std::nullopt;
        loadWorker_.join();
        return loadSlot_.take();
    }

    bool ChatController::send_message(std::string text)
    {
        if (activeResponse_)
        {
            log::warn("controller", "a response is still being written");
            return false;
        }
        if (!client_ || !botId_)
        {
            log::warn("controller", "no bot selected, message not sent");
            return false;
        }

        messages_.push_back(Message::user(std::move(text)));
        std::vector<Message> history = messages_;

        Message placeholder = Message::bot(*botId_);
        placeholder.is_writing = true;
        messages_.push_back(std::move(placeholder));

        auto task = std::make_unique<ResponseTask>();
        task->messageIndex = messages_.size() - 1;

        ResponseTask *rawTask = task.get();
        rawTask->worker = std::thread([rawTask, client = client_, bot = *botId_,
                                       history = std::move(history)]() {
            auto error = client->stream_completion(
                bot, history,
                [rawTask](const MessageContent &delta) {
                    if (rawTask->cancel.load(std::memory_order_acquire))
                        return false;
                    std::lock_guard<std::mutex> lock(rawTask->mutex);
                    rawTask->pendingText.append(delta.text);
                    rawTask->pendingReasoning.append(delta.reasoning);
                    return true;
                },
                [rawTask]() { return rawTask->cancel.load(std::memory_order_acquire); });
            {
                std::lock_guard<std::mutex> lock(rawTask->mutex);
                rawTask->error = std::move(error);
            }
            rawTask->finished.store(true, std::memory_order_release);
        });

        activeResponse_ = std::move(task);
        return true;
    }

    bool ChatController::drainResponse(ResponseTask &task)
    {
        std::string text;
        std::string reasoning;
        {
            std::lock_guard<std::mutex> lock(task.mutex);
            text.swap(task.pendingText);
            reasoning.swap(task.pendingReasoning);
        }
        if ((text.empty() && reasoning.empty()) || task.messageIndex >= messages_.size())
            return false;

        auto &content = messages_[task.messageIndex].content;
        content.text.append(text);
        content.reasoning.append(reasoning);
        return true;
    }

    void ChatController::finishResponse()
    {
        if (!activeResponse_)
            return;

        ResponseTask &task = *activeResponse_;
        if (task.worker.joinable())
            task.worker.join();
        drainResponse(task);

        if (task.messageIndex < messages_.size())
        {
            Message &message = messages_[task.messageIndex];
            message.is_writing = false;
            if (task.error && task.error->kind != ErrorKind::Cancelled)
            {
                log::error("controller", task.error->message);
                if (!message.content.text.empty())
                    message.content.text.push_back('\n');
                message.content.text.append("[error] " + task.error->message);
            }
        }
        activeResponse_.reset();
    }

    void ChatController::reapCancelled(bool wait)
    {
        auto it = cancelledResponses_.begin();
        while (it != cancelledResponses_.end())
        {
            ResponseTask &task = **it;
            if (!wait && !task.finished.load(std::memory_order_acquire))
            {
                ++it;
                continue;
            }
            if (task.worker.joinable())
                task.worker.join();
            it = cancelledResponses_.erase(it);
        }
    }

    bool ChatController::poll()
    {
        reapCancelled(false);
        if (!activeResponse_)
            return false;

        if (activeResponse_->finished.load(std::memory_order_acquire))
        {
            finishResponse();
            return true;
        }
        return drainResponse(*activeResponse_);
    }

    void ChatController::cancel_response()
    {
        if (!activeResponse_)
            return;

        ResponseTask &task = *activeResponse_;
        task.cancel.store(true, std::memory_order_release);
        if (task.finished.load(std::memory_order_acquire))
        {
            finishResponse();
            return;
        }

        drainResponse(task);
        if (task.messageIndex < messages_.size())
            messages_[task.messageIndex].is_writing = false;
        cancelledResponses_.push_back(std::move(activeResponse_));
    }

} // namespace moly::ai
