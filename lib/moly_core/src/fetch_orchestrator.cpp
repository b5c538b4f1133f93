#include "moly/chat/fetch_orchestrator.hpp"

#include "moly/log.hpp"

#include <algorithm>
#include <utility>

namespace moly::chat
{

std::string_view fetch_event_name(FetchOrchestrator::Event::Kind kind) noexcept
{
    using Kind = FetchOrchestrator::Event::Kind;
    switch (kind)
    {
    case Kind::FetchStarted:
        return "fetch-started";
    case Kind::FetchCompleted:
        return "fetch-completed";
    case Kind::FetchFailed:
        return "fetch-failed";
    case Kind::FetchSkipped:
        return "fetch-skipped";
    case Kind::CycleFinished:
        return "cycle-finished";
    }
    return "fetch-started";
}

FetchOrchestrator::FetchOrchestrator(ai::ChatController &controller,
                                     data::ProvidersManager &providers,
                                     data::Preferences &preferences,
                                     SavedModelResolver &resolver)
    : controller_(controller), providers_(providers), preferences_(preferences),
      resolver_(resolver)
{
}

void FetchOrchestrator::set_event_callback(EventCallback callback)
{
    callback_ = std::move(callback);
}

void FetchOrchestrator::emit(Event::Kind kind, const data::ProviderId &provider,
                             std::size_t bot_count, std::string error)
{
    if (!callback_)
        return;
    Event event{kind, provider, bot_count, std::move(error)};
    callback_(event);
}

void FetchOrchestrator::tick()
{
    if (state_ == State::FetchingProvider)
    {
        pollFetch();
        return;
    }

    auto enabled = preferences_.get_enabled_providers();
    std::set<data::ProviderId> ids;
    for (const auto &provider : enabled)
        ids.insert(provider.id);

    if (configuredOnce_ && !refreshRequested_ && ids == configuredIds_)
        return;
    refreshRequested_ = false;

    if (ids.empty())
    {
        clearProviders(std::move(ids));
        return;
    }
    configure(enabled, std::move(ids));
}

void FetchOrchestrator::clearProviders(std::set<data::ProviderId> ids)
{
    log::info("fetch", "no enabled providers, clearing bots");
    providers_.configure_providers({});
    providers_.clear_all_bots();
    controller_.clear_bots();
    controller_.set_bot_id(std::nullopt);
    resolver_.reset();

    providersToFetch_.clear();
    fetchIndex_ = 0;
    fetchedProviderIds_.clear();
    configuredIds_ = std::move(ids);
    configuredOnce_ = true;
    state_ = State::Idle;
}

void FetchOrchestrator::configure(const std::vector<data::ProviderPreferences> &enabled,
                                  std::set<data::ProviderId> ids)
{
    state_ = State::Configuring;
    log::info("fetch", "configuring " + std::to_string(enabled.size()) + " providers");

    providers_.clear_all_bots();
    controller_.clear_bots();
    resolver_.reset();
    providers_.configure_providers(enabled);

    providersToFetch_.clear();
    for (const auto &provider : enabled)
        providersToFetch_.push_back(provider.id);
    fetchIndex_ = 0;
    fetchedProviderIds_.clear();
    lastErrors_.clear();
    configuredIds_ = std::move(ids);
    configuredOnce_ = true;

    startNextFetch();
}

void FetchOrchestrator::startNextFetch()
{
    while (fetchIndex_ < providersToFetch_.size())
    {
        const auto &provider_id = providersToFetch_[fetchIndex_];
        auto client = providers_.clone_client(provider_id);
        if (!client)
        {
            log::warn("fetch", "no client for " + provider_id + ", skipping");
            emit(Event::Kind::FetchSkipped, provider_id);
            ++fetchIndex_;
            continue;
        }

        controller_.set_client(std::move(client));
        if (!controller_.dispatch_load())
        {
            ai::ClientError error{ai::ErrorKind::Network, "Load could not be dispatched", 0};
            lastErrors_[provider_id] = error;
            emit(Event::Kind::FetchFailed, provider_id, 0, error.message);
            ++fetchIndex_;
            continue;
        }

        state_ = State::FetchingProvider;
        log::debug("fetch", "fetching models from " + provider_id);
        emit(Event::Kind::FetchStarted, provider_id);
        return;
    }

    finishCycle();
}

void FetchOrchestrator::pollFetch()
{
    auto result = controller_.take_load_result();
    if (!result)
        return;

    const data::ProviderId provider_id = providersToFetch_[fetchIndex_];
    if (result->models.ok())
    {
        std::vector<ai::Bot> bots = std::move(result->models.bots);
        if (const auto *provider = preferences_.get_provider(provider_id))
        {
            bots.erase(std::remove_if(bots.begin(), bots.end(),
                                      [provider](const ai::Bot &bot) {
                                          return !provider->is_model_enabled(bot.id.id());
                                      }),
                       bots.end());
        }

        std::size_t count = bots.size();
        providers_.set_provider_bots(provider_id, std::move(bots));
        fetchedProviderIds_.insert(provider_id);
        log::info("fetch", provider_id + ": " + std::to_string(count) + " models");
        emit(Event::Kind::FetchCompleted, provider_id, count);
    }
    else
    {
        const ai::ClientError &error = *result->models.error;
        log::error("fetch", provider_id + ": " + error.message);
        lastErrors_[provider_id] = error;
        emit(Event::Kind::FetchFailed, provider_id, 0, error.message);
    }

    ++fetchIndex_;
    startNextFetch();
}

void FetchOrchestrator::finishCycle()
{
    state_ = State::Idle;
    const auto &all_bots = providers_.get_all_bots();
    controller_.set_bots(all_bots);
    log::info("fetch", "fetch cycle finished with " + std::to_string(all_bots.size()) + " bots");
    emit(Event::Kind::CycleFinished, {}, all_bots.size());
    resolver_.restore();
}

} // namespace moly::chat
