#pragma once

#include "moly/ai/chat_controller.hpp"
#include "moly/ai/http.hpp"
#include "moly/chat/saved_model_resolver.hpp"
#include "moly/data/preferences.hpp"
#include "moly/data/providers_manager.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace moly::chat
{

// Fetches the model lists of the enabled providers one provider at a time
// and publishes the merged list to the chat controller. Driven by tick().
class FetchOrchestrator
{
public:
    enum class State
    {
        Idle,
        Configuring,
        FetchingProvider,
    };

    struct Event
    {
        enum class Kind
        {
            FetchStarted,
            FetchCompleted,
            FetchFailed,
            FetchSkipped,
            CycleFinished,
        };

        Kind kind;
        data::ProviderId provider; // Empty for CycleFinished
        std::size_t bot_count = 0;
        std::string error;
    };

    using EventCallback = std::function<void(const Event &event)>;

    FetchOrchestrator(ai::ChatController &controller,
                      data::ProvidersManager &providers,
                      data::Preferences &preferences,
                      SavedModelResolver &resolver);

    void set_event_callback(EventCallback callback);

    void tick();
    // Reconfigures on the next idle tick even when the enabled set is
    // unchanged, e.g. after an API key edit.
    void request_refresh() noexcept { refreshRequested_ = true; }

    State state() const noexcept { return state_; }
    bool fetch_in_flight() const noexcept { return state_ == State::FetchingProvider; }
    const std::vector<data::ProviderId> &providers_to_fetch() const noexcept
    {
        return providersToFetch_;
    }
    std::size_t fetch_index() const noexcept { return fetchIndex_; }
    const std::set<data::ProviderId> &fetched_provider_ids() const noexcept
    {
        return fetchedProviderIds_;
    }
    const std::map<data::ProviderId, ai::ClientError> &last_errors() const noexcept
    {
        return lastErrors_;
    }

private:
    void configure(const std::vector<data::ProviderPreferences> &enabled,
                   std::set<data::ProviderId> ids);
    void clearProviders(std::set<data::ProviderId> ids);
    void startNextFetch();
    void pollFetch();
    void finishCycle();
    void emit(Event::Kind kind, const data::ProviderId &provider,
              std::size_t bot_count = 0, std::string error = {});

    ai::ChatController &controller_;
    data::ProvidersManager &providers_;
    data::Preferences &preferences_;
    SavedModelResolver &resolver_;
    EventCallback callback_;

    State state_ = State::Idle;
    bool configuredOnce_ = false;
    bool refreshRequested_ = false;
    std::set<data::ProviderId> configuredIds_;
    std::vector<data::ProviderId> providersToFetch_;
    std::size_t fetchIndex_ = 0;
    std::set<data::ProviderId> fetchedProviderIds_;
    std::map<data::ProviderId, ai::ClientError> lastErrors_;
};

std::string_view fetch_event_name(FetchOrchestrator::Event::Kind kind) noexcept;

} // namespace moly::chat
