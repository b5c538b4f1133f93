#pragma once

#include "moly/ai/bot.hpp"
#include "moly/ai/chat_controller.hpp"
#include "moly/data/preferences.hpp"
#include "moly/data/providers_manager.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moly::chat
{

enum class MatchKind
{
    Exact,
    PrefixFuzzy,
    FallbackFirst,
    NoSavedModel,
    NoBots,
};

std::string_view match_kind_name(MatchKind kind) noexcept;

struct Resolution
{
    std::optional<std::size_t> index; // Empty only for MatchKind::NoBots
    MatchKind kind = MatchKind::NoBots;
};

ai::ParsedBotId parse_bot_id_string(std::string_view raw);

// Picks the bot for a persisted selection: exact id, then same provider
// with names equal up to a "models/" prefix, then the first bot.
Resolution resolve(const std::optional<std::string> &saved,
                   const std::vector<ai::Bot> &bots);

// Applies resolve() once per fetch cycle and afterwards persists every
// change of the selected bot.
class SavedModelResolver
{
public:
    SavedModelResolver(ai::ChatController &controller,
                       data::ProvidersManager &providers,
                       data::Preferences &preferences);

    bool restored() const noexcept { return restored_; }
    // Re-arms restore() for the next fetch cycle.
    void reset() noexcept { restored_ = false; }

    // No-op returning std::nullopt once restored.
    std::optional<Resolution> restore();
    void track_model_selection();
    bool switch_to_provider_for_bot(const ai::BotId &bot_id);

    const std::optional<std::string> &last_saved_bot_id() const noexcept
    {
        return lastSavedBotId_;
    }

private:
    void persist(const std::string &bot_id);

    ai::ChatController &controller_;
    data::ProvidersManager &providers_;
    data::Preferences &preferences_;
    bool restored_ = false;
    std::optional<std::string> lastSavedBotId_;
};

} // namespace moly::chat
