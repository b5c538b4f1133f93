#include "moly/chat/saved_model_resolver.hpp"

#include "moly/log.hpp"

namespace moly::chat
{

namespace
{
constexpr std::string_view kModelsPrefix = "models/";

bool names_match(const std::string &saved, const std::string &candidate)
{
    if (saved == candidate)
        return true;
    auto with_prefix = [](const std::string &name) {
        return std::string(kModelsPrefix) + name;
    };
    return candidate == with_prefix(saved) || saved == with_prefix(candidate);
}
} // namespace

std::string_view match_kind_name(MatchKind kind) noexcept
{
    switch (kind)
    {
    case MatchKind::Exact:
        return "exact";
    case MatchKind::PrefixFuzzy:
        return "prefix-fuzzy";
    case MatchKind::FallbackFirst:
        return "fallback-first";
    case MatchKind::NoSavedModel:
        return "no-saved-model";
    case MatchKind::NoBots:
        return "no-bots";
    }
    return "no-bots";
}

ai::ParsedBotId parse_bot_id_string(std::string_view raw)
{
    return ai::parse_bot_id(raw);
}

Resolution resolve(const std::optional<std::string> &saved,
                   const std::vector<ai::Bot> &bots)
{
    if (bots.empty())
        return {std::nullopt, MatchKind::NoBots};
    if (!saved || saved->empty())
        return {0, MatchKind::NoSavedModel};

    for (std::size_t i = 0; i < bots.size(); ++i)
    {
        if (bots[i].id.as_str() == *saved)
            return {i, MatchKind::Exact};
    }

    auto wanted = parse_bot_id_string(*saved);
    if (!wanted.model.empty())
    {
        for (std::size_t i = 0; i < bots.size(); ++i)
        {
            auto candidate = parse_bot_id_string(bots[i].id.as_str());
            if (candidate.provider == wanted.provider &&
                names_match(wanted.model, candidate.model))
                return {i, MatchKind::PrefixFuzzy};
        }
    }

    return {0, MatchKind::FallbackFirst};
}

SavedModelResolver::SavedModelResolver(ai::ChatController &controller,
                                       data::ProvidersManager &providers,
                                       data::Preferences &preferences)
    : controller_(controller), providers_(providers), preferences_(preferences)
{
}

std::optional<Resolution> SavedModelResolver::restore()
{
    if (restored_)
        return std::nullopt;

    const auto &bots = controller_.bots();
    const auto &saved = preferences_.current_chat_model();
    Resolution resolution = resolve(saved, bots);
    restored_ = true;

    if (!resolution.index)
    {
        log::debug("resolver", "no bots available, nothing to restore");
        return resolution;
    }

    const ai::Bot &bot = bots[*resolution.index];
    log::info("resolver", "restored " + bot.id.as_str() + " (" +
                              std::string(match_kind_name(resolution.kind)) + ")");

    switch_to_provider_for_bot(bot.id);
    controller_.set_bot_id(bot.id);

    if (!saved || *saved != bot.id.as_str())
        persist(bot.id.as_str());
    else
        lastSavedBotId_ = bot.id.as_str();
    return resolution;
}

void SavedModelResolver::track_model_selection()
{
    if (!restored_)
        return;

    const auto &current = controller_.bot_id();
    if (!current)
        return;
    if (lastSavedBotId_ && *lastSavedBotId_ == current->as_str())
        return;

    switch_to_provider_for_bot(*current);
    persist(current->as_str());
}

bool SavedModelResolver::switch_to_provider_for_bot(const ai::BotId &bot_id)
{
    auto provider_id = providers_.get_provider_for_bot(bot_id);
    if (!provider_id)
    {
        log::warn("resolver", "no provider owns " + bot_id.as_str());
        return false;
    }
    if (!providers_.set_active_provider(*provider_id))
        return false;
    controller_.set_client(providers_.clone_client(*provider_id));
    return true;
}

void SavedModelResolver::persist(const std::string &bot_id)
{
    lastSavedBotId_ = bot_id;
    preferences_.set_current_chat_model(bot_id);
}

} // namespace moly::chat
