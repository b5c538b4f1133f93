#include "moly/data/providers_manager.hpp"

#include "moly/ai/http.hpp"
#include "moly/ai/openai_client.hpp"
#include "moly/log.hpp"

#include <algorithm>

namespace moly::data {

namespace {
std::string without_trailing_slash(std::string_view url) {
  while (!url.empty() && url.back() == '/')
    url.remove_suffix(1);
  return std::string(url);
}
} // namespace

ClientFactory default_client_factory(long timeout_seconds,
                                     long connect_timeout_seconds) {
  return [timeout_seconds, connect_timeout_seconds](
             const ProviderPreferences &provider,
             const std::string &api_key) -> ClientHandle {
    ai::OpenAiClient::Options options;
    options.timeout_seconds = timeout_seconds;
    options.connect_timeout_seconds = connect_timeout_seconds;
    options.system_prompt = provider.system_prompt;
    return std::make_shared<ai::OpenAiClient>(provider.url, api_key,
                                              std::move(options));
  };
}

ProvidersManager::ProvidersManager(ClientFactory factory)
    : factory_(std::move(factory)) {
  if (!factory_)
    factory_ = default_client_factory();
}

void ProvidersManager::configure_providers(
    const std::vector<ProviderPreferences> &providers) {
  clients_.clear();
  provider_bots_.clear();
  bot_owner_.clear();
  all_bots_.clear();

  for (const auto &provider : providers) {
    std::string api_key = trim_copy(provider.api_key.value_or(std::string()));
    if (api_key.empty()) {
      log::warn("providers", "skipping " + provider.id + ": no API key");
      continue;
    }
    if (!ai::OpenAiClient::is_valid_key(api_key)) {
      log::warn("providers", "skipping " + provider.id + ": invalid API key");
      continue;
    }

    ClientHandle client = factory_(provider, api_key);
    if (!client) {
      log::warn("providers", "no client for " + provider.id);
      continue;
    }

    log::info("providers",
              "configured client for " + provider.id + " (" + provider.url + ")");
    clients_.emplace_back(provider.id, std::move(client));
  }

  if (active_provider_id_ && !get_client(*active_provider_id_))
    active_provider_id_.reset();
  if (!active_provider_id_ && !clients_.empty())
    active_provider_id_ = clients_.front().first;
}

ClientHandle ProvidersManager::get_client(const ProviderId &id) const {
  auto it = std::find_if(clients_.begin(), clients_.end(),
                         [&](const auto &entry) { return entry.first == id; });
  return it == clients_.end() ? nullptr : it->second;
}

ClientHandle ProvidersManager::get_active_client() const {
  return active_provider_id_ ? get_client(*active_provider_id_) : nullptr;
}

bool ProvidersManager::set_active_provider(const ProviderId &id) {
  if (!get_client(id)) {
    log::warn("providers", "cannot activate " + id + ": not configured");
    return false;
  }
  active_provider_id_ = id;
  log::info("providers", "active provider: " + id);
  return true;
}

void ProvidersManager::set_provider_bots(const ProviderId &id,
                                         std::vector<ai::Bot> bots) {
  log::info("providers", "setting " + std::to_string(bots.size()) +
                             " bots for " + id);

  for (auto it = bot_owner_.begin(); it != bot_owner_.end();) {
    if (it->second == id)
      it = bot_owner_.erase(it);
    else
      ++it;
  }
  for (const auto &bot : bots)
    bot_owner_[bot.id.as_str()] = id;

  auto it = std::find_if(provider_bots_.begin(), provider_bots_.end(),
                         [&](const auto &entry) { return entry.first == id; });
  if (it != provider_bots_.end())
    it->second = std::move(bots);
  else
    provider_bots_.emplace_back(id, std::move(bots));

  rebuild_all_bots();
}

const std::vector<ai::Bot> *
ProvidersManager::get_provider_bots(const ProviderId &id) const {
  auto it = std::find_if(provider_bots_.begin(), provider_bots_.end(),
                         [&](const auto &entry) { return entry.first == id; });
  return it == provider_bots_.end() ? nullptr : &it->second;
}

void ProvidersManager::rebuild_all_bots() {
  all_bots_.clear();
  for (const auto &entry : provider_bots_)
    all_bots_.insert(all_bots_.end(), entry.second.begin(), entry.second.end());
  log::debug("providers",
             "total bots from all providers: " + std::to_string(all_bots_.size()));
}

void ProvidersManager::clear_all_bots() {
  provider_bots_.clear();
  bot_owner_.clear();
  all_bots_.clear();
}

std::optional<ProviderId>
ProvidersManager::get_provider_for_bot(const ai::BotId &bot_id) const {
  if (auto it = bot_owner_.find(bot_id.as_str()); it != bot_owner_.end())
    return it->second;

  std::string token = without_trailing_slash(bot_id.provider());
  if (token.empty())
    return std::nullopt;
  for (const auto &[id, client] : clients_) {
    if (token == id || token == without_trailing_slash(client->url()))
      return id;
  }
  return std::nullopt;
}

std::vector<ProviderId> ProvidersManager::configured_provider_ids() const {
  std::vector<ProviderId> ids;
  ids.reserve(clients_.size());
  for (const auto &entry : clients_)
    ids.push_back(entry.first);
  return ids;
}

} // namespace moly::data
