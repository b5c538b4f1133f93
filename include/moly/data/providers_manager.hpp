#pragma once

#include "moly/ai/bot.hpp"
#include "moly/ai/provider_client.hpp"
#include "moly/data/providers.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace moly::data {

using ClientHandle = std::shared_ptr<const ai::ProviderClient>;
// Builds a client for a provider given its trimmed, non-empty key.
using ClientFactory = std::function<ClientHandle(
    const ProviderPreferences &provider, const std::string &api_key)>;

ClientFactory default_client_factory(long timeout_seconds = 60,
                                     long connect_timeout_seconds = 10);

// One client per provider plus the bots fetched from each, kept in the
// order the providers were fetched.
class ProvidersManager {
public:
  explicit ProvidersManager(ClientFactory factory = {});

  // Replaces all clients and bots. Providers with an empty key are skipped.
  void configure_providers(const std::vector<ProviderPreferences> &providers);

  ClientHandle get_client(const ProviderId &id) const;
  ClientHandle clone_client(const ProviderId &id) const { return get_client(id); }
  ClientHandle get_active_client() const;

  bool set_active_provider(const ProviderId &id);
  const std::optional<ProviderId> &active_provider_id() const noexcept {
    return active_provider_id_;
  }

  void set_provider_bots(const ProviderId &id, std::vector<ai::Bot> bots);
  const std::vector<ai::Bot> &get_all_bots() const noexcept { return all_bots_; }
  const std::vector<ai::Bot> *get_provider_bots(const ProviderId &id) const;
  void clear_all_bots();

  std::optional<ProviderId> get_provider_for_bot(const ai::BotId &bot_id) const;

  bool has_providers() const noexcept { return !clients_.empty(); }
  std::vector<ProviderId> configured_provider_ids() const;

private:
  void rebuild_all_bots();

  ClientFactory factory_;
  // Insertion order of configure_providers
  std::vector<std::pair<ProviderId, ClientHandle>> clients_;
  std::vector<std::pair<ProviderId, std::vector<ai::Bot>>> provider_bots_;
  std::unordered_map<std::string, ProviderId> bot_owner_;
  std::vector<ai::Bot> all_bots_;
  std::optional<ProviderId> active_provider_id_;
};

} // namespace moly::data
