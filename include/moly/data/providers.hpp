#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace moly::data {

using ProviderId = std::string;

enum class ProviderType {
  OpenAi,
  OpenAiRealtime,
  MoFa,
  MolyServer,
};

std::string_view provider_type_name(ProviderType type) noexcept;
std::optional<ProviderType> parse_provider_type(std::string_view name);

struct ProviderPreferences {
  ProviderId id;
  std::string name;
  std::string url;
  std::optional<std::string> api_key;
  bool enabled = true;
  ProviderType provider_type = ProviderType::OpenAi;
  // (model name, enabled) in the order the provider reported them
  std::vector<std::pair<std::string, bool>> models;
  bool was_customly_added = false;
  std::optional<std::string> system_prompt;
  bool tools_enabled = true;

  bool has_api_key() const noexcept {
    return api_key.has_value() && !api_key->empty();
  }
  // False only when the model has an explicit disabled flag.
  bool is_model_enabled(std::string_view model) const;
};

void to_json(nlohmann::json &j, const ProviderPreferences &provider);
void from_json(const nlohmann::json &j, ProviderPreferences &provider);

struct SupportedProvider {
  const char *id;
  const char *name;
  const char *url;
};

// Built-in providers, in the order they are offered.
const std::vector<SupportedProvider> &supported_provider_table();
std::vector<ProviderPreferences> get_supported_providers();

// Id for a user-added provider: trimmed, lowercased, spaces as '_'.
ProviderId make_custom_provider_id(std::string_view name);

// Fetched names keep their stored flag; new names default to enabled.
std::vector<std::pair<std::string, bool>>
merge_model_flags(const std::vector<std::pair<std::string, bool>> &stored,
                  const std::vector<std::string> &fetched);

std::string trim_copy(std::string_view text);

} // namespace moly::data
