#include "moly/data/providers.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace moly::data {

std::string_view provider_type_name(ProviderType type) noexcept {
  switch (type) {
  case ProviderType::OpenAi:
    return "OpenAi";
  case ProviderType::OpenAiRealtime:
    return "OpenAiRealtime";
  case ProviderType::MoFa:
    return "MoFa";
  case ProviderType::MolyServer:
    return "MolyServer";
  }
  return "OpenAi";
}

std::optional<ProviderType> parse_provider_type(std::string_view name) {
  if (name == "OpenAi" || name == "OpenAI")
    return ProviderType::OpenAi;
  if (name == "OpenAiRealtime" || name == "OpenAIRealtime")
    return ProviderType::OpenAiRealtime;
  if (name == "MoFa")
    return ProviderType::MoFa;
  if (name == "MolyServer")
    return ProviderType::MolyServer;
  return std::nullopt;
}

bool ProviderPreferences::is_model_enabled(std::string_view model) const {
  auto it = std::find_if(models.begin(), models.end(),
                         [&](const auto &entry) { return entry.first == model; });
  return it == models.end() || it->second;
}

void to_json(nlohmann::json &j, const ProviderPreferences &provider) {
  j = nlohmann::json{
      {"id", provider.id},
      {"name", provider.name},
      {"url", provider.url},
      {"enabled", provider.enabled},
      {"provider_type", std::string(provider_type_name(provider.provider_type))},
      {"was_customly_added", provider.was_customly_added},
      {"tools_enabled", provider.tools_enabled},
  };
  j["api_key"] = provider.api_key ? nlohmann::json(*provider.api_key)
                                  : nlohmann::json(nullptr);

  nlohmann::json models = nlohmann::json::array();
  for (const auto &[name, enabled] : provider.models)
    models.push_back(nlohmann::json::array({name, enabled}));
  j["models"] = std::move(models);

  if (provider.system_prompt)
    j["system_prompt"] = *provider.system_prompt;
}

void from_json(const nlohmann::json &j, ProviderPreferences &provider) {
  provider = ProviderPreferences{};
  provider.id = j.value("id", std::string());
  provider.name = j.at("name").get<std::string>();
  provider.url = j.at("url").get<std::string>();

  if (auto key = j.find("api_key"); key != j.end() && key->is_string())
    provider.api_key = key->get<std::string>();
  provider.enabled = j.value("enabled", true);
  if (auto type = j.find("provider_type"); type != j.end() && type->is_string())
    provider.provider_type =
        parse_provider_type(type->get<std::string>()).value_or(ProviderType::OpenAi);

  if (auto models = j.find("models"); models != j.end() && models->is_array()) {
    for (const auto &entry : *models) {
      if (entry.is_array() && entry.size() == 2 && entry[0].is_string() &&
          entry[1].is_boolean())
        provider.models.emplace_back(entry[0].get<std::string>(),
                                     entry[1].get<bool>());
    }
  }

  provider.was_customly_added = j.value("was_customly_added", false);
  if (auto prompt = j.find("system_prompt");
      prompt != j.end() && prompt->is_string())
    provider.system_prompt = prompt->get<std::string>();
  provider.tools_enabled = j.value("tools_enabled", true);
}

const std::vector<SupportedProvider> &supported_provider_table() {
  static const std::vector<SupportedProvider> table = {
      {"openai", "OpenAI", "https://api.openai.com/v1"},
      {"anthropic", "Anthropic", "https://api.anthropic.com/v1"},
      {"gemini", "Google Gemini",
       "https://generativelanguage.googleapis.com/v1beta/openai"},
      {"ollama", "Ollama (Local)", "http://localhost:11434/v1"},
      {"groq", "Groq", "https://api.groq.com/openai/v1"},
      {"deepseek", "DeepSeek", "https://api.deepseek.com/v1"},
  };
  return table;
}

std::vector<ProviderPreferences> get_supported_providers() {
  std::vector<ProviderPreferences> providers;
  for (const auto &entry : supported_provider_table()) {
    ProviderPreferences provider;
    provider.id = entry.id;
    provider.name = entry.name;
    provider.url = entry.url;
    providers.push_back(std::move(provider));
  }
  return providers;
}

std::string trim_copy(std::string_view text) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!text.empty() && is_space(text.front()))
    text.remove_prefix(1);
  while (!text.empty() && is_space(text.back()))
    text.remove_suffix(1);
  return std::string(text);
}

ProviderId make_custom_provider_id(std::string_view name) {
  std::string id = trim_copy(name);
  for (auto &c : id) {
    if (c == ' ')
      c = '_';
    else
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return id;
}

std::vector<std::pair<std::string, bool>>
merge_model_flags(const std::vector<std::pair<std::string, bool>> &stored,
                  const std::vector<std::string> &fetched) {
  std::vector<std::pair<std::string, bool>> merged;
  merged.reserve(fetched.size());
  for (const auto &name : fetched) {
    auto it = std::find_if(stored.begin(), stored.end(),
                           [&](const auto &entry) { return entry.first == name; });
    merged.emplace_back(name, it == stored.end() ? true : it->second);
  }
  return merged;
}

} // namespace moly::data
