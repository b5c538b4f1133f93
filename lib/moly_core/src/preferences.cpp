#include "moly/data/preferences.hpp"

#include "moly/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <utility>

namespace moly::data {

Preferences::Preferences(std::filesystem::path path) : path_(std::move(path)) {
  reset_to_defaults();
}

void Preferences::reset_to_defaults() {
  dark_mode_ = false;
  sidebar_expanded_ = true;
  current_view_ = "Chat";
  providers_ = get_supported_providers();
  current_chat_model_.reset();
}

void Preferences::load() {
  reset_to_defaults();

  std::ifstream file(path_);
  if (!file.is_open()) {
    log::debug("preferences", "no preferences file, using defaults");
    return;
  }

  try {
    nlohmann::json document;
    file >> document;

    bool dark_mode = document.value("dark_mode", false);
    bool sidebar_expanded = document.value("sidebar_expanded", true);
    std::string current_view = document.value("current_view", std::string("Chat"));
    std::vector<ProviderPreferences> providers;
    if (auto list = document.find("providers_preferences");
        list != document.end() && !list->is_null())
      providers = list->get<std::vector<ProviderPreferences>>();
    std::optional<std::string> current_chat_model;
    if (auto model = document.find("current_chat_model");
        model != document.end() && model->is_string())
      current_chat_model = model->get<std::string>();

    dark_mode_ = dark_mode;
    sidebar_expanded_ = sidebar_expanded;
    current_view_ = std::move(current_view);
    providers_ = std::move(providers);
    current_chat_model_ = std::move(current_chat_model);
  } catch (const std::exception &e) {
    log::error("preferences",
               std::string("failed to parse preferences: ") + e.what());
    reset_to_defaults();
    return;
  }

  merge_with_supported_providers();
}

bool Preferences::save() const {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      log::error("preferences",
                 "failed to create directory: " + ec.message());
      return false;
    }
  }

  nlohmann::json document;
  document["dark_mode"] = dark_mode_;
  document["sidebar_expanded"] = sidebar_expanded_;
  document["current_view"] = current_view_;
  document["providers_preferences"] = providers_;
  document["current_chat_model"] = current_chat_model_
                                       ? nlohmann::json(*current_chat_model_)
                                       : nlohmann::json(nullptr);

  std::ofstream file(path_);
  if (!file.is_open()) {
    log::error("preferences", "failed to write " + path_.string());
    return false;
  }
  file << document.dump(2);
  return static_cast<bool>(file);
}

void Preferences::set_dark_mode(bool dark_mode) {
  dark_mode_ = dark_mode;
  save();
}

void Preferences::set_sidebar_expanded(bool expanded) {
  sidebar_expanded_ = expanded;
  save();
}

void Preferences::set_current_view(const std::string &view) {
  current_view_ = view;
  save();
}

void Preferences::set_current_chat_model(std::optional<std::string> model) {
  log::info("preferences",
            "current chat model: " + model.value_or(std::string("<none>")));
  current_chat_model_ = std::move(model);
  save();
}

const ProviderPreferences *Preferences::get_provider(const ProviderId &id) const {
  auto it = std::find_if(providers_.begin(), providers_.end(),
                         [&](const auto &p) { return p.id == id; });
  return it == providers_.end() ? nullptr : &*it;
}

ProviderPreferences *Preferences::find_provider(const ProviderId &id) {
  auto it = std::find_if(providers_.begin(), providers_.end(),
                         [&](const auto &p) { return p.id == id; });
  return it == providers_.end() ? nullptr : &*it;
}

bool Preferences::set_provider_api_key(const ProviderId &id,
                                       std::optional<std::string> api_key) {
  auto *provider = find_provider(id);
  if (!provider) {
    log::warn("preferences", "set_provider_api_key: unknown provider " + id);
    return false;
  }
  provider->api_key = std::move(api_key);
  save();
  return true;
}

bool Preferences::set_provider_url(const ProviderId &id,
                                   const std::string &url) {
  auto *provider = find_provider(id);
  if (!provider)
    return false;
  provider->url = url;
  save();
  return true;
}

bool Preferences::set_provider_enabled(const ProviderId &id, bool enabled) {
  auto *provider = find_provider(id);
  if (!provider)
    return false;
  provider->enabled = enabled;
  save();
  return true;
}

bool Preferences::set_provider_models(
    const ProviderId &id, std::vector<std::pair<std::string, bool>> models) {
  auto *provider = find_provider(id);
  if (!provider)
    return false;
  provider->models = std::move(models);
  save();
  return true;
}

bool Preferences::set_model_enabled(const ProviderId &id,
                                    const std::string &model, bool enabled) {
  auto *provider = find_provider(id);
  if (!provider)
    return false;

  auto it = std::find_if(provider->models.begin(), provider->models.end(),
                         [&](const auto &entry) { return entry.first == model; });
  if (it == provider->models.end())
    provider->models.emplace_back(model, enabled);
  else
    it->second = enabled;
  save();
  return true;
}

bool Preferences::set_provider_system_prompt(const ProviderId &id,
                                             std::optional<std::string> prompt) {
  auto *provider = find_provider(id);
  if (!provider)
    return false;
  provider->system_prompt = std::move(prompt);
  save();
  return true;
}

bool Preferences::add_custom_provider(const std::string &name,
                                      const std::string &url,
                                      std::optional<std::string> api_key,
                                      std::string *error_message) {
  std::string trimmed_name = trim_copy(name);
  std::string trimmed_url = trim_copy(url);
  if (trimmed_name.empty() || trimmed_url.empty()) {
    if (error_message)
      *error_message = "Name and URL are required";
    return false;
  }

  ProviderId id = make_custom_provider_id(trimmed_name);
  if (get_provider(id)) {
    if (error_message)
      *error_message = "Provider '" + id + "' already exists";
    return false;
  }

  ProviderPreferences provider;
  provider.id = id;
  provider.name = trimmed_name;
  provider.url = trimmed_url;
  if (api_key && !trim_copy(*api_key).empty())
    provider.api_key = trim_copy(*api_key);
  provider.was_customly_added = true;
  providers_.push_back(std::move(provider));

  log::info("preferences", "added custom provider " + id);
  save();
  return true;
}

bool Preferences::delete_provider(const ProviderId &id) {
  auto it = std::find_if(providers_.begin(), providers_.end(),
                         [&](const auto &p) { return p.id == id; });
  if (it == providers_.end() || !it->was_customly_added) {
    log::warn("preferences", "only custom providers can be deleted: " + id);
    return false;
  }
  providers_.erase(it);
  save();
  return true;
}

std::vector<ProviderPreferences> Preferences::get_enabled_providers() const {
  std::vector<ProviderPreferences> enabled;
  for (const auto &provider : providers_) {
    if (provider.enabled && provider.has_api_key())
      enabled.push_back(provider);
  }
  return enabled;
}

std::optional<ProviderPreferences> Preferences::get_active_provider() const {
  for (const auto &provider : providers_) {
    if (provider.enabled && provider.has_api_key())
      return provider;
  }
  return std::nullopt;
}

void Preferences::merge_with_supported_providers() {
  for (auto &supported : get_supported_providers()) {
    if (!get_provider(supported.id))
      providers_.push_back(std::move(supported));
  }
}

} // namespace moly::data
