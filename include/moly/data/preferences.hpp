#pragma once

#include "moly/data/providers.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace moly::data {

// User preferences persisted as preferences.json. Every setter writes the
// whole file back.
class Preferences {
public:
  explicit Preferences(std::filesystem::path path);

  static constexpr const char *kFileName = "preferences.json";

  // Reads the file, falling back to defaults, then appends any supported
  // provider that is missing.
  void load();
  bool save() const;

  const std::filesystem::path &path() const noexcept { return path_; }

  bool dark_mode() const noexcept { return dark_mode_; }
  bool sidebar_expanded() const noexcept { return sidebar_expanded_; }
  const std::string &current_view() const noexcept { return current_view_; }
  const std::optional<std::string> &current_chat_model() const noexcept {
    return current_chat_model_;
  }
  const std::vector<ProviderPreferences> &providers() const noexcept {
    return providers_;
  }

  void set_dark_mode(bool dark_mode);
  void set_sidebar_expanded(bool expanded);
  void set_current_view(const std::string &view);
  void set_current_chat_model(std::optional<std::string> model);

  const ProviderPreferences *get_provider(const ProviderId &id) const;
  bool set_provider_api_key(const ProviderId &id,
                            std::optional<std::string> api_key);
  bool set_provider_url(const ProviderId &id, const std::string &url);
  bool set_provider_enabled(const ProviderId &id, bool enabled);
  bool set_provider_models(const ProviderId &id,
                           std::vector<std::pair<std::string, bool>> models);
  bool set_model_enabled(const ProviderId &id, const std::string &model,
                         bool enabled);
  bool set_provider_system_prompt(const ProviderId &id,
                                  std::optional<std::string> prompt);

  bool add_custom_provider(const std::string &name, const std::string &url,
                           std::optional<std::string> api_key,
                           std::string *error_message = nullptr);
  bool delete_provider(const ProviderId &id);

  // Enabled providers with a non-empty key, in list order.
  std::vector<ProviderPreferences> get_enabled_providers() const;
  std::optional<ProviderPreferences> get_active_provider() const;

  void merge_with_supported_providers();

private:
  ProviderPreferences *find_provider(const ProviderId &id);
  void reset_to_defaults();

  std::filesystem::path path_;
  bool dark_mode_ = false;
  bool sidebar_expanded_ = true;
  std::string current_view_ = "Chat";
  std::vector<ProviderPreferences> providers_;
  std::optional<std::string> current_chat_model_;
};

} // namespace moly::data
