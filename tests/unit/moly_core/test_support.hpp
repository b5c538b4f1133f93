#pragma once

#include "moly/ai/provider_client.hpp"
#include "moly/data/providers_manager.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace moly::test {

// Blocks worker threads until the test opens it.
class Gate {
public:
  void open() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return open_; });
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
};

struct FakeProviderSpec {
  std::vector<std::string> models;
  std::optional<ai::ClientError> list_error;
  std::vector<ai::MessageContent> chunks;
  std::optional<ai::ClientError> stream_error;
  std::shared_ptr<Gate> list_gate;
  std::shared_ptr<Gate> stream_gate;
};

class FakeProviderClient : public ai::ProviderClient {
public:
  FakeProviderClient(std::string url, FakeProviderSpec spec)
      : url_(std::move(url)), spec_(std::move(spec)) {}

  const std::string &url() const override { return url_; }

  ai::ModelsResult list_models() const override {
    if (spec_.list_gate)
      spec_.list_gate->wait();
    ai::ModelsResult result;
    if (spec_.list_error) {
      result.error = spec_.list_error;
      return result;
    }
    for (const auto &model : spec_.models)
      result.bots.push_back(ai::Bot{ai::BotId(model, url_), model, std::nullopt});
    return result;
  }

  std::optional<ai::ClientError>
  stream_completion(const ai::BotId &, const std::vector<ai::Message> &history,
                    const ai::ChunkCallback &on_chunk,
                    const ai::CancelCheck &) const override {
    {
      std::lock_guard<std::mutex> lock(history_mutex_);
      last_history_ = history;
    }
    if (spec_.stream_gate)
      spec_.stream_gate->wait();
    for (const auto &chunk : spec_.chunks) {
      if (!on_chunk(chunk))
        return ai::ClientError{ai::ErrorKind::Cancelled, "Cancelled", 0};
    }
    return spec_.stream_error;
  }

  std::vector<ai::Message> last_history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return last_history_;
  }

private:
  std::string url_;
  FakeProviderSpec spec_;
  mutable std::mutex history_mutex_;
  mutable std::vector<ai::Message> last_history_;
};

// Hands out fake clients per provider id and records what it built.
class FakeClientFactory {
public:
  std::map<data::ProviderId, FakeProviderSpec> specs;
  std::vector<data::ProviderId> created;
  std::map<data::ProviderId, std::string> keys;

  data::ClientFactory factory() {
    return [this](const data::ProviderPreferences &provider,
                  const std::string &api_key) -> data::ClientHandle {
      created.push_back(provider.id);
      keys[provider.id] = api_key;
      return std::make_shared<FakeProviderClient>(provider.url,
                                                  specs[provider.id]);
    };
  }
};

inline std::filesystem::path make_temp_dir(const std::string &prefix) {
  auto dir = std::filesystem::temp_directory_path() /
             (prefix + "_" +
              std::to_string(
                  std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

// Calls step until done() holds or the timeout passes.
inline bool pump_until(const std::function<void()> &step,
                       const std::function<bool()> &done,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(5000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    step();
    if (done())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return false;
}

} // namespace moly::test
