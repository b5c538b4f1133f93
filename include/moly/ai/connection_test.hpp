#pragma once

#include "moly/ai/http.hpp"
#include "moly/ai/result_slot.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace moly::ai {

struct ConnectionResult {
  bool ok = false;
  std::vector<std::string> models;
  std::string error;
};

struct ConnectionTimeouts {
  long timeout_seconds = 60;
  long connect_timeout_seconds = 10;
};

// Probes <url>/models, <url>/v1/models and <url> in that order. A 404
// moves on to the next candidate; any other status ends the probe.
ConnectionResult test_provider_connection(std::string_view url,
                                          std::string_view api_key,
                                          const HttpTransport &transport,
                                          ConnectionTimeouts timeouts = {});

// Runs one connection test at a time on a worker thread. Results are
// collected from the loop thread through poll().
class ConnectionTester {
public:
  struct Outcome {
    std::string provider_id;
    ConnectionResult result;
  };

  explicit ConnectionTester(HttpTransport transport = {},
                            ConnectionTimeouts timeouts = {});
  ~ConnectionTester();

  ConnectionTester(const ConnectionTester &) = delete;
  ConnectionTester &operator=(const ConnectionTester &) = delete;

  // Refused while a previous test has not been polled.
  bool start(std::string provider_id, std::string url, std::string api_key);
  bool running() const noexcept { return worker_.joinable(); }
  std::optional<Outcome> poll();

private:
  HttpTransport transport_;
  ConnectionTimeouts timeouts_;
  std::thread worker_;
  std::atomic<bool> finished_{false};
  ResultSlot<Outcome> slot_;
};

} // namespace moly::ai
