#include "moly/data/moly_client.hpp"

#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using moly::ai::HttpRequest;
using moly::ai::HttpResponse;
using moly::data::MolyClient;
using moly::data::ServerConnectionState;
using moly::data::ServerOutcome;
using moly::data::ServerRequest;
using moly::data::ServerRequestRunner;

namespace {

struct ServerTransport {
  long status = 200;
  std::string body;
  std::string failure;
  std::vector<HttpRequest> requests;
  std::shared_ptr<moly::test::Gate> gate;

  moly::ai::HttpTransport bind() {
    return [this](const HttpRequest &request, HttpResponse &response,
                  std::string *error) {
      if (gate)
        gate->wait();
      requests.push_back(request);
      if (!failure.empty()) {
        if (error)
          *error = failure;
        return false;
      }
      response.status = status;
      response.body = body;
      return true;
    };
  }
};

} // namespace

TEST(MolyClientTests, PingUpdatesConnectionStatus) {
  ServerTransport transport;
  MolyClient client(9000, transport.bind());
  EXPECT_EQ(client.base_url(), "http://localhost:9000");
  EXPECT_EQ(client.connection_status().state, ServerConnectionState::Disconnected);

  EXPECT_TRUE(client.test_connection());
  EXPECT_EQ(transport.requests.back().url, "http://localhost:9000/ping");
  EXPECT_EQ(client.connection_status().state, ServerConnectionState::Connected);

  transport.failure = "Failed to connect to server";
  std::string error;
  EXPECT_FALSE(client.test_connection(&error));
  EXPECT_EQ(error, "Failed to connect to Moly Server. Is it running?");
  EXPECT_EQ(client.connection_status().state, ServerConnectionState::Error);
  EXPECT_EQ(client.connection_status().error, error);

  transport.failure.clear();
  transport.status = 500;
  EXPECT_FALSE(client.test_connection(&error));
  EXPECT_EQ(error, "Server returned status: 500");
}

TEST(MolyClientTests, ParsesFeaturedModelsLeniently) {
  ServerTransport transport;
  transport.body = R"([
    {"id": "llama", "name": "Llama 3", "summary": "chat", "size": 8,
     "author": {"name": "Meta"},
     "files": [{"id": "f1", "name": "llama.Q4.gguf", "size": "4.7 GB",
                "quantization": "Q4_K_M", "downloaded": true}]},
    {"id": "tiny", "name": "Tiny", "author": "someone", "files": []}
  ])";
  MolyClient client(8765, transport.bind());

  std::vector<moly::data::ServerModel> models;
  ASSERT_TRUE(client.get_featured_models(models));
  ASSERT_EQ(models.size(), 2u);
  EXPECT_EQ(models[0].author, "Meta");
  EXPECT_EQ(models[0].size, "8");
  ASSERT_EQ(models[0].files.size(), 1u);
  EXPECT_TRUE(models[0].files[0].downloaded);
  EXPECT_EQ(models[1].author, "someone");
  EXPECT_EQ(transport.requests.back().url, "http://localhost:8765/models/featured");
}

TEST(MolyClientTests, SearchEncodesQuery) {
  ServerTransport transport;
  transport.body = "[]";
  MolyClient client(8765, transport.bind());

  std::vector<moly::data::ServerModel> models;
  ASSERT_TRUE(client.search_models("phi 3&x", models));
  EXPECT_TRUE(models.empty());
  EXPECT_EQ(transport.requests.back().url,
            "http://localhost:8765/models/search?q=phi%203%26x");
}

TEST(MolyClientTests, ReportsParseAndStatusErrors) {
  ServerTransport transport;
  transport.body = "{\"not\": \"a list\"}";
  MolyClient client(8765, transport.bind());

  std::vector<moly::data::DownloadedFile> files;
  std::string error;
  EXPECT_FALSE(client.get_downloaded_files(files, &error));
  EXPECT_EQ(error.rfind("Failed to parse response: ", 0), 0u);

  transport.status = 404;
  EXPECT_FALSE(client.get_downloaded_files(files, &error));
  EXPECT_EQ(error, "Server returned status: 404");

  transport.failure = "Connection timed out";
  EXPECT_FALSE(client.get_downloaded_files(files, &error));
  EXPECT_EQ(error, "Request failed: Connection timed out");
}

TEST(MolyClientTests, ParsesDownloads) {
  ServerTransport transport;
  transport.body = R"([{"file": {"id": "f1", "name": "a.gguf"},
                        "model": {"id": "m1", "name": "Model One"},
                        "progress": 42.5, "status": "downloading"}])";
  MolyClient client(8765, transport.bind());

  std::vector<moly::data::PendingDownload> downloads;
  ASSERT_TRUE(client.get_pending_downloads(downloads));
  ASSERT_EQ(downloads.size(), 1u);
  EXPECT_EQ(downloads[0].file.name, "a.gguf");
  EXPECT_EQ(downloads[0].model_name, "Model One");
  EXPECT_DOUBLE_EQ(downloads[0].progress, 42.5);
  EXPECT_EQ(downloads[0].status, "downloading");
}

TEST(MolyClientTests, DownloadCommandsUseExpectedMethods) {
  ServerTransport transport;
  MolyClient client(8765, transport.bind());

  ASSERT_TRUE(client.download_file("f/1"));
  EXPECT_EQ(transport.requests.back().method, "POST");
  EXPECT_EQ(transport.requests.back().url, "http://localhost:8765/downloads");
  EXPECT_EQ(nlohmann::json::parse(transport.requests.back().body)["file_id"], "f/1");

  ASSERT_TRUE(client.pause_download("f/1"));
  EXPECT_EQ(transport.requests.back().method, "POST");
  EXPECT_EQ(transport.requests.back().url, "http://localhost:8765/downloads/f%2F1");

  ASSERT_TRUE(client.cancel_download("f1"));
  EXPECT_EQ(transport.requests.back().method, "DELETE");

  ASSERT_TRUE(client.delete_file("f1"));
  EXPECT_EQ(transport.requests.back().url, "http://localhost:8765/files/f1");

  transport.status = 409;
  transport.body = "already downloading";
  std::string error;
  EXPECT_FALSE(client.download_file("f1", &error));
  EXPECT_EQ(error, "Failed to start download: already downloading");
}

TEST(MolyClientTests, RunnerHandsResultsToLoopThread) {
  ServerTransport transport;
  transport.gate = std::make_shared<moly::test::Gate>();
  transport.body = R"([{"id": "phi", "name": "Phi 3", "files": []}])";
  MolyClient client(8765, transport.bind());
  ServerRequestRunner runner(client);

  ASSERT_TRUE(runner.start(ServerRequest::SearchModels, "phi"));
  EXPECT_TRUE(runner.running());
  EXPECT_FALSE(runner.start(ServerRequest::Ping));
  EXPECT_FALSE(runner.poll().has_value());

  transport.gate->open();
  std::optional<ServerOutcome> outcome;
  ASSERT_TRUE(moly::test::pump_until(
      [] {}, [&] { return (outcome = runner.poll()).has_value(); }));
  EXPECT_FALSE(runner.running());
  EXPECT_EQ(outcome->request, ServerRequest::SearchModels);
  EXPECT_EQ(outcome->argument, "phi");
  EXPECT_TRUE(outcome->ok);
  ASSERT_EQ(outcome->models.size(), 1u);
  EXPECT_EQ(outcome->models[0].name, "Phi 3");
  EXPECT_EQ(transport.requests.back().url,
            "http://localhost:8765/models/search?q=phi");
}

TEST(MolyClientTests, RunnerReportsFailedPing) {
  ServerTransport transport;
  transport.failure = "Failed to connect to server";
  MolyClient client(8765, transport.bind());
  ServerRequestRunner runner(client);

  ASSERT_TRUE(runner.start(ServerRequest::Ping));
  std::optional<ServerOutcome> outcome;
  ASSERT_TRUE(moly::test::pump_until(
      [] {}, [&] { return (outcome = runner.poll()).has_value(); }));
  EXPECT_FALSE(outcome->ok);
  EXPECT_EQ(outcome->error, "Failed to connect to Moly Server. Is it running?");
  EXPECT_EQ(client.connection_status().state, ServerConnectionState::Error);

  transport.failure.clear();
  ASSERT_TRUE(runner.start(ServerRequest::DeleteFile, "f1"));
  ASSERT_TRUE(moly::test::pump_until(
      [] {}, [&] { return (outcome = runner.poll()).has_value(); }));
  EXPECT_TRUE(outcome->ok);
  EXPECT_EQ(transport.requests.back().method, "DELETE");
}
