#include "moly/ai/chat_controller.hpp"
#include "moly/ai/openai_client.hpp"

#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

using moly::ai::BotId;
using moly::ai::ChatController;
using moly::ai::ClientError;
using moly::ai::ErrorKind;
using moly::ai::MessageContent;
using moly::test::FakeProviderClient;
using moly::test::FakeProviderSpec;

namespace {

const char *kUrl = "https://api.example.com/v1";

std::shared_ptr<FakeProviderClient> make_client(FakeProviderSpec spec) {
  return std::make_shared<FakeProviderClient>(kUrl, std::move(spec));
}

bool wait_for_response(ChatController &controller) {
  return moly::test::pump_until([&] { controller.poll(); },
                                [&] { return !controller.response_in_progress(); });
}

// Opens the gate shortly after the caller starts blocking on a join.
std::thread open_later(const std::shared_ptr<moly::test::Gate> &gate) {
  return std::thread([gate] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gate->open();
  });
}

} // namespace

TEST(ChatControllerTests, SendNeedsClientAndBot) {
  ChatController controller;
  EXPECT_FALSE(controller.send_message("hi"));

  controller.set_client(make_client({}));
  EXPECT_FALSE(controller.send_message("hi"));
  EXPECT_TRUE(controller.messages().empty());
}

TEST(ChatControllerTests, StreamsIntoWritingPlaceholder) {
  FakeProviderSpec spec;
  spec.chunks = {MessageContent{"Hel", ""}, MessageContent{"lo", "because"}};
  auto client = make_client(spec);

  ChatController controller;
  controller.set_client(client);
  controller.set_bot_id(BotId("gpt-4o", kUrl));

  ASSERT_TRUE(controller.send_message("Say hello"));
  ASSERT_EQ(controller.messages().size(), 2u);
  EXPECT_EQ(controller.messages()[0].content.text, "Say hello");
  EXPECT_EQ(controller.messages()[1].from, moly::ai::EntityKind::Bot);
  EXPECT_TRUE(controller.messages()[1].is_writing);
  EXPECT_TRUE(controller.response_in_progress());
  EXPECT_FALSE(controller.send_message("again"));

  ASSERT_TRUE(wait_for_response(controller));
  const auto &reply = controller.messages()[1];
  EXPECT_EQ(reply.content.text, "Hello");
  EXPECT_EQ(reply.content.reasoning, "because");
  EXPECT_FALSE(reply.is_writing);
  ASSERT_TRUE(reply.bot_id.has_value());
  EXPECT_EQ(*reply.bot_id, BotId("gpt-4o", kUrl));

  auto history = client->last_history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].content.text, "Say hello");
}

TEST(ChatControllerTests, StreamErrorIsAppendedToReply) {
  FakeProviderSpec spec;
  spec.chunks = {MessageContent{"partial", ""}};
  spec.stream_error = ClientError{ErrorKind::Network, "Connection timed out", 0};

  ChatController controller;
  controller.set_client(make_client(spec));
  controller.set_bot_id(BotId("gpt-4o", kUrl));
  ASSERT_TRUE(controller.send_message("hi"));
  ASSERT_TRUE(wait_for_response(controller));

  EXPECT_EQ(controller.messages()[1].content.text, "partial\n[error] Connection timed out");
  EXPECT_FALSE(controller.messages()[1].is_writing);
}

TEST(ChatControllerTests, ErrorWithoutTextHasNoLeadingNewline) {
  FakeProviderSpec spec;
  spec.stream_error = ClientError{ErrorKind::Unauthorized, "Invalid API key", 401};

  ChatController controller;
  controller.set_client(make_client(spec));
  controller.set_bot_id(BotId("gpt-4o", kUrl));
  ASSERT_TRUE(controller.send_message("hi"));
  ASSERT_TRUE(wait_for_response(controller));
  EXPECT_EQ(controller.messages()[1].content.text, "[error] Invalid API key");
}

TEST(ChatControllerTests, CancelLeavesReplyWithoutError) {
  auto gate = std::make_shared<moly::test::Gate>();
  FakeProviderSpec spec;
  spec.chunks = {MessageContent{"late", ""}};
  spec.stream_gate = gate;

  ChatController controller;
  controller.set_client(make_client(spec));
  controller.set_bot_id(BotId("gpt-4o", kUrl));
  ASSERT_TRUE(controller.send_message("hi"));

  auto opener = open_later(gate);
  controller.cancel_response();
  opener.join();

  EXPECT_FALSE(controller.response_in_progress());
  ASSERT_EQ(controller.messages().size(), 2u);
  EXPECT_FALSE(controller.messages()[1].is_writing);
  EXPECT_EQ(controller.messages()[1].content.text.find("[error]"), std::string::npos);
}

TEST(ChatControllerTests, CancelDoesNotWaitForStalledTransfer) {
  auto aborted = std::make_shared<std::atomic<bool>>(false);
  auto stalled = [aborted](const moly::ai::HttpRequest &request,
                           moly::ai::HttpResponse &response, std::string *error) {
    response.status = 200;
    request.on_data("data: {\"choices\":[{\"delta\":{\"content\":\"hi\"}}]}\n\n");
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      if (request.should_abort && request.should_abort()) {
        aborted->store(true);
        if (error)
          *error = std::string(moly::ai::kTransferAborted);
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (error)
      *error = "Connection timed out";
    return false;
  };
  auto client = std::make_shared<moly::ai::OpenAiClient>(
      kUrl, "sk-test", moly::ai::OpenAiClient::Options{}, stalled);

  ChatController controller;
  controller.set_client(client);
  controller.set_bot_id(BotId("gpt-4o", kUrl));
  ASSERT_TRUE(controller.send_message("hi"));
  ASSERT_TRUE(moly::test::pump_until(
      [&] { controller.poll(); },
      [&] { return controller.messages()[1].content.text == "hi"; }));

  auto started = std::chrono::steady_clock::now();
  controller.cancel_response();
  auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_LT(elapsed, std::chrono::milliseconds(500));

  EXPECT_FALSE(controller.response_in_progress());
  EXPECT_FALSE(controller.messages()[1].is_writing);
  EXPECT_EQ(controller.messages()[1].content.text, "hi");

  // The worker winds down on its own; poll() reaps it without touching the reply.
  EXPECT_TRUE(moly::test::pump_until([&] { controller.poll(); },
                                     [&] { return aborted->load(); },
                                     std::chrono::milliseconds(2000)));
  controller.poll();
  EXPECT_EQ(controller.messages()[1].content.text, "hi");
}

TEST(ChatControllerTests, ReplacingMessagesCancelsResponse) {
  auto gate = std::make_shared<moly::test::Gate>();
  FakeProviderSpec spec;
  spec.chunks = {MessageContent{"late", ""}};
  spec.stream_gate = gate;

  ChatController controller;
  controller.set_client(make_client(spec));
  controller.set_bot_id(BotId("gpt-4o", kUrl));
  ASSERT_TRUE(controller.send_message("hi"));

  auto opener = open_later(gate);
  controller.set_messages({moly::ai::Message::user("from another chat")});
  opener.join();

  EXPECT_FALSE(controller.response_in_progress());
  ASSERT_EQ(controller.messages().size(), 1u);
  EXPECT_EQ(controller.messages()[0].content.text, "from another chat");
}

TEST(ChatControllerTests, LoadsModelsOffThread) {
  auto gate = std::make_shared<moly::test::Gate>();
  FakeProviderSpec spec;
  spec.models = {"a", "b"};
  spec.list_gate = gate;

  ChatController controller;
  EXPECT_FALSE(controller.dispatch_load());

  controller.set_client(make_client(spec));
  ASSERT_TRUE(controller.dispatch_load());
  EXPECT_TRUE(controller.load_in_flight());
  EXPECT_FALSE(controller.dispatch_load());
  EXPECT_FALSE(controller.take_load_result().has_value());

  gate->open();
  std::optional<ChatController::LoadResult> result;
  ASSERT_TRUE(moly::test::pump_until(
      [] {}, [&] { return (result = controller.take_load_result()).has_value(); }));
  EXPECT_EQ(result->provider_url, kUrl);
  ASSERT_TRUE(result->models.ok());
  EXPECT_EQ(result->models.bots.size(), 2u);
  EXPECT_FALSE(controller.load_in_flight());
}

TEST(ChatControllerTests, LoadErrorIsAResult) {
  FakeProviderSpec spec;
  spec.list_error = ClientError{ErrorKind::Http, "HTTP 500: boom", 500};

  ChatController controller;
  controller.set_client(make_client(spec));
  ASSERT_TRUE(controller.dispatch_load());

  std::optional<ChatController::LoadResult> result;
  ASSERT_TRUE(moly::test::pump_until(
      [] {}, [&] { return (result = controller.take_load_result()).has_value(); }));
  ASSERT_FALSE(result->models.ok());
  EXPECT_EQ(result->models.error->message, "HTTP 500: boom");
}
