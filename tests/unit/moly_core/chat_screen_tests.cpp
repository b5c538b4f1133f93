#include "moly/chat/chat_screen.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <gtest/gtest.h>

using moly::ai::BotId;
using moly::ai::MessageContent;
using moly::chat::ChatScreen;

namespace {

class ChatScreenTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = moly::test::make_temp_dir("moly_screen");
    config_.data_dir = test_dir_;
    factory_.specs["openai"].models = {"gpt-4o", "gpt-4o-mini"};
    factory_.specs["openai"].chunks = {MessageContent{"Hi ", ""},
                                       MessageContent{"there", ""}};
    factory_.specs["groq"].models = {"llama3"};
  }

  void TearDown() override {
    screen_.reset();
    store_.reset();
    std::filesystem::remove_all(test_dir_);
  }

  void open() {
    store_ = std::make_unique<moly::data::Store>(config_, factory_.factory());
    store_->load();
    store_->preferences().set_provider_api_key("openai", std::string("sk-openai"));
    store_->preferences().set_provider_api_key("groq", std::string("gsk-groq"));
    openai_url_ = store_->preferences().get_provider("openai")->url;
    groq_url_ = store_->preferences().get_provider("groq")->url;
    screen_ = std::make_unique<ChatScreen>(*store_);
    ASSERT_TRUE(moly::test::pump_until([this] { screen_->tick(); },
                                       [this] { return screen_->resolver().restored(); }));
  }

  bool waitForReply() {
    return moly::test::pump_until(
        [this] { screen_->tick(); },
        [this] { return !screen_->controller().response_in_progress(); });
  }

  std::filesystem::path test_dir_;
  moly::Config config_;
  moly::test::FakeClientFactory factory_;
  std::unique_ptr<moly::data::Store> store_;
  std::unique_ptr<ChatScreen> screen_;
  std::string openai_url_;
  std::string groq_url_;
};

} // namespace

TEST_F(ChatScreenTest, StartsWithFreshChatAndRestoredModel) {
  open();
  EXPECT_TRUE(screen_->chat_initialized());
  EXPECT_EQ(store_->chats().saved_chats().size(), 1u);
  EXPECT_TRUE(store_->chats().current_chat_id().has_value());
  EXPECT_EQ(screen_->controller().bots().size(), 3u);
  ASSERT_TRUE(screen_->controller().bot_id().has_value());
  EXPECT_EQ(*screen_->controller().bot_id(), BotId("gpt-4o", openai_url_));

  screen_->tick();
  const auto *chat = store_->chats().get_current_chat();
  ASSERT_TRUE(chat->bot_id.has_value());
  EXPECT_EQ(*chat->bot_id, BotId("gpt-4o", openai_url_));
}

TEST_F(ChatScreenTest, PromptIsStreamedAndPersisted) {
  open();
  ASSERT_TRUE(screen_->send_prompt("  Tell me something  "));
  ASSERT_TRUE(waitForReply());
  screen_->tick();

  const auto &messages = screen_->controller().messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].content.text, "Tell me something");
  EXPECT_EQ(messages[1].content.text, "Hi there");

  auto id = *store_->chats().current_chat_id();
  moly::data::Chats reloaded(test_dir_ / "chats");
  reloaded.load();
  const auto *chat = reloaded.get_chat_by_id(id);
  ASSERT_NE(chat, nullptr);
  EXPECT_EQ(chat->title, "Tell me something");
  ASSERT_EQ(chat->messages.size(), 2u);
  EXPECT_EQ(chat->messages[1].content.text, "Hi there");
  EXPECT_FALSE(chat->messages[1].is_writing);
}

TEST_F(ChatScreenTest, BlankPromptIsRefused) {
  open();
  EXPECT_FALSE(screen_->send_prompt("   \n"));
  EXPECT_TRUE(screen_->controller().messages().empty());
}

TEST_F(ChatScreenTest, PromptWithoutModelIsRefused) {
  open();
  screen_->controller().set_bot_id(std::nullopt);
  EXPECT_FALSE(screen_->send_prompt("hello"));
}

TEST_F(ChatScreenTest, SwitchingChatsLoadsTheirMessages) {
  open();
  auto first = *store_->chats().current_chat_id();
  ASSERT_TRUE(screen_->send_prompt("First question"));
  ASSERT_TRUE(waitForReply());

  auto second = screen_->create_new_chat();
  EXPECT_NE(first, second);
  EXPECT_TRUE(screen_->controller().messages().empty());
  ASSERT_TRUE(store_->chats().get_chat_by_id(second)->bot_id.has_value());

  EXPECT_FALSE(screen_->switch_to_chat(second));
  EXPECT_FALSE(screen_->switch_to_chat(first + second));
  ASSERT_TRUE(screen_->switch_to_chat(first));
  ASSERT_EQ(screen_->controller().messages().size(), 2u);
  EXPECT_EQ(screen_->controller().messages()[0].content.text, "First question");
  EXPECT_EQ(store_->chats().current_chat_id(), first);
}

TEST_F(ChatScreenTest, DeletingCurrentChatFallsBackToNext) {
  open();
  auto first = *store_->chats().current_chat_id();
  ASSERT_TRUE(screen_->send_prompt("Keep me"));
  ASSERT_TRUE(waitForReply());
  screen_->tick();
  auto second = screen_->create_new_chat();

  ASSERT_TRUE(screen_->delete_chat(second));
  EXPECT_EQ(store_->chats().current_chat_id(), first);
  EXPECT_EQ(screen_->controller().messages().size(), 2u);

  ASSERT_TRUE(screen_->delete_chat(first));
  EXPECT_FALSE(store_->chats().current_chat_id().has_value());
  EXPECT_TRUE(screen_->controller().messages().empty());
  EXPECT_FALSE(screen_->delete_chat(first));

  ASSERT_TRUE(screen_->send_prompt("Starts a new chat"));
  EXPECT_TRUE(store_->chats().current_chat_id().has_value());
  ASSERT_TRUE(waitForReply());
}

TEST_F(ChatScreenTest, SelectingModelPersistsEverywhere) {
  open();
  EXPECT_FALSE(screen_->select_bot(BotId("unknown", openai_url_)));
  ASSERT_TRUE(screen_->select_bot(BotId("llama3", groq_url_)));
  screen_->tick();

  EXPECT_EQ(store_->preferences().current_chat_model(), BotId("llama3", groq_url_).as_str());
  EXPECT_EQ(store_->providers_manager().active_provider_id(), "groq");
  ASSERT_NE(screen_->controller().client(), nullptr);
  EXPECT_EQ(screen_->controller().client()->url(), groq_url_);
  const auto *chat = store_->chats().get_current_chat();
  ASSERT_TRUE(chat->bot_id.has_value());
  EXPECT_EQ(*chat->bot_id, BotId("llama3", groq_url_));
}

TEST_F(ChatScreenTest, ResumesMostRecentChatOnRestart) {
  open();
  ASSERT_TRUE(screen_->send_prompt("Remember this"));
  ASSERT_TRUE(waitForReply());
  screen_->tick();
  auto id = *store_->chats().current_chat_id();
  screen_.reset();
  store_.reset();

  open();
  EXPECT_EQ(store_->chats().current_chat_id(), id);
  EXPECT_EQ(store_->chats().saved_chats().size(), 1u);
  ASSERT_EQ(screen_->controller().messages().size(), 2u);
  EXPECT_EQ(screen_->controller().messages()[1].content.text, "Hi there");
}
