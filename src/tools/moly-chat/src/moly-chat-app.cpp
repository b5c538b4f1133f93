#include "moly/ai/connection_test.hpp"
#include "moly/chat/chat_screen.hpp"
#include "moly/config.hpp"
#include "moly/data/mcp_servers.hpp"
#include "moly/data/store.hpp"
#include "moly/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include <csignal>
#include <execinfo.h>
#include <unistd.h>

namespace
{
    constexpr auto kFrameInterval = std::chrono::milliseconds(16);

    void crash_handler(int sig, siginfo_t *, void *)
    {
        void *frames[64];
        int count = backtrace(frames, 64);
        backtrace_symbols_fd(frames, count, STDERR_FILENO);
        _exit(128 + sig);
    }

    void install_crash_handlers()
    {
        struct sigaction action {};
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_SIGINFO | SA_RESETHAND;
        action.sa_sigaction = crash_handler;
        sigaction(SIGSEGV, &action, nullptr);
        sigaction(SIGABRT, &action, nullptr);
    }

    std::string read_prompt_from_stdin()
    {
        std::cout << "Enter prompt: " << std::flush;
        std::string prompt;
        std::getline(std::cin, prompt);
        return prompt;
    }

    bool is_help_flag(std::string_view arg)
    {
        return arg == "--help" || arg == "-h";
    }

    struct CliOptions
    {
        bool showHelp = false;
        bool listModels = false;
        bool listChats = false;
        bool newChat = false;
        bool serverStatus = false;
        bool mcpShow = false;
        bool mcpInit = false;
        std::optional<std::string> prompt;
        std::optional<std::string> model;
        std::optional<std::string> chat;
        std::optional<std::string> deleteChat;
        std::optional<std::string> testConnection;
        std::optional<std::string> enable;
        std::optional<std::string> disable;
        std::vector<std::string> setKey;
        std::vector<std::string> addProvider;
        std::vector<std::string> errors;
    };

    CliOptions parse_cli(int argc, char **argv)
    {
        CliOptions options;
        auto take_value = [&](int &i, std::string_view flag, std::optional<std::string> &target) {
            if (i + 1 >= argc)
            {
                options.errors.push_back(std::string(flag) + " requires a value");
                return;
            }
            target = std::string(argv[++i]);
        };
        auto take_values = [&](int &i, std::string_view flag, std::size_t count,
                               std::vector<std::string> &target) {
            if (i + static_cast<int>(count) >= argc)
            {
                options.errors.push_back(std::string(flag) + " requires " +
                                         std::to_string(count) + " values");
                i = argc;
                return;
            }
            for (std::size_t n = 0; n < count; ++n)
                target.emplace_back(argv[++i]);
        };

        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg(argv[i]);
            if (is_help_flag(arg))
                options.showHelp = true;
            else if (arg == "--list-models")
                options.listModels = true;
            else if (arg == "--list-chats")
                options.listChats = true;
            else if (arg == "--new-chat")
                options.newChat = true;
            else if (arg == "--server-status")
                options.serverStatus = true;
            else if (arg == "--mcp-show")
                options.mcpShow = true;
            else if (arg == "--mcp-init")
                options.mcpInit = true;
            else if (arg == "--prompt")
                take_value(i, arg, options.prompt);
            else if (arg.rfind("--prompt=", 0) == 0)
                options.prompt = std::string(arg.substr(9));
            else if (arg == "--model")
                take_value(i, arg, options.model);
            else if (arg == "--chat")
                take_value(i, arg, options.chat);
            else if (arg == "--delete-chat")
                take_value(i, arg, options.deleteChat);
            else if (arg == "--test-connection")
                take_value(i, arg, options.testConnection);
            else if (arg == "--enable")
                take_value(i, arg, options.enable);
            else if (arg == "--disable")
                take_value(i, arg, options.disable);
            else if (arg == "--set-key")
                take_values(i, arg, 2, options.setKey);
            else if (arg == "--add-provider")
                take_values(i, arg, 2, options.addProvider);
            else
                options.errors.push_back("unknown argument: " + std::string(arg));
        }
        return options;
    }

    void print_usage()
    {
        std::cout << "Usage: moly-chat [options]\n"
                  << "  --list-models               Fetch and list models from enabled providers\n"
                  << "  --model BOT_ID              Select a model before sending\n"
                  << "  --prompt TEXT               Send a prompt ('-' reads stdin)\n"
                  << "  --new-chat                  Start a new chat first\n"
                  << "  --chat ID                   Switch to an existing chat\n"
                  << "  --list-chats                List saved chats\n"
                  << "  --delete-chat ID            Delete a saved chat\n"
                  << "  --set-key PROVIDER KEY      Store an API key\n"
                  << "  --enable PROVIDER           Enable a provider\n"
                  << "  --disable PROVIDER          Disable a provider\n"
                  << "  --add-provider NAME URL     Add a custom OpenAI compatible provider\n"
                  << "  --test-connection PROVIDER  Probe a provider's models endpoint\n"
                  << "  --server-status             Ping the local model server\n"
                  << "  --mcp-show                  Print the MCP servers configuration\n"
                  << "  --mcp-init                  Write a sample MCP configuration if empty\n"
                  << "Config: " << moly::ConfigLoader::default_config_path().string() << "\n";
    }

    // Ticks the screen until done() holds or the deadline passes.
    bool pump(moly::chat::ChatScreen &screen, std::chrono::seconds timeout,
              const std::function<bool()> &done, const std::function<void()> &onFrame = {})
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            screen.tick();
            if (onFrame)
                onFrame();
            if (done())
                return true;
            std::this_thread::sleep_for(kFrameInterval);
        }
        return false;
    }

    bool wait_for_models(moly::chat::ChatScreen &screen, const moly::Config &config,
                         std::size_t providerCount)
    {
        auto timeout = std::chrono::seconds(
            (config.http_timeout_seconds + 1) * static_cast<long>(std::max<std::size_t>(providerCount, 1)));
        return pump(screen, timeout, [&]() {
            const auto &orchestrator = screen.orchestrator();
            if (orchestrator.state() != moly::chat::FetchOrchestrator::State::Idle)
                return false;
            return screen.resolver().restored() || orchestrator.providers_to_fetch().empty();
        });
    }

    int apply_provider_edits(moly::data::Store &store, const CliOptions &options)
    {
        auto &preferences = store.preferences();
        if (options.addProvider.size() == 2)
        {
            std::string error;
            if (!preferences.add_custom_provider(options.addProvider[0], options.addProvider[1],
                                                 std::nullopt, &error))
            {
                std::cerr << "moly-chat: " << error << "\n";
                return 1;
            }
        }
        if (options.setKey.size() == 2 &&
            !preferences.set_provider_api_key(options.setKey[0], options.setKey[1]))
        {
            std::cerr << "moly-chat: unknown provider " << options.setKey[0] << "\n";
            return 1;
        }
        if (options.enable && !preferences.set_provider_enabled(*options.enable, true))
        {
            std::cerr << "moly-chat: unknown provider " << *options.enable << "\n";
            return 1;
        }
        if (options.disable && !preferences.set_provider_enabled(*options.disable, false))
        {
            std::cerr << "moly-chat: unknown provider " << *options.disable << "\n";
            return 1;
        }
        return 0;
    }

    int run_connection_test(moly::data::Store &store, const std::string &providerId)
    {
        auto &preferences = store.preferences();
        const auto *provider = preferences.get_provider(providerId);
        if (!provider)
        {
            std::cerr << "moly-chat: unknown provider " << providerId << "\n";
            return 1;
        }

        moly::ai::ConnectionTimeouts timeouts{store.config().http_timeout_seconds,
                                              store.config().connect_timeout_seconds};
        moly::ai::ConnectionTester tester({}, timeouts);
        if (!tester.start(provider->id, provider->url, provider->api_key.value_or(std::string())))
        {
            std::cerr << "moly-chat: connection test could not be started\n";
            return 1;
        }

        std::optional<moly::ai::ConnectionTester::Outcome> outcome;
        while (!(outcome = tester.poll()))
            std::this_thread::sleep_for(kFrameInterval);

        if (!outcome->result.ok)
        {
            std::cout << providerId << ": " << outcome->result.error << "\n";
            return 1;
        }

        std::cout << providerId << ": connected, " << outcome->result.models.size() << " models\n";
        auto merged = moly::data::merge_model_flags(provider->models, outcome->result.models);
        preferences.set_provider_models(providerId, std::move(merged));
        return 0;
    }

    std::optional<moly::data::ServerOutcome> await_server(moly::data::ServerRequestRunner &runner,
                                                          moly::data::ServerRequest request)
    {
        if (!runner.start(request))
            return std::nullopt;
        while (true)
        {
            if (auto outcome = runner.poll())
                return outcome;
            std::this_thread::sleep_for(kFrameInterval);
        }
    }

    int run_server_status(moly::data::Store &store)
    {
        auto &client = store.moly_client();
        moly::data::ServerRequestRunner runner(client);

        auto ping = await_server(runner, moly::data::ServerRequest::Ping);
        if (!ping || !ping->ok)
        {
            std::cout << client.base_url() << ": "
                      << (ping ? ping->error : std::string("request not started")) << "\n";
            return 1;
        }
        std::cout << client.base_url() << ": connected\n";

        auto files = await_server(runner, moly::data::ServerRequest::DownloadedFiles);
        if (files && files->ok)
        {
            for (const auto &file : files->downloaded)
                std::cout << "  " << file.file.name << " (" << file.model_name << ")\n";
        }
        else if (files)
        {
            std::cout << "  " << files->error << "\n";
        }
        return 0;
    }

    void list_chats(const moly::data::Store &store)
    {
        const auto &chats = store.chats();
        for (const auto *chat : chats.get_sorted_chats())
        {
            bool current = chats.current_chat_id() == chat->id;
            std::cout << (current ? "* " : "  ") << chat->id << "  "
                      << moly::data::format_timestamp(chat->accessed_at) << "  " << chat->title
                      << " (" << chat->messages.size() << " messages)\n";
        }
    }

    void list_models(const moly::chat::ChatScreen &screen)
    {
        const auto &controller = screen.controller();
        for (const auto &bot : controller.bots())
        {
            bool selected = controller.bot_id() && *controller.bot_id() == bot.id;
            std::cout << (selected ? "* " : "  ") << bot.name << "  [" << bot.id.as_str() << "]\n";
        }
    }

    int stream_prompt(moly::chat::ChatScreen &screen, const moly::Config &config,
                      const std::string &prompt)
    {
        if (!screen.send_prompt(prompt))
        {
            std::cerr << "moly-chat: prompt not sent (no model selected?)\n";
            return 1;
        }

        auto &controller = screen.controller();
        std::size_t printed = 0;
        auto print_new = [&]() {
            const auto &messages = controller.messages();
            if (messages.empty())
                return;
            const auto &text = messages.back().content.text;
            if (text.size() > printed)
            {
                std::cout << text.substr(printed) << std::flush;
                printed = text.size();
            }
        };

        // Replies may run long; give up only after a full timeout without new text.
        bool finished = false;
        std::size_t seen = 0;
        do
        {
            seen = printed;
            finished = pump(screen, std::chrono::seconds(config.http_timeout_seconds + 1),
                            [&]() { return !controller.response_in_progress(); }, print_new);
        } while (!finished && printed > seen);
        print_new();
        std::cout << "\n";
        if (!finished)
        {
            controller.cancel_response();
            screen.tick();
            std::cerr << "moly-chat: response timed out\n";
            return 1;
        }
        return 0;
    }

    int run(const CliOptions &options)
    {
        auto config = moly::ConfigLoader::load_or_default();
        moly::log::set_level(config.log_level);
        if (!config.log_file.empty())
            moly::log::set_file(config.log_file);

        moly::data::Store store(config);
        store.load();

        if (int rc = apply_provider_edits(store, options); rc != 0)
            return rc;

        if (options.mcpInit && store.mcp_servers().servers.empty())
        {
            std::string error;
            if (!store.update_mcp_servers_from_json(moly::data::McpServersConfig::create_sample().to_json(), &error))
            {
                std::cerr << "moly-chat: " << error << "\n";
                return 1;
            }
        }
        if (options.mcpShow)
            std::cout << store.get_mcp_servers_config_json() << "\n";

        if (options.testConnection)
            return run_connection_test(store, *options.testConnection);
        if (options.serverStatus)
            return run_server_status(store);

        if (options.deleteChat)
        {
            auto id = moly::data::parse_chat_id(*options.deleteChat);
            if (!id || !store.chats().delete_chat(*id))
            {
                std::cerr << "moly-chat: no chat " << *options.deleteChat << "\n";
                return 1;
            }
        }
        if (options.listChats)
        {
            list_chats(store);
            if (!options.listModels && !options.prompt)
                return 0;
        }

        if (!options.listModels && !options.prompt && !options.newChat && !options.chat)
            return 0;

        moly::chat::ChatScreen screen(store);
        screen.orchestrator().set_event_callback([](const moly::chat::FetchOrchestrator::Event &event) {
            if (event.kind == moly::chat::FetchOrchestrator::Event::Kind::FetchFailed)
                std::cerr << "moly-chat: " << event.provider << ": " << event.error << "\n";
        });

        std::size_t providerCount = store.preferences().get_enabled_providers().size();
        if (!wait_for_models(screen, config, providerCount))
            std::cerr << "moly-chat: model fetch timed out\n";

        if (options.chat)
        {
            auto id = moly::data::parse_chat_id(*options.chat);
            if (!id || !store.chats().get_chat_by_id(*id))
            {
                std::cerr << "moly-chat: no chat " << *options.chat << "\n";
                return 1;
            }
            screen.switch_to_chat(*id);
        }
        if (options.newChat)
            std::cout << "New chat " << screen.create_new_chat() << "\n";

        if (options.model)
        {
            if (!screen.select_bot(moly::ai::BotId::from_string(*options.model)))
            {
                std::cerr << "moly-chat: unknown model " << *options.model << "\n";
                return 1;
            }
        }
        screen.tick();

        if (options.listModels)
            list_models(screen);

        if (!options.prompt)
            return 0;

        std::string prompt = *options.prompt == "-" ? read_prompt_from_stdin() : *options.prompt;
        if (prompt.empty())
        {
            std::cout << "No prompt provided.\n";
            return 0;
        }
        int rc = stream_prompt(screen, config, prompt);
        screen.tick();
        return rc;
    }

} // namespace

int main(int argc, char **argv)
{
    install_crash_handlers();

    CliOptions options = parse_cli(argc, argv);
    if (!options.errors.empty())
    {
        for (const auto &error : options.errors)
            std::cerr << "moly-chat: " << error << "\n";
        print_usage();
        return 2;
    }
    if (options.showHelp || argc == 1)
    {
        print_usage();
        return 0;
    }
    return run(options);
}
