// SPDX-License-Identifier: Apache-2.0
#include "Console.hpp"

#include <agent/AgentLoop.hpp>
#include <agent/ToolRegistry.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <llm/ChatSession.hpp>
#include <llm/OpenAiProvider.hpp>
#include <tools/BuiltinTools.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <csignal>
#include <format>
#include <future>
#include <iostream>
#include <mutex>
#include <sstream>

#include <signal.h>

namespace zesbe
{

namespace
{
    auto interruptRequested = std::atomic<bool> { false };

    void onInterrupt(int /*signal*/)
    {
        interruptRequested.store(true);
    }

    /// Routes SIGINT to interruptRequested while alive, restoring the previous disposition afterwards.
    class InterruptGuard
    {
      public:
        InterruptGuard()
        {
            interruptRequested.store(false);
            struct sigaction action {};
            action.sa_handler = onInterrupt;
            sigemptyset(&action.sa_mask);
            action.sa_flags = SA_RESTART;
            ::sigaction(SIGINT, &action, &_previous);
        }

        ~InterruptGuard() { ::sigaction(SIGINT, &_previous, nullptr); }

        InterruptGuard(const InterruptGuard&) = delete;
        InterruptGuard& operator=(const InterruptGuard&) = delete;

      private:
        struct sigaction _previous {};
    };

    auto splitWords(std::string_view line) -> std::vector<std::string>
    {
        auto words = std::vector<std::string> {};
        auto stream = std::istringstream(std::string(line));
        for (auto word = std::string {}; stream >> word;)
            words.push_back(std::move(word));
        return words;
    }

    /// @brief Shortens @p text to a single line of at most @p maxChars characters.
    auto preview(std::string_view text, size_t maxChars) -> std::string
    {
        auto line = std::string {};
        for (auto const c: text)
        {
            if (line.size() >= maxChars)
            {
                line += "...";
                break;
            }
            line += (c == '\n' || c == '\r') ? ' ' : c;
        }
        return line;
    }

    auto firstLine(std::string_view text) -> std::string_view
    {
        return text.substr(0, text.find('\n'));
    }

    constexpr auto HelpText = std::string_view {
        "Commands:\n"
        "  /help                     Show this help\n"
        "  /exit, /quit, /q          Leave the session\n"
        "  /clear                    Forget the conversation\n"
        "  /history                  Show the conversation so far\n"
        "  /tools                    List the tools offered to the model\n"
        "  /mcp [list]               Show MCP servers\n"
        "  /mcp connect <name>       Connect a configured MCP server\n"
        "  /mcp disconnect <name>    Disconnect an MCP server\n"
        "  /mcp reconnect <name>     Restart an MCP server\n"
        "  /config                   Show the active configuration\n"
        "  /provider [name]          List providers or switch to another one\n"
        "\n"
        "Press Ctrl-C while a response is streaming to cancel it.\n"
    };
} // namespace

auto makeOpenAiProvider(const ProviderSettings& settings) -> Result<std::unique_ptr<ChatProvider>>
{
    auto config = OpenAiProviderConfig {
        .baseUrl = settings.baseUrl,
        .apiKey = settings.apiKey,
        .defaultModel = settings.model,
    };
    return OpenAiProvider::create(std::move(config)).transform([](auto provider) {
        return std::unique_ptr<ChatProvider>(std::move(provider));
    });
}

struct Console::Impl
{
    AppConfig config;
    ConsoleOptions options;
    std::istream& in;
    std::ostream& out;
    std::mutex outMutex; // the model's text arrives on a worker thread

    std::unique_ptr<ChatProvider> provider;
    ToolRegistry registry;
    ToolGateway gateway;
    ChatSession session;
    std::unique_ptr<AgentLoop> agent;

    Impl(AppConfig cfg, ConsoleOptions opts):
        config(std::move(cfg)),
        options(std::move(opts)),
        in(options.input ? *options.input : std::cin),
        out(options.output ? *options.output : std::cout),
        gateway(config.mcpServers, GatewayTimeouts {}, options.transportFactory),
        session(config.systemPrompt)
    {
        if (!options.providerFactory)
            options.providerFactory = makeOpenAiProvider;
    }

    template <typename... Args>
    void print(std::format_string<Args...> fmt, Args&&... args)
    {
        auto lock = std::lock_guard(outMutex);
        out << std::format(fmt, std::forward<Args>(args)...) << std::flush;
    }

    [[nodiscard]] auto agentConfig() const -> AgentConfig
    {
        return AgentConfig {
            .maxIterations = config.agent.maxIterations,
            .model = config.provider.model,
            .maxTokens = config.provider.maxTokens,
            .temperature = config.provider.temperature,
            .toolsEnabled = config.agent.toolsEnabled,
        };
    }

    void rebuildAgent()
    {
        agent = std::make_unique<AgentLoop>(
            AgentContext { .provider = *provider, .registry = registry, .gateway = gateway }, session, agentConfig());
    }

    /// @brief Runs one agent turn, cancelling it on SIGINT if enabled.
    auto runTurn(std::string_view text, const AgentEvents& events) -> Result<std::string>
    {
        if (!options.handleInterrupts)
            return agent->processMessage(text, events);

        auto stopSource = std::stop_source {};
        auto const guard = InterruptGuard {};
        auto task = std::async(std::launch::async, [&] {
            return agent->processMessage(text, events, stopSource.get_token());
        });

        while (task.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready)
        {
            if (interruptRequested.exchange(false) && !stopSource.stop_requested())
            {
                log::debug("Interrupt received, cancelling the current turn");
                stopSource.request_stop();
            }
        }
        return task.get();
    }

    void showHistory()
    {
        if (session.messageCount() == 0)
        {
            print("No messages yet.\n");
            return;
        }

        auto index = 0;
        for (const auto& message: session.messages())
        {
            if (message.role == Role::System)
                continue;
            ++index;
            print("{:>3}. {}: {}\n", index, roleToString(message.role), preview(message.content, 200));
            for (const auto& call: message.toolCalls)
                print("       -> {}({})\n", call.name, preview(json::dump(call.arguments), 120));
        }
    }

    void showTools()
    {
        auto const builtins = registry.definitions();
        print("Built-in tools ({}):\n", builtins.size());
        for (const auto& tool: builtins)
            print("  {:<16} {}\n", tool.name, firstLine(tool.description));

        auto const mcpTools = gateway.getTools();
        if (!mcpTools.empty())
        {
            print("MCP tools ({}):\n", mcpTools.size());
            for (const auto& tool: mcpTools)
                print("  {:<16} {}\n", tool.name, firstLine(tool.description));
        }

        if (!config.agent.toolsEnabled)
            print("Tools are disabled for this session.\n");
    }

    void showMcpServers()
    {
        auto const configs = gateway.serverConfigs();
        if (configs.empty())
        {
            print("No MCP servers configured.\n");
            return;
        }

        for (const auto& [name, serverConfig]: configs)
        {
            if (auto const info = gateway.serverInfo(name))
            {
                print("  {:<16} connected, {} tools ({} {})\n",
                      name,
                      gateway.toolCount(name),
                      info->name.empty() ? "unnamed server" : info->name,
                      info->version);
            }
            else
            {
                print("  {:<16} {}\n", name, serverConfig.enabled ? "disconnected" : "disabled");
            }
        }
    }

    void handleMcp(const std::vector<std::string>& words)
    {
        if (words.size() == 1 || words[1] == "list")
        {
            showMcpServers();
            return;
        }

        auto const& action = words[1];
        if (words.size() != 3 || (action != "connect" && action != "disconnect" && action != "reconnect"))
        {
            print("Usage: /mcp [list|connect <name>|disconnect <name>|reconnect <name>]\n");
            return;
        }

        auto const& name = words[2];
        auto const configs = gateway.serverConfigs();
        auto const configIt = configs.find(name);
        if (configIt == configs.end())
        {
            print("Unknown MCP server: {}\n", name);
            return;
        }

        if (action == "disconnect")
        {
            if (gateway.disconnect(name))
                print("Disconnected {}\n", name);
            else
                print("{} is not connected\n", name);
            return;
        }

        auto const result = action == "connect" ? gateway.connect(name, configIt->second) : gateway.reconnect(name);
        if (result)
            print("Connected {} ({} tools)\n", name, gateway.toolCount(name));
        else
            print("Error: {}\n", result.error());
    }

    void showConfig()
    {
        auto const& p = config.provider;
        print("Provider:       {}\n", p.name);
        print("Model:          {}\n", p.model.empty() ? provider->defaultModel() : p.model);
        print("Base URL:       {}\n", p.baseUrl);
        print("API key:        {}\n", p.apiKey.empty() ? "not set" : "set");
        print("Max tokens:     {}\n", p.maxTokens);
        print("Temperature:    {}\n", p.temperature);
        print("Tools:          {}\n", config.agent.toolsEnabled ? "enabled" : "disabled");
        print("Max iterations: {}\n", config.agent.maxIterations);
        print("MCP servers:    {} configured, {} connected\n",
              gateway.serverConfigs().size(),
              gateway.getConnectedServers().size());
        if (!options.configPath.empty())
            print("Config file:    {}\n", options.configPath);
    }

    void listProviders()
    {
        for (const auto& preset: providerPresets())
        {
            auto const marker = preset.id == config.provider.name ? '*' : ' ';
            print("{} {:<12} {:<28} {}\n", marker, preset.id, preset.displayName, preset.model);
        }
    }

    void switchProvider(const std::string& name)
    {
        auto const preset = findProviderPreset(name);
        if (!preset)
        {
            print("Unknown provider: {}. Use /provider to list the available ones.\n", name);
            return;
        }

        auto candidate = config;
        candidate.provider.name = std::string(preset->id);
        candidate.provider.model.clear();
        candidate.provider.baseUrl.clear();
        candidate.provider.apiKey.clear();
        resolveProvider(candidate, options.sources);

        auto created = options.providerFactory(candidate.provider);
        if (!created)
        {
            print("Error: {}\n", created.error());
            return;
        }

        config = std::move(candidate);
        provider = std::move(*created);
        rebuildAgent();
        print("Switched to {} ({})\n", preset->displayName, config.provider.model);

        if (config.provider.apiKey.empty() && preset->id != "ollama")
            print("No API key found; set {}.\n", apiKeyVariable(preset->id));

        if (!options.configPath.empty())
            persistProvider(config.provider.name);
    }

    /// @brief Records the provider choice in the user's config file, leaving the rest of it as it was.
    void persistProvider(const std::string& name)
    {
        auto stored = std::filesystem::exists(options.configPath) ? loadConfigFromFile(options.configPath)
                                                                  : Result<AppConfig>(AppConfig {});
        auto const saved = stored.and_then([&](AppConfig& fileConfig) {
            fileConfig.provider.name = name;
            fileConfig.provider.model.clear();
            fileConfig.provider.baseUrl.clear();
            return saveConfigToFile(options.configPath, fileConfig);
        });
        if (!saved)
            print("Error: {}\n", saved.error());
    }

    void renderLog(log::Level level, std::string_view message)
    {
        auto lock = std::lock_guard(outMutex);
        switch (level)
        {
            case log::Level::Error: out << "error: "; break;
            case log::Level::Warning: out << "warning: "; break;
            case log::Level::Info: out << "info: "; break;
            default: out << "debug: "; break;
        }
        out << message << '\n' << std::flush;
    }
};

Console::Console(AppConfig config, ConsoleOptions options):
    _impl(std::make_unique<Impl>(std::move(config), std::move(options)))
{
}

Console::~Console()
{
    log::setCallback(nullptr);
    _impl->agent.reset();
    _impl->gateway.disconnectAll();
}

auto Console::initialize() -> VoidResult
{
    auto created = _impl->options.providerFactory(_impl->config.provider);
    if (!created)
        return std::unexpected(created.error());
    _impl->provider = std::move(*created);

    log::setCallback([impl = _impl.get()](log::Level level, std::string_view message) {
        impl->renderLog(level, message);
    });

    _impl->registry.addAll(createBuiltinTools(BuiltinToolOptions {
        .workingDirectory = {},
        .commandTimeout = std::chrono::seconds(_impl->config.agent.commandTimeoutSeconds),
    }));

    _impl->gateway.initialize();
    _impl->rebuildAgent();

    log::debug("Console ready: {} built-in tools, {} MCP servers connected",
               _impl->registry.size(),
               _impl->gateway.getConnectedServers().size());
    return {};
}

auto Console::run() -> int
{
    _impl->print("zesbe ({}, {}). Type /help for commands.\n",
                 _impl->config.provider.name,
                 _impl->config.provider.model.empty() ? _impl->provider->defaultModel()
                                                      : _impl->config.provider.model);

    auto line = std::string {};
    while (true)
    {
        _impl->print("> ");
        if (!std::getline(_impl->in, line))
        {
            _impl->print("\n");
            break;
        }
        if (!handleLine(line))
            break;
    }
    return 0;
}

auto Console::handleLine(std::string_view line) -> bool
{
    auto const first = line.find_first_not_of(" \t\r");
    if (first == std::string_view::npos)
        return true;
    line = line.substr(first);

    if (!line.starts_with('/'))
    {
        sendMessage(line);
        return true;
    }

    auto const words = splitWords(line);
    auto const& command = words.front();

    if (command == "/exit" || command == "/quit" || command == "/q")
        return false;

    if (command == "/help")
        _impl->print("{}", HelpText);
    else if (command == "/clear")
    {
        _impl->session.clear();
        _impl->print("Conversation cleared.\n");
    }
    else if (command == "/history")
        _impl->showHistory();
    else if (command == "/tools")
        _impl->showTools();
    else if (command == "/mcp")
        _impl->handleMcp(words);
    else if (command == "/config")
        _impl->showConfig();
    else if (command == "/provider")
    {
        if (words.size() == 1)
            _impl->listProviders();
        else
            _impl->switchProvider(words[1]);
    }
    else
        _impl->print("Unknown command: {}. Type /help for the list.\n", command);

    return true;
}

auto Console::sendMessage(std::string_view text) -> Result<std::string>
{
    auto streamed = false;
    auto events = AgentEvents {
        .onText =
            [&](std::string_view fragment) {
                streamed = true;
                _impl->print("{}", fragment);
            },
        .onToolCall =
            [&](const ToolCallRequest& call) {
                if (streamed)
                    _impl->print("\n");
                streamed = false;
                _impl->print("[tool] {}({})\n", call.name, preview(json::dump(call.arguments), 120));
            },
        .onToolResult =
            [&](const ToolCallRequest& call, const ToolResult& result) {
                _impl->print("[{}] {}: {}\n",
                             result.isError ? "failed" : "done",
                             call.name,
                             preview(result.content, 160));
            },
    };

    auto result = _impl->runTurn(text, events);
    if (streamed)
        _impl->print("\n");

    if (!result)
    {
        if (result.error().code == ErrorCode::Cancelled)
            _impl->print("(cancelled)\n");
        else
            _impl->print("Error: {}\n", result.error());
    }
    return result;
}

auto Console::config() const -> const AppConfig&
{
    return _impl->config;
}

auto Console::session() const -> const ChatSession&
{
    return _impl->session;
}

auto Console::gateway() -> ToolGateway&
{
    return _impl->gateway;
}

} // namespace zesbe
