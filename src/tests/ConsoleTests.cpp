// SPDX-License-Identifier: Apache-2.0
#include <zesbe/Console.hpp>

#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <filesystem>
#include <format>
#include <sstream>

using namespace zesbe;

namespace
{

using Script = std::deque<std::vector<StreamEvent>>;

/// @brief Provider answering from a script shared by every instance the factory creates.
class ScriptedProvider: public ChatProvider
{
  public:
    ScriptedProvider(std::shared_ptr<Script> script, std::string model):
        _script(std::move(script)), _model(std::move(model))
    {
    }

    auto chat(const ChatRequest& /*request*/) -> Result<ChatResponse> override
    {
        return makeError(ErrorCode::Unknown, "chat() is not scripted");
    }

    auto chatStream(const ChatRequest& /*request*/) -> std::unique_ptr<EventStream> override
    {
        if (_script->empty())
            return EventStream::fromEvents({ StreamError {
                .error = Error { .code = ErrorCode::EndpointError, .message = "quota exceeded", .httpStatus = 429 } } });

        auto events = std::move(_script->front());
        _script->pop_front();
        return EventStream::fromEvents(std::move(events));
    }

    auto defaultModel() const -> const std::string& override { return _model; }

  private:
    std::shared_ptr<Script> _script;
    std::string _model;
};

auto testConfig() -> AppConfig
{
    auto config = AppConfig {};
    config.provider = ProviderSettings {
        .name = "openai", .model = "gpt-4o", .baseUrl = "https://api.openai.com/v1", .apiKey = "sk-test",
    };
    config.mcpServers["docs"] = McpServerConfig { .command = "docs-server", .args = {}, .env = {}, .enabled = true };
    config.mcpServers["off"] = McpServerConfig { .command = "off-server", .args = {}, .env = {}, .enabled = false };
    config.systemPrompt = "Be brief.";
    return config;
}

/// @brief A console wired to in-memory streams, a scripted provider and MCP servers that never start.
struct ConsoleHarness
{
    std::istringstream input;
    std::ostringstream output;
    std::shared_ptr<Script> script = std::make_shared<Script>();
    std::vector<std::string> createdFor;
    Console console;

    explicit ConsoleHarness(std::string configPath = {}):
        console(testConfig(),
                ConsoleOptions {
                    .input = &input,
                    .output = &output,
                    .configPath = std::move(configPath),
                    .providerFactory =
                        [this](const ProviderSettings& settings) -> Result<std::unique_ptr<ChatProvider>> {
                        createdFor.push_back(settings.name);
                        return std::make_unique<ScriptedProvider>(script, settings.model);
                    },
                    .transportFactory = [](const std::string& name,
                                           const McpServerConfig&) -> Result<std::unique_ptr<Transport>> {
                        return makeError(ErrorCode::TransportError, std::format("cannot start {}", name));
                    },
                    .sources =
                        ConfigSources {
                            .userFile = {},
                            .projectMcpFile = {},
                            .keyFileDir = {},
                            .environment = [](std::string_view) { return std::optional<std::string> {}; },
                        },
                    .handleInterrupts = false,
                })
    {
        log::setLevel(log::Level::Warning);
    }

    /// @brief Returns everything printed since the last call.
    auto takeOutput() -> std::string
    {
        auto text = output.str();
        output.str({});
        return text;
    }
};

auto contains(const std::string& haystack, std::string_view needle) -> bool
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Console initializes despite MCP servers that fail to start", "[console]")
{
    auto harness = ConsoleHarness {};
    REQUIRE(harness.console.initialize().has_value());
    CHECK(harness.createdFor == std::vector<std::string> { "openai" });
    CHECK(harness.console.gateway().getConnectedServers().empty());
    harness.takeOutput();

    harness.console.handleLine("/mcp");
    auto const listing = harness.takeOutput();
    CHECK(contains(listing, "docs"));
    CHECK(contains(listing, "disconnected"));
    CHECK(contains(listing, "disabled"));

    harness.console.handleLine("/mcp connect nobody");
    CHECK(harness.takeOutput() == "Unknown MCP server: nobody\n");

    harness.console.handleLine("/mcp connect docs");
    CHECK(contains(harness.takeOutput(), "cannot start docs"));

    harness.console.handleLine("/mcp frobnicate");
    CHECK(contains(harness.takeOutput(), "Usage: /mcp"));
}

TEST_CASE("Console reports a provider that cannot be created", "[console]")
{
    auto output = std::ostringstream {};
    auto console = Console(testConfig(),
                           ConsoleOptions {
                               .input = nullptr,
                               .output = &output,
                               .configPath = {},
                               .providerFactory = [](const ProviderSettings&) -> Result<std::unique_ptr<ChatProvider>> {
                                   return makeError(ErrorCode::InvalidArgument, "bad base URL");
                               },
                               .transportFactory = {},
                               .sources = {},
                               .handleInterrupts = false,
                           });

    auto const initialized = console.initialize();
    REQUIRE(!initialized.has_value());
    CHECK(initialized.error().message == "bad base URL");
}

TEST_CASE("Console streams replies and tool activity", "[console]")
{
    auto harness = ConsoleHarness {};
    REQUIRE(harness.console.initialize().has_value());
    harness.script->push_back({
        TextFragment { .text = "Looking." },
        ToolCallEvent { .call = ToolCallRequest {
                            .id = "c1", .name = "mcp_docs_search", .arguments = { { "query", "x" } } } },
    });
    harness.script->push_back({ TextFragment { .text = "Not " }, TextFragment { .text = "found." } });
    harness.takeOutput();

    auto const reply = harness.console.sendMessage("find x");
    REQUIRE(reply.has_value());
    CHECK(*reply == "Not found.");

    auto const printed = harness.takeOutput();
    CHECK(printed.starts_with("Looking."));
    CHECK(contains(printed, "[tool] mcp_docs_search({\"query\":\"x\"})\n"));
    CHECK(contains(printed, "[failed] mcp_docs_search: Error: MCP server not connected: docs\n"));
    CHECK(contains(printed, "Not found.\n"));

    // user, assistant with tool call, tool result, final answer
    CHECK(harness.console.session().messageCount() == 4);
}

TEST_CASE("Console prints turn errors and keeps the session intact", "[console]")
{
    auto harness = ConsoleHarness {};
    REQUIRE(harness.console.initialize().has_value());
    harness.takeOutput();

    auto const reply = harness.console.sendMessage("hello");
    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::EndpointError);
    CHECK(contains(harness.takeOutput(), "Error: "));
    CHECK(harness.console.session().messageCount() == 0);
}

TEST_CASE("Console handles session commands", "[console]")
{
    auto harness = ConsoleHarness {};
    REQUIRE(harness.console.initialize().has_value());
    harness.script->push_back({ TextFragment { .text = "Hi." } });
    harness.takeOutput();

    CHECK(harness.console.handleLine("   "));
    CHECK(harness.takeOutput().empty());

    CHECK(harness.console.handleLine("/help"));
    CHECK(contains(harness.takeOutput(), "/provider [name]"));

    CHECK(harness.console.handleLine("/history"));
    CHECK(harness.takeOutput() == "No messages yet.\n");

    CHECK(harness.console.handleLine("hello there"));
    harness.takeOutput();

    CHECK(harness.console.handleLine("/history"));
    auto const history = harness.takeOutput();
    CHECK(contains(history, "1. user: hello there"));
    CHECK(contains(history, "2. assistant: Hi."));

    CHECK(harness.console.handleLine("/clear"));
    CHECK(harness.takeOutput() == "Conversation cleared.\n");
    CHECK(harness.console.session().messageCount() == 0);
    CHECK(harness.console.session().systemPrompt() == "Be brief.");

    CHECK(harness.console.handleLine("/bogus"));
    CHECK(harness.takeOutput() == "Unknown command: /bogus. Type /help for the list.\n");

    CHECK(!harness.console.handleLine("/exit"));
    CHECK(!harness.console.handleLine("  /q"));
}

TEST_CASE("Console lists tools and configuration", "[console]")
{
    auto harness = ConsoleHarness {};
    REQUIRE(harness.console.initialize().has_value());
    harness.takeOutput();

    harness.console.handleLine("/tools");
    auto const tools = harness.takeOutput();
    CHECK(contains(tools, "Built-in tools (5):"));
    CHECK(contains(tools, "read_file"));
    CHECK(contains(tools, "run_command"));

    harness.console.handleLine("/config");
    auto const config = harness.takeOutput();
    CHECK(contains(config, "Provider:       openai"));
    CHECK(contains(config, "Model:          gpt-4o"));
    CHECK(contains(config, "API key:        set"));
    CHECK(!contains(config, "sk-test"));
    CHECK(contains(config, "MCP servers:    2 configured, 0 connected"));
}

TEST_CASE("Console switches providers", "[console]")
{
    auto const dir = std::filesystem::temp_directory_path() / "zesbe_test_console_provider";
    std::filesystem::remove_all(dir);
    auto const configPath = (dir / "config.json").string();

    auto harness = ConsoleHarness(configPath);
    REQUIRE(harness.console.initialize().has_value());
    harness.takeOutput();

    harness.console.handleLine("/provider");
    auto const listing = harness.takeOutput();
    CHECK(contains(listing, "* openai"));
    CHECK(contains(listing, "  groq"));

    harness.console.handleLine("/provider nowhere");
    CHECK(contains(harness.takeOutput(), "Unknown provider: nowhere"));
    CHECK(harness.console.config().provider.name == "openai");

    harness.console.handleLine("/provider groq");
    auto const switched = harness.takeOutput();
    CHECK(contains(switched, "Switched to Groq (llama-3.3-70b-versatile)"));
    CHECK(contains(switched, "No API key found; set GROQ_API_KEY."));
    CHECK(harness.createdFor == std::vector<std::string> { "openai", "groq" });

    auto const& provider = harness.console.config().provider;
    CHECK(provider.name == "groq");
    CHECK(provider.baseUrl == "https://api.groq.com/openai/v1");
    CHECK(provider.apiKey.empty());

    auto const saved = loadConfigFromFile(configPath);
    REQUIRE(saved.has_value());
    CHECK(saved->provider.name == "groq");
    CHECK(saved->mcpServers.empty());

    std::filesystem::remove_all(dir);
}
