// SPDX-License-Identifier: Apache-2.0
#include <zesbe/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>

using namespace zesbe;

namespace
{

void writeFile(const std::filesystem::path& path, std::string_view content)
{
    std::filesystem::create_directories(path.parent_path());
    auto file = std::ofstream(path);
    file << content;
}

/// @brief An environment holding exactly the given variables.
auto fakeEnvironment(std::map<std::string, std::string> variables) -> EnvironmentLookup
{
    return [variables = std::move(variables)](std::string_view name) -> std::optional<std::string> {
        if (auto const it = variables.find(std::string(name)); it != variables.end())
            return it->second;
        return std::nullopt;
    };
}

/// @brief Sources that read nothing from the real machine.
auto isolatedSources(const std::filesystem::path& dir) -> ConfigSources
{
    return ConfigSources {
        .userFile = (dir / "config.json").string(),
        .projectMcpFile = (dir / "project" / "mcp.json").string(),
        .keyFileDir = (dir / "home").string(),
        .environment = fakeEnvironment({}),
    };
}

auto scratchDir(std::string_view name) -> std::filesystem::path
{
    auto const dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    CHECK(!defaultConfigDir().empty());
    CHECK(defaultConfigPath().ends_with("zesbe/config.json"));
    CHECK(projectMcpConfigPath() == ".zesbe/mcp.json");
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.provider.name == "minimax");
    CHECK(config.provider.maxTokens == 4096);
    CHECK(config.provider.temperature == 0.7f);
    CHECK(config.agent.maxIterations == 10);
    CHECK(config.agent.toolsEnabled);
    CHECK(config.mcpServers.empty());
}

TEST_CASE("Provider presets cover the known endpoints", "[config]")
{
    CHECK(providerPresets().size() == 8);

    auto const groq = findProviderPreset("groq");
    REQUIRE(groq.has_value());
    CHECK(groq->baseUrl == "https://api.groq.com/openai/v1");

    auto const ollama = findProviderPreset("ollama");
    REQUIRE(ollama.has_value());
    CHECK(ollama->baseUrl == "http://localhost:11434/v1");

    CHECK(!findProviderPreset("nonexistent").has_value());
}

TEST_CASE("apiKeyVariable derives the environment variable name", "[config]")
{
    CHECK(apiKeyVariable("openai") == "OPENAI_API_KEY");
    CHECK(apiKeyVariable("openrouter") == "OPENROUTER_API_KEY");
    CHECK(apiKeyVariable("my-proxy") == "MY_PROXY_API_KEY");
}

TEST_CASE("applyConfigJson changes only the keys present", "[config]")
{
    auto config = AppConfig {};
    auto const applied = applyConfigJson(config,
                                         nlohmann::json::parse(R"({
        "provider": "deepseek",
        "temperature": 0.2,
        "agent": { "maxIterations": 4 },
        "systemPrompt": "Answer in haiku.",
        "mcpServers": {
            "github": { "command": "npx", "args": ["-y", "server-github"], "env": { "TOKEN": "t" } },
            "files": { "command": "mcp-files", "enabled": false },
            "bad_name": { "command": "ignored" },
            "notAnObject": 42
        }
    })"));

    REQUIRE(applied.has_value());
    CHECK(config.provider.name == "deepseek");
    CHECK(config.provider.temperature == 0.2f);
    CHECK(config.provider.maxTokens == 4096);
    CHECK(config.agent.maxIterations == 4);
    CHECK(config.agent.toolsEnabled);
    CHECK(config.systemPrompt == "Answer in haiku.");

    REQUIRE(config.mcpServers.size() == 2);
    auto const& github = config.mcpServers.at("github");
    CHECK(github.command == "npx");
    CHECK(github.args == std::vector<std::string> { "-y", "server-github" });
    CHECK(github.env.at("TOKEN") == "t");
    CHECK(github.enabled);
    CHECK(!config.mcpServers.at("files").enabled);
}

TEST_CASE("applyConfigJson rejects invalid documents", "[config]")
{
    auto config = AppConfig {};
    CHECK(applyConfigJson(config, nlohmann::json::array()).error().code == ErrorCode::ConfigError);
    CHECK(applyConfigJson(config, { { "agent", { { "maxIterations", 0 } } } }).error().code
          == ErrorCode::ConfigError);

    auto other = AppConfig {};
    CHECK(applyConfigJson(other, { { "maxTokens", -1 } }).error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile reports missing and invalid files", "[config]")
{
    auto const dir = scratchDir("zesbe_test_config_errors");

    auto const missing = loadConfigFromFile((dir / "absent.json").string());
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ConfigError);

    writeFile(dir / "invalid.json", "{ not valid json }");
    CHECK(!loadConfigFromFile((dir / "invalid.json").string()).has_value());

    writeFile(dir / "zero.json", R"({ "agent": { "maxIterations": 0 } })");
    auto const zero = loadConfigFromFile((dir / "zero.json").string());
    REQUIRE(!zero.has_value());
    CHECK(zero.error().message.find("maxIterations") != std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST_CASE("mergeMcpConfigFile adds and replaces servers by name", "[config]")
{
    auto const dir = scratchDir("zesbe_test_mcp_merge");
    auto config = AppConfig {};
    config.mcpServers["github"] = McpServerConfig { .command = "old", .args = {}, .env = {}, .enabled = true };
    config.mcpServers["keep"] = McpServerConfig { .command = "keep", .args = {}, .env = {}, .enabled = true };

    CHECK(mergeMcpConfigFile(config, (dir / "absent.json").string()).has_value());
    CHECK(config.mcpServers.size() == 2);

    writeFile(dir / "mcp.json", R"({ "mcpServers": { "github": { "command": "new" }, "db": { "command": "pg" } } })");
    REQUIRE(mergeMcpConfigFile(config, (dir / "mcp.json").string()).has_value());
    CHECK(config.mcpServers.size() == 3);
    CHECK(config.mcpServers.at("github").command == "new");
    CHECK(config.mcpServers.at("keep").command == "keep");
    CHECK(config.mcpServers.at("db").command == "pg");

    writeFile(dir / "broken.json", "[1, 2");
    CHECK(!mergeMcpConfigFile(config, (dir / "broken.json").string()).has_value());

    std::filesystem::remove_all(dir);
}

TEST_CASE("applyOverrides drops provider specifics when switching provider", "[config]")
{
    auto config = AppConfig {};
    config.provider = ProviderSettings {
        .name = "openai", .model = "gpt-4o-mini", .baseUrl = "https://proxy/v1", .apiKey = "sk-old",
    };

    SECTION("same provider keeps everything")
    {
        applyOverrides(config, ConfigOverrides { .provider = "openai" });
        CHECK(config.provider.model == "gpt-4o-mini");
        CHECK(config.provider.apiKey == "sk-old");
    }

    SECTION("another provider clears model, URL and key")
    {
        applyOverrides(config, ConfigOverrides { .provider = "groq", .maxTokens = 100, .disableTools = true });
        CHECK(config.provider.name == "groq");
        CHECK(config.provider.model.empty());
        CHECK(config.provider.baseUrl.empty());
        CHECK(config.provider.apiKey.empty());
        CHECK(config.provider.maxTokens == 100);
        CHECK(!config.agent.toolsEnabled);
    }

    SECTION("explicit values win over the clearing")
    {
        applyOverrides(config, ConfigOverrides { .provider = "ollama", .model = "qwen2.5-coder" });
        CHECK(config.provider.model == "qwen2.5-coder");
        CHECK(config.provider.baseUrl.empty());
    }
}

TEST_CASE("resolveProvider prefers the environment over the key file", "[config]")
{
    auto const dir = scratchDir("zesbe_test_resolve");
    writeFile(dir / "home" / ".deepseek_api_key", "sk-from-file  \n");

    auto sources = isolatedSources(dir);

    SECTION("key file and preset fill the gaps")
    {
        auto config = AppConfig {};
        config.provider.name = "deepseek";
        resolveProvider(config, sources);
        CHECK(config.provider.apiKey == "sk-from-file");
        CHECK(config.provider.baseUrl == "https://api.deepseek.com/v1");
        CHECK(config.provider.model == "deepseek-chat");
    }

    SECTION("environment wins")
    {
        sources.environment = fakeEnvironment({ { "DEEPSEEK_API_KEY", "sk-from-env" } });
        auto config = AppConfig {};
        config.provider.name = "deepseek";
        resolveProvider(config, sources);
        CHECK(config.provider.apiKey == "sk-from-env");
    }

    SECTION("configured values are kept")
    {
        auto config = AppConfig {};
        config.provider = ProviderSettings {
            .name = "deepseek", .model = "deepseek-coder", .baseUrl = "http://mirror/v1", .apiKey = "sk-config",
        };
        resolveProvider(config, sources);
        CHECK(config.provider.apiKey == "sk-config");
        CHECK(config.provider.baseUrl == "http://mirror/v1");
        CHECK(config.provider.model == "deepseek-coder");
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("loadConfig layers defaults, files, overrides and environment", "[config]")
{
    auto const dir = scratchDir("zesbe_test_layers");
    writeFile(dir / "config.json",
              R"({ "provider": "openai", "model": "gpt-4o-mini", "logLevel": "info",
                   "mcpServers": { "github": { "command": "user-github" } } })");
    writeFile(dir / "project" / "mcp.json", R"({ "mcpServers": { "github": { "command": "project-github" } } })");

    auto sources = isolatedSources(dir);
    sources.environment = fakeEnvironment({ { "OPENAI_API_KEY", "sk-env" } });

    auto const config = loadConfig(sources, ConfigOverrides { .temperature = 1.5f });
    REQUIRE(config.has_value());
    CHECK(config->provider.name == "openai");
    CHECK(config->provider.model == "gpt-4o-mini");
    CHECK(config->provider.baseUrl == "https://api.openai.com/v1");
    CHECK(config->provider.apiKey == "sk-env");
    CHECK(config->provider.temperature == 1.5f);
    CHECK(config->logLevel == "info");
    CHECK(config->mcpServers.at("github").command == "project-github");
    CHECK(config->systemPrompt == defaultSystemPrompt());

    std::filesystem::remove_all(dir);
}

TEST_CASE("loadConfig works without any files", "[config]")
{
    auto const dir = scratchDir("zesbe_test_no_files");

    auto const config = loadConfig(isolatedSources(dir));
    REQUIRE(config.has_value());
    CHECK(config->provider.name == "minimax");
    CHECK(config->provider.baseUrl == "https://api.minimax.io/v1");
    CHECK(config->provider.apiKey.empty());

    std::filesystem::remove_all(dir);
}

TEST_CASE("loadConfig rejects an unknown provider without a base URL", "[config]")
{
    auto const dir = scratchDir("zesbe_test_unknown_provider");
    auto const sources = isolatedSources(dir);

    auto const unknown = loadConfig(sources, ConfigOverrides { .provider = "mystery" });
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::ConfigError);
    CHECK(unknown.error().message.find("mystery") != std::string::npos);

    auto const custom =
        loadConfig(sources, ConfigOverrides { .provider = "mystery", .baseUrl = "http://localhost:9000/v1" });
    REQUIRE(custom.has_value());
    CHECK(custom->provider.model.empty());

    std::filesystem::remove_all(dir);
}

TEST_CASE("saveConfigToFile writes a config that loads back without the API key", "[config]")
{
    auto const dir = scratchDir("zesbe_test_save");
    auto const path = (dir / "nested" / "config.json").string();

    auto config = AppConfig {};
    config.provider = ProviderSettings {
        .name = "groq", .model = "llama-3.3-70b-versatile", .baseUrl = "", .apiKey = "sk-secret",
        .maxTokens = 2048, .temperature = 0.25f,
    };
    config.agent.maxIterations = 6;
    config.mcpServers["files"] =
        McpServerConfig { .command = "mcp-files", .args = { "--root", "." }, .env = {}, .enabled = false };
    config.systemPrompt = std::string(defaultSystemPrompt());

    auto const stored = configToJson(config);
    CHECK(!stored.contains("apiKey"));
    CHECK(!stored.contains("baseUrl"));
    CHECK(!stored.contains("systemPrompt"));
    CHECK(stored["mcpServers"]["files"]["enabled"] == false);

    REQUIRE(saveConfigToFile(path, config).has_value());

    auto file = std::ifstream(path);
    auto const written = std::string(std::istreambuf_iterator<char>(file), {});
    CHECK(written.find("sk-secret") == std::string::npos);

    auto const loaded = loadConfigFromFile(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->provider.name == "groq");
    CHECK(loaded->provider.model == "llama-3.3-70b-versatile");
    CHECK(loaded->provider.apiKey.empty());
    CHECK(loaded->provider.maxTokens == 2048);
    CHECK(loaded->provider.temperature == 0.25f);
    CHECK(loaded->agent.maxIterations == 6);
    CHECK(loaded->mcpServers.at("files").args == std::vector<std::string> { "--root", "." });
    CHECK(!loaded->mcpServers.at("files").enabled);

    std::filesystem::remove_all(dir);
}
