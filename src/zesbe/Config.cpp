// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/QualifiedName.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace zesbe
{

namespace
{
    constexpr auto Presets = std::array<ProviderPreset, 8> { {
        { .id = "minimax", .displayName = "MiniMax", .baseUrl = "https://api.minimax.io/v1", .model = "MiniMax-M2" },
        { .id = "openai", .displayName = "OpenAI", .baseUrl = "https://api.openai.com/v1", .model = "gpt-4o" },
        { .id = "anthropic",
          .displayName = "Anthropic",
          .baseUrl = "https://api.anthropic.com/v1",
          .model = "claude-sonnet-4-20250514" },
        { .id = "google",
          .displayName = "Google",
          .baseUrl = "https://generativelanguage.googleapis.com/v1beta",
          .model = "gemini-2.0-flash" },
        { .id = "groq",
          .displayName = "Groq",
          .baseUrl = "https://api.groq.com/openai/v1",
          .model = "llama-3.3-70b-versatile" },
        { .id = "deepseek",
          .displayName = "DeepSeek",
          .baseUrl = "https://api.deepseek.com/v1",
          .model = "deepseek-chat" },
        { .id = "openrouter",
          .displayName = "OpenRouter",
          .baseUrl = "https://openrouter.ai/api/v1",
          .model = "anthropic/claude-sonnet-4" },
        { .id = "ollama", .displayName = "Ollama", .baseUrl = "http://localhost:11434/v1", .model = "llama3.2" },
    } };

    constexpr auto DefaultSystemPrompt = std::string_view {
        "You are an expert AI coding assistant working in the user's terminal. "
        "Use the available tools to inspect files, make focused edits and run commands "
        "instead of guessing. Read code before changing it, keep changes minimal, "
        "and explain briefly what you did."
    };

    auto readFile(std::string_view path) -> Result<std::string>
    {
        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();
        return ss.str();
    }

    auto parseServer(const nlohmann::json& serverJson) -> McpServerConfig
    {
        return McpServerConfig {
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringList(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
            .enabled = json::getBoolOr(serverJson, "enabled", true),
        };
    }

    void mergeServers(AppConfig& config, const nlohmann::json& root)
    {
        auto const servers = root.find("mcpServers");
        if (servers == root.end() || !servers->is_object())
            return;

        for (const auto& [name, serverJson]: servers->items())
        {
            if (!serverJson.is_object())
                continue;
            if (!QualifiedName::isValidServerName(name))
            {
                log::warning("Ignoring MCP server '{}': server names may only use letters, digits and '-'", name);
                continue;
            }
            config.mcpServers[name] = parseServer(serverJson);
        }
    }

    auto readKeyFile(const std::string& dir, std::string_view provider) -> std::optional<std::string>
    {
        if (dir.empty())
            return std::nullopt;

        auto const path = std::filesystem::path(dir) / std::format(".{}_api_key", provider);
        auto file = std::ifstream(path);
        if (!file.is_open())
            return std::nullopt;

        auto key = std::string {};
        std::getline(file, key);
        while (!key.empty() && std::isspace(static_cast<unsigned char>(key.back())))
            key.pop_back();
        return key.empty() ? std::nullopt : std::optional(key);
    }

    auto processEnvironment(std::string_view name) -> std::optional<std::string>
    {
        if (auto const* const value = std::getenv(std::string(name).c_str()))
            return std::string(value);
        return std::nullopt;
    }
} // namespace

auto providerPresets() -> std::span<const ProviderPreset>
{
    return Presets;
}

auto findProviderPreset(std::string_view id) -> std::optional<ProviderPreset>
{
    auto const it = std::ranges::find(Presets, id, &ProviderPreset::id);
    if (it == Presets.end())
        return std::nullopt;
    return *it;
}

auto defaultSystemPrompt() -> std::string_view
{
    return DefaultSystemPrompt;
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/zesbe";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/zesbe";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto projectMcpConfigPath() -> std::string
{
    return ".zesbe/mcp.json";
}

auto defaultConfigSources() -> ConfigSources
{
    auto const* const home = std::getenv("HOME");
    return ConfigSources {
        .userFile = defaultConfigPath(),
        .projectMcpFile = projectMcpConfigPath(),
        .keyFileDir = home ? std::string(home) : std::string {},
        .environment = processEnvironment,
    };
}

auto apiKeyVariable(std::string_view provider) -> std::string
{
    auto name = std::string(provider);
    std::ranges::transform(name, name.begin(), [](unsigned char c) {
        return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    });
    return name + "_API_KEY";
}

auto applyConfigJson(AppConfig& config, const nlohmann::json& root) -> VoidResult
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration root must be a JSON object");

    // Provider section, flat at the top level
    auto& provider = config.provider;
    provider.name = json::getStringOr(root, "provider", provider.name);
    provider.model = json::getStringOr(root, "model", provider.model);
    provider.baseUrl = json::getStringOr(root, "baseUrl", provider.baseUrl);
    provider.apiKey = json::getStringOr(root, "apiKey", provider.apiKey);
    provider.maxTokens = json::getIntOr(root, "maxTokens", provider.maxTokens);
    provider.temperature = json::getFloatOr(root, "temperature", provider.temperature);

    // Agent section
    if (auto const agent = root.find("agent"); agent != root.end() && agent->is_object())
    {
        config.agent.maxIterations = json::getIntOr(*agent, "maxIterations", config.agent.maxIterations);
        config.agent.toolsEnabled = json::getBoolOr(*agent, "toolsEnabled", config.agent.toolsEnabled);
        config.agent.commandTimeoutSeconds =
            json::getIntOr(*agent, "commandTimeoutSeconds", config.agent.commandTimeoutSeconds);
    }

    mergeServers(config, root);

    config.logLevel = json::getStringOr(root, "logLevel", config.logLevel);
    config.systemPrompt = json::getStringOr(root, "systemPrompt", config.systemPrompt);

    if (config.agent.maxIterations < 1)
        return makeError(ErrorCode::ConfigError, "agent.maxIterations must be at least 1");
    if (config.provider.maxTokens < 1)
        return makeError(ErrorCode::ConfigError, "maxTokens must be at least 1");

    return {};
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    return readFile(path)
        .and_then([](const std::string& content) { return json::parse(content); })
        .and_then([path](const nlohmann::json& root) -> Result<AppConfig> {
            auto config = AppConfig {};
            if (auto applied = applyConfigJson(config, root); !applied)
                return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, applied.error().message));
            return config;
        });
}

auto mergeMcpConfigFile(AppConfig& config, std::string_view path) -> VoidResult
{
    if (!std::filesystem::exists(path))
        return {};

    return readFile(path)
        .and_then([](const std::string& content) { return json::parse(content); })
        .and_then([&config, path](const nlohmann::json& root) -> VoidResult {
            if (!root.is_object())
                return makeError(ErrorCode::ConfigError, std::format("{}: root must be a JSON object", path));
            mergeServers(config, root);
            return {};
        });
}

void applyOverrides(AppConfig& config, const ConfigOverrides& overrides)
{
    auto& provider = config.provider;

    if (overrides.provider && *overrides.provider != provider.name)
    {
        provider.name = *overrides.provider;
        provider.model.clear();
        provider.baseUrl.clear();
        provider.apiKey.clear();
    }
    if (overrides.model)
        provider.model = *overrides.model;
    if (overrides.baseUrl)
        provider.baseUrl = *overrides.baseUrl;
    if (overrides.maxTokens)
        provider.maxTokens = *overrides.maxTokens;
    if (overrides.temperature)
        provider.temperature = *overrides.temperature;
    if (overrides.disableTools)
        config.agent.toolsEnabled = false;
}

void resolveProvider(AppConfig& config, const ConfigSources& sources)
{
    auto& provider = config.provider;

    if (provider.apiKey.empty() && sources.environment)
    {
        if (auto key = sources.environment(apiKeyVariable(provider.name)); key && !key->empty())
            provider.apiKey = std::move(*key);
    }
    if (provider.apiKey.empty())
    {
        if (auto key = readKeyFile(sources.keyFileDir, provider.name))
            provider.apiKey = std::move(*key);
    }

    if (auto const preset = findProviderPreset(provider.name))
    {
        if (provider.baseUrl.empty())
            provider.baseUrl = std::string(preset->baseUrl);
        if (provider.model.empty())
            provider.model = std::string(preset->model);
    }
}

auto loadConfig(const ConfigSources& sources, const ConfigOverrides& overrides) -> Result<AppConfig>
{
    auto config = AppConfig {};

    if (!sources.userFile.empty() && std::filesystem::exists(sources.userFile))
    {
        auto loaded = loadConfigFromFile(sources.userFile);
        if (!loaded)
            return std::unexpected(loaded.error());
        config = std::move(*loaded);
    }
    else
    {
        log::debug("No config file found at {}, using defaults", sources.userFile);
    }

    if (!sources.projectMcpFile.empty())
    {
        if (auto merged = mergeMcpConfigFile(config, sources.projectMcpFile); !merged)
            return std::unexpected(merged.error());
    }

    applyOverrides(config, overrides);
    resolveProvider(config, sources);

    if (config.provider.baseUrl.empty())
        return makeError(ErrorCode::ConfigError,
                         std::format("Unknown provider '{}' and no base URL configured", config.provider.name));

    if (config.systemPrompt.empty())
        config.systemPrompt = std::string(defaultSystemPrompt());

    return config;
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();

    root["provider"] = config.provider.name;
    if (!config.provider.model.empty())
        root["model"] = config.provider.model;
    if (!config.provider.baseUrl.empty())
        root["baseUrl"] = config.provider.baseUrl;
    root["maxTokens"] = config.provider.maxTokens;
    root["temperature"] = config.provider.temperature;

    auto agent = nlohmann::json::object();
    agent["maxIterations"] = config.agent.maxIterations;
    agent["toolsEnabled"] = config.agent.toolsEnabled;
    agent["commandTimeoutSeconds"] = config.agent.commandTimeoutSeconds;
    root["agent"] = std::move(agent);

    if (!config.mcpServers.empty())
    {
        auto servers = nlohmann::json::object();
        for (const auto& [name, serverConfig]: config.mcpServers)
        {
            auto server = nlohmann::json::object();
            server["command"] = serverConfig.command;
            if (!serverConfig.args.empty())
                server["args"] = serverConfig.args;
            if (!serverConfig.env.empty())
                server["env"] = serverConfig.env;
            if (!serverConfig.enabled)
                server["enabled"] = false;
            servers[name] = std::move(server);
        }
        root["mcpServers"] = std::move(servers);
    }

    root["logLevel"] = config.logLevel;
    if (!config.systemPrompt.empty() && config.systemPrompt != defaultSystemPrompt())
        root["systemPrompt"] = config.systemPrompt;

    return root;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << json::dump(configToJson(config), 2) << '\n';
    return {};
}

} // namespace zesbe
