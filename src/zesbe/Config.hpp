// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ToolGateway.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace zesbe
{

/// @brief A well-known OpenAI-compatible endpoint.
struct ProviderPreset
{
    std::string_view id;          ///< Key used in config files and on the command line.
    std::string_view displayName; ///< Human-readable name.
    std::string_view baseUrl;
    std::string_view model; ///< Model used when none is configured.
};

/// @brief Returns the built-in provider presets.
[[nodiscard]] auto providerPresets() -> std::span<const ProviderPreset>;

/// @brief Looks up a preset by id.
[[nodiscard]] auto findProviderPreset(std::string_view id) -> std::optional<ProviderPreset>;

/// @brief Which endpoint to talk to and how.
struct ProviderSettings
{
    std::string name = "minimax";
    std::string model;   // empty: the preset's model
    std::string baseUrl; // empty: the preset's base URL
    std::string apiKey;  // never written back to disk
    int maxTokens = 4096;
    float temperature = 0.7f;
};

/// @brief Agent loop and built-in tool settings.
struct AgentSettings
{
    int maxIterations = 10;
    bool toolsEnabled = true;
    int commandTimeoutSeconds = 60;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ProviderSettings provider;
    AgentSettings agent;
    std::map<std::string, McpServerConfig> mcpServers;
    std::string logLevel = "warning";
    std::string systemPrompt;
};

/// @brief Command-line values that take precedence over every file.
struct ConfigOverrides
{
    std::optional<std::string> provider;
    std::optional<std::string> model;
    std::optional<std::string> baseUrl;
    std::optional<int> maxTokens;
    std::optional<float> temperature;
    bool disableTools = false;
};

/// @brief Reads an environment variable. Substitutable in tests.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Where configuration is read from.
struct ConfigSources
{
    std::string userFile;       ///< Missing file is fine.
    std::string projectMcpFile; ///< Missing file is fine.
    std::string keyFileDir;     ///< Directory holding ".<provider>_api_key" files; empty disables.
    EnvironmentLookup environment;
};

/// @brief Returns the system prompt used when the configuration sets none.
[[nodiscard]] auto defaultSystemPrompt() -> std::string_view;

/// @brief Returns the default config directory path ($XDG_CONFIG_HOME/zesbe or ~/.config/zesbe).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the project-local MCP server file path, relative to the current directory.
[[nodiscard]] auto projectMcpConfigPath() -> std::string;

/// @brief Returns the sources used by loadConfig() outside of tests.
[[nodiscard]] auto defaultConfigSources() -> ConfigSources;

/// @brief Returns the environment variable holding the API key for a provider, e.g. "OPENAI_API_KEY".
[[nodiscard]] auto apiKeyVariable(std::string_view provider) -> std::string;

/// @brief Applies a configuration document on top of @p config.
///
/// Only keys present in @p root are changed; MCP servers are merged by name.
/// @return Success, or ConfigError if @p root is not an object.
[[nodiscard]] auto applyConfigJson(AppConfig& config, const nlohmann::json& root) -> VoidResult;

/// @brief Loads a configuration file on top of the built-in defaults.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Merges the `mcpServers` of an MCP server file into @p config.
/// @return Success, or an error if the file exists but cannot be parsed.
[[nodiscard]] auto mergeMcpConfigFile(AppConfig& config, std::string_view path) -> VoidResult;

/// @brief Applies command-line overrides.
///
/// Switching to another provider drops the model, base URL and API key that
/// belonged to the previous one, unless they are overridden too.
void applyOverrides(AppConfig& config, const ConfigOverrides& overrides);

/// @brief Fills the API key, base URL and model from the environment, key file and preset.
void resolveProvider(AppConfig& config, const ConfigSources& sources);

/// @brief Loads the complete, layered configuration.
///
/// Layers, later wins: defaults, user file, project MCP file, overrides,
/// then the environment and presets for whatever is still unset.
[[nodiscard]] auto loadConfig(const ConfigSources& sources, const ConfigOverrides& overrides = {})
    -> Result<AppConfig>;

/// @brief Serializes the configuration as it is stored on disk, without the API key.
[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Saves the application configuration to a file. The API key is never written.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

} // namespace zesbe
