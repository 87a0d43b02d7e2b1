// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ToolGateway.hpp>
#include <zesbe/Config.hpp>
#include <zesbe/Console.hpp>

#include <CLI/CLI.hpp>

#include <print>

namespace
{

auto printProviders(std::string_view current) -> int
{
    for (const auto& preset: zesbe::providerPresets())
    {
        auto const marker = preset.id == current ? '*' : ' ';
        std::println(
            "{} {:<12} {:<28} {:<40} {}", marker, preset.id, preset.displayName, preset.baseUrl, preset.model);
    }
    return 0;
}

auto printConfig(const zesbe::AppConfig& config) -> int
{
    auto root = zesbe::configToJson(config);
    root["model"] = config.provider.model;
    root["baseUrl"] = config.provider.baseUrl;
    root["apiKey"] = config.provider.apiKey.empty() ? "(not set)" : "(set)";
    std::println("{}", zesbe::json::dump(root, 2));
    return 0;
}

/// Connects every configured server once and reports what it offers.
auto listMcpServers(const zesbe::AppConfig& config) -> int
{
    if (config.mcpServers.empty())
    {
        std::println("No MCP servers configured.");
        return 0;
    }

    auto gateway = zesbe::ToolGateway(config.mcpServers);
    for (const auto& [name, serverConfig]: config.mcpServers)
    {
        if (!serverConfig.enabled)
        {
            std::println("{:<16} disabled", name);
            continue;
        }

        if (auto result = gateway.connect(name, serverConfig); !result)
        {
            std::println("{:<16} failed: {}", name, result.error().message);
            continue;
        }

        std::println("{:<16} {} tools", name, gateway.toolCount(name));
        for (const auto& tool: gateway.getTools())
            std::println("    {}", tool.name);
        gateway.disconnect(name);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "zesbe - terminal coding agent for OpenAI-compatible endpoints with MCP tools" };

    auto provider = std::string {};
    auto model = std::string {};
    auto baseUrl = std::string {};
    auto configPath = std::string {};
    auto maxTokens = 0;
    auto temperature = 0.0f;
    auto noTools = false;
    auto verbose = false;

    auto* providerOption = app.add_option("-p,--provider", provider, "Provider preset (see 'zesbe providers')");
    auto* modelOption = app.add_option("-m,--model", model, "Model name");
    auto* baseUrlOption = app.add_option("--base-url", baseUrl, "OpenAI-compatible endpoint base URL");
    app.add_option("-c,--config", configPath, "Path to config file");
    auto* maxTokensOption =
        app.add_option("--max-tokens", maxTokens, "Maximum tokens per response")->check(CLI::PositiveNumber);
    auto* temperatureOption =
        app.add_option("--temperature", temperature, "Sampling temperature")->check(CLI::Range(0.0, 2.0));
    app.add_flag("--no-tools", noTools, "Do not offer any tools to the model");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* providersCommand = app.add_subcommand("providers", "List the built-in provider presets");
    auto* configCommand = app.add_subcommand("config", "Print the resolved configuration");
    auto* mcpCommand = app.add_subcommand("mcp", "Inspect MCP servers");
    auto* mcpListCommand = mcpCommand->add_subcommand("list", "Connect to each MCP server and list its tools");
    mcpCommand->require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    zesbe::log::setLevel(verbose ? zesbe::log::Level::Debug : zesbe::log::Level::Warning);

    auto sources = zesbe::defaultConfigSources();
    if (!configPath.empty())
        sources.userFile = configPath;

    auto overrides = zesbe::ConfigOverrides {};
    if (*providerOption)
        overrides.provider = provider;
    if (*modelOption)
        overrides.model = model;
    if (*baseUrlOption)
        overrides.baseUrl = baseUrl;
    if (*maxTokensOption)
        overrides.maxTokens = maxTokens;
    if (*temperatureOption)
        overrides.temperature = temperature;
    overrides.disableTools = noTools;

    auto configResult = zesbe::loadConfig(sources, overrides);
    if (!configResult)
    {
        zesbe::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (!verbose)
    {
        if (auto const level = zesbe::log::levelFromString(config.logLevel))
            zesbe::log::setLevel(*level);
        else
            zesbe::log::warning("Unknown log level '{}' in config, using 'warning'", config.logLevel);
    }

    if (*providersCommand)
        return printProviders(config.provider.name);
    if (*configCommand)
        return printConfig(config);
    if (*mcpListCommand)
        return listMcpServers(config);

    if (config.provider.apiKey.empty() && config.provider.name != "ollama")
        zesbe::log::warning("No API key found for '{}'; set {}",
                            config.provider.name,
                            zesbe::apiKeyVariable(config.provider.name));

    auto options = zesbe::ConsoleOptions {};
    options.configPath = sources.userFile;
    options.sources = sources;

    auto console = zesbe::Console(std::move(config), std::move(options));
    auto initResult = console.initialize();
    if (!initResult)
    {
        zesbe::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return console.run();
}
