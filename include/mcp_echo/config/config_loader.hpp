#pragma once

#include <mcp_echo/config/app_config.hpp>
#include <mcp_echo/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_echo {

// Parse a YAML config file on top of DefaultConfig(transport).
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      TransportKind transport);

// Parse CLI arguments into an AppConfig. The socket variant requires exactly
// one positional argument (the socket path); the stdio variant accepts none.
Result<AppConfig, Error> LoadFromCli(TransportKind transport, int argc,
                                     const char* const* argv);

// Usage/help text for a variant, printed after CLI errors.
std::string CliUsage(TransportKind transport);

// Merge two configs: fields the CLI set take precedence over the YAML ones.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// CLI, then -c/--config YAML merged under it, then validation.
Result<AppConfig, Error> LoadConfig(TransportKind transport, int argc,
                                    const char* const* argv);

} // namespace mcp_echo
