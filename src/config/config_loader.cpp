#include <mcp_echo/config/config_loader.hpp>

#include <mcp_echo/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <limits>
#include <set>

namespace mcp_echo {

namespace {

constexpr std::size_t kMaxReadChunkSize = 1024 * 1024;
// poll() takes milliseconds as an int.
constexpr int kMaxIdleTimeoutSeconds = std::numeric_limits<int>::max() / 1000;

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config, std::nullopt};
}

const char* ProgramName(TransportKind transport) {
    return transport == TransportKind::Socket ? "mcp-echo-socket"
                                              : "mcp-echo-stdio";
}

// Build an EchoToolSpec from one entry of the YAML "tools" list.
Result<EchoToolSpec, Error> ParseYamlTool(const YAML::Node& node) {
    if (!node["name"]) {
        return Result<EchoToolSpec, Error>::Err(
            MakeConfigError("Tool entry missing 'name' field"));
    }

    EchoToolSpec spec;
    spec.name = node["name"].as<std::string>();
    spec.description = node["description"]
                           ? node["description"].as<std::string>()
                           : "Echo back the input " + spec.name;
    spec.argument = node["argument"] ? node["argument"].as<std::string>()
                                     : std::string("text");
    spec.argument_description =
        node["argument_description"]
            ? node["argument_description"].as<std::string>()
            : "Text to echo back";
    spec.prefix = node["prefix"] ? node["prefix"].as<std::string>()
                                 : std::string();
    return Result<EchoToolSpec, Error>::Ok(std::move(spec));
}

// -v / --verbose may repeat; the parser only counts.
void AddCommonArguments(argparse::ArgumentParser& program, int& verbosity) {
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v info, -vv debug)")
        .action([&verbosity](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn, error");
    program.add_argument("--log-file")
        .help("Also write JSON-lines logs to this file");
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);
}

void AddSocketArguments(argparse::ArgumentParser& program) {
    program.add_argument("socket_path")
        .help("Filesystem path of the Unix domain socket to listen on");
    program.add_argument("--framing")
        .help("Message framing: chunk (one message per write) or newline");
    program.add_argument("--chunk-size")
        .help("Bytes read per receive call (default: 1024)")
        .scan<'i', int>();
    program.add_argument("--idle-timeout")
        .help("Close connections idle for this many seconds (default: never)")
        .scan<'i', int>();
    program.add_argument("--max-connections")
        .help("Refuse connections beyond this many (default: unbounded)")
        .scan<'i', int>();
}

void BuildParser(argparse::ArgumentParser& program, TransportKind transport,
                 int& verbosity) {
    AddCommonArguments(program, verbosity);
    if (transport == TransportKind::Socket) {
        AddSocketArguments(program);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      TransportKind transport) {
    AppConfig config = DefaultConfig(transport);
    config.config_file = std::string(file_path);

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- Server --
        if (root["server"]) {
            const auto& server = root["server"];
            if (server["name"]) {
                config.server.name = server["name"].as<std::string>();
            }
            if (server["version"]) {
                config.server.version = server["version"].as<std::string>();
            }
            if (server["protocol_version"]) {
                config.server.protocol_version =
                    server["protocol_version"].as<std::string>();
            }
        }

        // -- Socket --
        if (root["socket"]) {
            const auto& socket = root["socket"];
            if (socket["path"]) {
                config.socket.path = socket["path"].as<std::string>();
            }
            if (socket["read_chunk_size"]) {
                config.socket.read_chunk_size =
                    socket["read_chunk_size"].as<std::size_t>();
            }
            if (socket["framing"]) {
                auto name = socket["framing"].as<std::string>();
                auto mode = ParseFramingMode(name);
                if (!mode) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Invalid framing: " + name));
                }
                config.socket.framing = *mode;
            }
            if (socket["idle_timeout_seconds"]) {
                config.socket.idle_timeout_seconds =
                    socket["idle_timeout_seconds"].as<int>();
            }
            if (socket["backlog"]) {
                config.socket.backlog = socket["backlog"].as<int>();
            }
            if (socket["max_connections"]) {
                config.socket.max_connections = socket["max_connections"].as<int>();
            }
        }

        // -- Tools --
        if (root["tools"]) {
            for (const auto& tool_node : root["tools"]) {
                auto tool = ParseYamlTool(tool_node);
                if (tool.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(tool).Error());
                }
                config.tools.push_back(std::move(tool).Value());
            }
        }

        // -- Logging --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            auto name = root["log_level"].as<std::string>();
            auto level = ParseLogLevel(name);
            if (!level) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid log_level: " + name));
            }
            config.log_level = *level;
        }
        if (root["color"]) {
            if (root["color"].as<bool>()) {
                config.force_color = true;
            } else {
                config.force_no_color = true;
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(TransportKind transport, int argc,
                                     const char* const* argv) {
    int verbosity = 0;
    argparse::ArgumentParser program(ProgramName(transport), kVersion,
                                     argparse::default_arguments::help);
    BuildParser(program, transport, verbosity);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config = DefaultConfig(transport);

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    config.log_level = LogLevelFromVerbosity(verbosity);
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --log-level: " + *val));
        }
        config.log_level = *level;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.force_color = program.get<bool>("--color");
    config.force_no_color = program.get<bool>("--no-color");

    if (transport == TransportKind::Socket) {
        config.socket.path = program.get<std::string>("socket_path");
        if (auto val = program.present("--framing")) {
            auto mode = ParseFramingMode(*val);
            if (!mode) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid --framing: " + *val +
                                    " (expected chunk or newline)"));
            }
            config.socket.framing = *mode;
        }
        if (auto val = program.present<int>("--chunk-size")) {
            if (*val <= 0) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("--chunk-size must be positive"));
            }
            config.socket.read_chunk_size = static_cast<std::size_t>(*val);
        }
        if (auto val = program.present<int>("--idle-timeout")) {
            config.socket.idle_timeout_seconds = *val;
        }
        if (auto val = program.present<int>("--max-connections")) {
            config.socket.max_connections = *val;
        }
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

std::string CliUsage(TransportKind transport) {
    int verbosity = 0;
    argparse::ArgumentParser program(ProgramName(transport), kVersion,
                                     argparse::default_arguments::help);
    BuildParser(program, transport, verbosity);
    return program.help().str();
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults = DefaultConfig(cli_overrides.transport);
    AppConfig merged = yaml_base;
    merged.transport = cli_overrides.transport;

    // Socket overrides
    if (!cli_overrides.socket.path.empty()) {
        merged.socket.path = cli_overrides.socket.path;
    }
    if (cli_overrides.socket.read_chunk_size != defaults.socket.read_chunk_size) {
        merged.socket.read_chunk_size = cli_overrides.socket.read_chunk_size;
    }
    if (cli_overrides.socket.framing != defaults.socket.framing) {
        merged.socket.framing = cli_overrides.socket.framing;
    }
    if (cli_overrides.socket.idle_timeout_seconds !=
        defaults.socket.idle_timeout_seconds) {
        merged.socket.idle_timeout_seconds = cli_overrides.socket.idle_timeout_seconds;
    }
    if (cli_overrides.socket.max_connections != defaults.socket.max_connections) {
        merged.socket.max_connections = cli_overrides.socket.max_connections;
    }

    // Logging
    if (cli_overrides.log_level != defaults.log_level) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.force_color) {
        merged.force_color = true;
        merged.force_no_color = false;
    }
    if (cli_overrides.force_no_color) {
        merged.force_no_color = true;
        merged.force_color = false;
    }
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: server.name"));
    }
    if (config.server.protocol_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: server.protocol_version"));
    }
    if (config.transport == TransportKind::Socket && config.socket.path.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: socket path"));
    }
    if (config.socket.read_chunk_size == 0 ||
        config.socket.read_chunk_size > kMaxReadChunkSize) {
        return Result<void, Error>::Err(MakeConfigError(
            "read_chunk_size must be between 1 and " +
            std::to_string(kMaxReadChunkSize) + ", got " +
            std::to_string(config.socket.read_chunk_size)));
    }
    if (config.socket.idle_timeout_seconds < 0 ||
        config.socket.idle_timeout_seconds > kMaxIdleTimeoutSeconds) {
        return Result<void, Error>::Err(MakeConfigError(
            "idle_timeout_seconds must be between 0 and " +
            std::to_string(kMaxIdleTimeoutSeconds) + ", got " +
            std::to_string(config.socket.idle_timeout_seconds)));
    }
    if (config.socket.backlog <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "backlog must be positive, got " +
            std::to_string(config.socket.backlog)));
    }
    if (config.socket.max_connections < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "max_connections must not be negative, got " +
            std::to_string(config.socket.max_connections)));
    }

    std::set<std::string> names;
    for (const auto& tool : config.tools) {
        if (tool.name.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Tool entry has an empty name"));
        }
        if (tool.argument.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Tool '" + tool.name + "' has an empty argument name"));
        }
        if (!names.insert(tool.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate tool name: " + tool.name));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(TransportKind transport, int argc,
                                    const char* const* argv) {
    return LoadFromCli(transport, argc, argv)
        .AndThen([transport](AppConfig cli) -> Result<AppConfig, Error> {
            if (!cli.config_file.has_value()) {
                return Result<AppConfig, Error>::Ok(std::move(cli));
            }
            auto yaml = LoadFromYaml(*cli.config_file, transport);
            if (yaml.IsErr()) {
                return yaml;
            }
            return Result<AppConfig, Error>::Ok(
                MergeConfigs(yaml.Value(), cli));
        })
        .AndThen([](AppConfig config) -> Result<AppConfig, Error> {
            auto valid = ValidateConfig(config);
            if (valid.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(valid).Error());
            }
            return Result<AppConfig, Error>::Ok(std::move(config));
        });
}

} // namespace mcp_echo
