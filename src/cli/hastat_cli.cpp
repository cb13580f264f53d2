#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <hastat/cli/command_registry.h>
#include <hastat/cli/hastat_cli.h>
#include <hastat/config/config_helpers.h>
#include <hastat/version.hpp>

namespace hastat::cli {

HastatCLI::HastatCLI() {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>(
        "Inspect, export and re-import Home Assistant recorder statistics", "hastat");
    app_->set_version_flag("--version", HASTAT_VERSION_LONG_STRING);
    app_->require_subcommand(1);

    app_->add_option("--db-url", dbUrlOption_,
                     "Recorder database URL (sqlite:///path or a path); overrides HA_DB_URL");
    app_->add_option("--config", configPath_, "Config file (default: ~/.config/hastat/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");

    registerBuiltinCommands();
}

HastatCLI::~HastatCLI() = default;

int HastatCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        loadConfig();
        applyLogLevel();
        databaseUrl_ = resolveDatabaseUrl(dbUrlOption_, getConfigValue("database.url"));
        spdlog::debug("Using database URL {}", databaseUrl_);

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                spdlog::debug("{} failed: {}", pendingCommand_->getName(),
                              errorToString(result.error().code));
                std::cerr << "Error: " << result.error().message << "\n";
                return 1;
            }
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

Result<metadata::Database*> HastatCLI::ensureDatabase(metadata::ConnectionMode mode) {
    if (database_) {
        return database_.get();
    }

    auto path = metadata::parseDatabaseUrl(databaseUrl_);
    if (!path) {
        return path.error();
    }

    auto db = std::make_unique<metadata::Database>();
    if (auto opened = db->open(path.value(), mode); !opened) {
        return Error{opened.error().code, "Database connection failed: " + opened.error().message};
    }

    auto version = metadata::SchemaCatalog::readSchemaVersion(*db);
    if (!version) {
        return version.error();
    }
    schemaCheck_ = metadata::SchemaCatalog::checkSchemaVersion(version.value());
    if (schemaCheck_.warning) {
        spdlog::warn("{}", *schemaCheck_.warning);
    }

    database_ = std::move(db);
    return database_.get();
}

std::string HastatCLI::getConfigValue(const std::string& key) const {
    auto it = config_.find(key);
    return it != config_.end() ? it->second : std::string{};
}

void HastatCLI::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

void HastatCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void HastatCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void HastatCLI::loadConfig() {
    auto path = config::get_config_path(configPath_);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (!configPath_.empty()) {
            spdlog::warn("Config file {} not found", path.string());
        }
        return;
    }
    config_ = config::parse_simple_toml(path);
    spdlog::debug("Loaded {} config values from {}", config_.size(), path.string());
}

void HastatCLI::applyLogLevel() {
    if (const char* envLvl = std::getenv("HASTAT_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLogLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (auto lvl = parseLogLevel(getConfigValue("logging.level"))) {
        spdlog::set_level(*lvl);
        return;
    }
    spdlog::set_level(spdlog::level::warn);
}

std::string HastatCLI::resolveDatabaseUrl(const std::string& optionUrl,
                                          const std::string& configUrl) {
    if (!optionUrl.empty())
        return optionUrl;
    if (const char* envUrl = std::getenv("HA_DB_URL"); envUrl && *envUrl)
        return envUrl;
    if (!configUrl.empty())
        return configUrl;
    return DEFAULT_DB_URL;
}

std::optional<spdlog::level::level_enum> HastatCLI::parseLogLevel(std::string_view level) {
    std::string v;
    v.reserve(level.size());
    for (char c : level)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace hastat::cli
