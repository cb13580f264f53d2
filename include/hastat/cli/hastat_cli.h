#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <CLI/CLI.hpp>
#include <hastat/cli/command.h>
#include <hastat/metadata/database.h>
#include <hastat/metadata/schema_catalog.h>

namespace hastat::cli {

inline constexpr const char* DEFAULT_DB_URL = "sqlite:///home-assistant_v2.db";

/**
 * Main CLI application class
 */
class HastatCLI {
public:
    HastatCLI();
    ~HastatCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Open the recorder database on first use and check its schema version
     *
     * The connection lives until the CLI is destroyed, so it is released on every exit path.
     */
    Result<metadata::Database*> ensureDatabase(
        metadata::ConnectionMode mode = metadata::ConnectionMode::ReadWrite);

    /**
     * Schema check of the open database (compatible/unknown before ensureDatabase)
     */
    const metadata::SchemaCheck& getSchemaCheck() const { return schemaCheck_; }

    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * Value of "section.key" in the config file, empty when unset
     */
    std::string getConfigValue(const std::string& key) const;

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and logging setup
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Apply URL precedence: explicit option, HA_DB_URL, config value, default
     */
    static std::string resolveDatabaseUrl(const std::string& optionUrl,
                                          const std::string& configUrl);

    static std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view level);

private:
    /**
     * Register all built-in commands
     */
    void registerBuiltinCommands();

    void loadConfig();

    /**
     * Precedence: env HASTAT_LOG_LEVEL > --verbose > config logging.level > warn
     */
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::unique_ptr<metadata::Database> database_;
    metadata::SchemaCheck schemaCheck_;

    // Configuration
    std::string configPath_;
    std::map<std::string, std::string> config_;
    std::string dbUrlOption_;
    std::string databaseUrl_;
    bool verbose_ = false;
    bool jsonOutput_ = false;

    ICommand* pendingCommand_ = nullptr;
};

} // namespace hastat::cli
