#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <catch2/catch_test_macros.hpp>

#include <hastat/config/config_helpers.h>

using namespace hastat;

namespace {
struct ConfigFileFixture {
    ConfigFileFixture() {
        const char* t = std::getenv("HASTAT_TEST_TMPDIR");
        auto base = (t && *t) ? std::filesystem::path(t) : std::filesystem::temp_directory_path();
        std::error_code ec;
        std::filesystem::create_directories(base, ec);
        auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
        path = base / ("config_catch2_test_" + std::to_string(ts) + ".toml");
    }

    ~ConfigFileFixture() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(path, std::ios::trunc);
        out << text;
    }

    std::filesystem::path path;
};
} // namespace

TEST_CASE("Config: string helpers", "[unit][config]") {
    CHECK(config::trimmed("  a b \t") == "a b");
    CHECK(config::unquote("\"quoted\"") == "quoted");
    CHECK(config::unquote("'single'") == "single");
    CHECK(config::unquote("\"unbalanced") == "\"unbalanced");
}

TEST_CASE("Config: parse_simple_toml flattens sections", "[unit][config]") {
    ConfigFileFixture fix;
    fix.write(R"(# hastat configuration
[database]
url = "sqlite:////config/home-assistant_v2.db"  # recorder

[logging]
level = debug # inline comment

[import]
transaction_scope = 'table'
)");

    auto values = config::parse_simple_toml(fix.path);
    CHECK(values["database.url"] == "sqlite:////config/home-assistant_v2.db");
    CHECK(values["logging.level"] == "debug");
    CHECK(values["import.transaction_scope"] == "table");
    CHECK(values.size() == 3);

    CHECK(config::parse_config_value(fix.path, "logging", "level") == "debug");
    CHECK(config::parse_config_value(fix.path, "logging", "missing").empty());
}

TEST_CASE("Config: missing file yields no values", "[unit][config]") {
    ConfigFileFixture fix;
    CHECK(config::parse_simple_toml(fix.path).empty());
}

TEST_CASE("Config: explicit path wins", "[unit][config]") {
    CHECK(config::get_config_path("/etc/hastat.toml") == std::filesystem::path("/etc/hastat.toml"));
}
