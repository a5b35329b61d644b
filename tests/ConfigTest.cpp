#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "server/Config.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tablescope::server;

namespace {

// argv modifiable construit à partir de chaînes
class Args {
public:
    Args(std::initializer_list<std::string> args) : m_storage(args) {
        for (auto& arg : m_storage) {
            m_argv.push_back(arg.data());
        }
    }

    int argc() { return static_cast<int>(m_argv.size()); }
    char** argv() { return m_argv.data(); }

private:
    std::vector<std::string> m_storage;
    std::vector<char*> m_argv;
};

std::string writeConfig(const std::string& content) {
    std::string path = "/tmp/tablescope_config_" + std::to_string(std::rand()) + ".conf";
    std::ofstream file(path);
    file << content;
    return path;
}

} // namespace

TEST_CASE("Config defaults", "[Config]") {
    Args args{"tablescope_server"};

    auto config = parseCommandLine(args.argc(), args.argv());

    REQUIRE(config.address == "0.0.0.0");
    REQUIRE(config.port == 8080);
    REQUIRE(config.logLevel == LogLevel::INFO);
    REQUIRE(config.enableProfiler);
    REQUIRE(config.defaultMode == ops::ExecutionMode::Lazy);
    REQUIRE(config.checkpointInterval == 10);
    REQUIRE(config.maxDatasets == 10);
    REQUIRE(config.pageSize == 100);
    REQUIRE(config.datasets.empty());
    REQUIRE_FALSE(config.showHelp);
}

TEST_CASE("Config command line options", "[Config]") {
    Args args{"tablescope_server", "-p", "9000", "--mode", "eager", "-d", "a.csv", "--dataset", "b.csv",
              "--no-profiler", "-l", "debug", "--checkpoint-interval", "0", "-w", "4"};

    auto config = parseCommandLine(args.argc(), args.argv());

    REQUIRE(config.port == 9000);
    REQUIRE(config.defaultMode == ops::ExecutionMode::Eager);
    REQUIRE(config.datasets == std::vector<std::string>{"a.csv", "b.csv"});
    REQUIRE_FALSE(config.enableProfiler);
    REQUIRE(config.logLevel == LogLevel::DEBUG);
    REQUIRE(config.checkpointInterval == 0);
    REQUIRE(config.workerThreads == 4);
}

TEST_CASE("Config command line errors", "[Config]") {
    SECTION("unknown option") {
        Args args{"tablescope_server", "--verbose"};
        REQUIRE_THROWS_AS(parseCommandLine(args.argc(), args.argv()), std::invalid_argument);
    }

    SECTION("missing value") {
        Args args{"tablescope_server", "--port"};
        REQUIRE_THROWS_AS(parseCommandLine(args.argc(), args.argv()), std::invalid_argument);
    }

    SECTION("invalid values") {
        Args port{"tablescope_server", "-p", "70000"};
        Args workers{"tablescope_server", "-w", "0"};
        Args mode{"tablescope_server", "-m", "auto"};
        REQUIRE_THROWS_AS(parseCommandLine(port.argc(), port.argv()), std::invalid_argument);
        REQUIRE_THROWS_AS(parseCommandLine(workers.argc(), workers.argv()), std::invalid_argument);
        REQUIRE_THROWS_AS(parseCommandLine(mode.argc(), mode.argv()), std::invalid_argument);
    }
}

TEST_CASE("Config file is overridden by explicit options", "[Config]") {
    std::string path = writeConfig(
        "# TableScope\n"
        "port = 7000\n"
        "default_mode=eager\n"
        "\n"
        "max_datasets = 4\n"
        "dataset = /data/titanic.csv\n");

    Args args{"tablescope_server", "-p", "7100", "--config", "@" + path};

    auto config = parseCommandLine(args.argc(), args.argv());

    REQUIRE(config.port == 7100);
    REQUIRE(config.defaultMode == ops::ExecutionMode::Eager);
    REQUIRE(config.maxDatasets == 4);
    REQUIRE(config.datasets == std::vector<std::string>{"/data/titanic.csv"});

    std::filesystem::remove(path);
}

TEST_CASE("Config file errors", "[Config]") {
    AppConfig config;

    REQUIRE_THROWS_AS(loadConfigFile(config, "/tmp/tablescope_missing.conf"), std::runtime_error);

    std::string path = writeConfig("port 8080\n");
    REQUIRE_THROWS_AS(loadConfigFile(config, path), std::invalid_argument);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(applyConfigValue(config, "colour", "blue"), std::invalid_argument);
    REQUIRE_THROWS_AS(applyConfigValue(config, "profiler", "maybe"), std::invalid_argument);
    REQUIRE_THROWS_AS(applyConfigValue(config, "page_size", "-5"), std::invalid_argument);
}

TEST_CASE("Config help flag and usage", "[Config]") {
    Args args{"tablescope_server", "--help"};

    auto config = parseCommandLine(args.argc(), args.argv());
    std::ostringstream usage;
    printUsage(usage, "tablescope_server");

    REQUIRE(config.showHelp);
    REQUIRE_THAT(usage.str(), Catch::Matchers::ContainsSubstring("--checkpoint-interval"));
}
