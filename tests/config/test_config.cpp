// tests/config/test_config.cpp
#define BOOST_TEST_MODULE ConfigTests
#include <boost/filesystem.hpp>  // for file operations
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <stdexcept>
#include <memory>

#include "wirebox/config/config.hpp"
#include "wirebox/di/container.hpp"
#include "wirebox/log/log_config.hpp"

namespace fs = boost::filesystem;

using wirebox::config::ConfigFormat;
using wirebox::config::ConfigManager;
using wirebox::di::ContainerConfig;
using wirebox::log::LogConfig;
using wirebox::log::LogLevel;

// Test fixture: create and cleanup temporary config files
struct ConfigFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / fs::unique_path("wirebox_test_%%%%-%%%%");

    ConfigFixture() {
        fs::create_directories(temp_dir);
        ConfigManager::instance().reset();
    }

    ~ConfigFixture() {
        ConfigManager::instance().reset();
        fs::remove_all(temp_dir);  // cleanup temporary directory
    }

    // Helper function: create temporary config file
    fs::path create_temp_file(const std::string& filename,
                              const std::string& content) {
        fs::path file_path = temp_dir / filename;
        std::ofstream ofs(file_path.string());
        ofs << content;
        ofs.close();
        return file_path;
    }
};

BOOST_FIXTURE_TEST_SUITE(ConfigTestSuite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_load_nested_yaml) {
    const std::string yaml_content = R"(
container:
  trace_resolution: true
  disabled_providers:
    - metrics
    - legacy
log:
  level: debug
)";

    fs::path config_path = create_temp_file("app.yaml", yaml_content);
    auto& config_manager = ConfigManager::instance();

    BOOST_CHECK_NO_THROW(
        config_manager.load_config(config_path.string(), ConfigFormat::YAML));

    const auto& config_tree = config_manager.get_config_tree();
    BOOST_CHECK_EQUAL(config_tree.get<bool>("container.trace_resolution"),
                      true);
    BOOST_CHECK_EQUAL(config_tree.get<std::string>("log.level"),
                      "debug");
}

BOOST_AUTO_TEST_CASE(test_container_config_from_yaml) {
    const std::string yaml_content = R"(
container:
  trace_resolution: true
  disabled_providers:
    - metrics
    - legacy
)";

    fs::path config_path = create_temp_file("container.yaml", yaml_content);
    auto& config_manager = ConfigManager::instance();

    auto container_config = std::make_shared<ContainerConfig>();
    config_manager.register_configuration_properties(container_config);
    config_manager.load_config(config_path.string(), ConfigFormat::YAML);

    BOOST_CHECK(container_config->trace_resolution);
    BOOST_REQUIRE_EQUAL(container_config->disabled_providers.size(), 2u);
    BOOST_CHECK_EQUAL(container_config->disabled_providers[0], "metrics");
    BOOST_CHECK_EQUAL(container_config->disabled_providers[1], "legacy");

    BOOST_CHECK_EQUAL(
        config_manager.get_configuration_properties<ContainerConfig>().get(),
        container_config.get());
    BOOST_CHECK_EQUAL(config_manager.get_config_by_name("container").get(),
                      container_config.get());

    wirebox::di::Container container(*container_config);
    BOOST_CHECK(container.config().trace_resolution);
}

BOOST_AUTO_TEST_CASE(test_container_config_from_json) {
    const std::string json_content = R"({
  "container": {
    "trace_resolution": false,
    "disabled_providers": ["cache"]
  }
})";

    fs::path config_path = create_temp_file("container.json", json_content);
    auto& config_manager = ConfigManager::instance();

    auto container_config = std::make_shared<ContainerConfig>();
    container_config->trace_resolution = true;
    config_manager.register_configuration_properties(container_config);
    config_manager.load_config(config_path.string(), ConfigFormat::JSON);

    BOOST_CHECK(!container_config->trace_resolution);
    BOOST_REQUIRE_EQUAL(container_config->disabled_providers.size(), 1u);
    BOOST_CHECK_EQUAL(container_config->disabled_providers[0], "cache");
}

BOOST_AUTO_TEST_CASE(test_ini_format) {
    const std::string ini_content = R"(
[container]
trace_resolution=true
)";

    fs::path config_path = create_temp_file("container.ini", ini_content);
    auto& config_manager = ConfigManager::instance();

    auto container_config = std::make_shared<ContainerConfig>();
    config_manager.register_configuration_properties(container_config);
    config_manager.load_config(config_path.string(), ConfigFormat::INI);

    BOOST_CHECK(container_config->trace_resolution);
    BOOST_CHECK(container_config->disabled_providers.empty());
}

BOOST_AUTO_TEST_CASE(test_missing_section_keeps_defaults) {
    const std::string yaml_content = R"(
other:
  value: 1
)";

    fs::path config_path = create_temp_file("other.yaml", yaml_content);
    auto& config_manager = ConfigManager::instance();

    auto container_config = std::make_shared<ContainerConfig>();
    config_manager.register_configuration_properties(container_config);

    BOOST_CHECK_NO_THROW(
        config_manager.load_config(config_path.string(), ConfigFormat::YAML));
    BOOST_CHECK(!container_config->trace_resolution);
    BOOST_CHECK(container_config->disabled_providers.empty());
}

BOOST_AUTO_TEST_CASE(test_invalid_container_config_rejected) {
    const std::string yaml_content = R"(
container:
  disabled_providers:
    - ""
)";

    fs::path config_path = create_temp_file("invalid.yaml", yaml_content);
    auto& config_manager = ConfigManager::instance();

    config_manager.register_configuration_properties(
        std::make_shared<ContainerConfig>());

    BOOST_CHECK_THROW(
        config_manager.load_config(config_path.string(), ConfigFormat::YAML),
        std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_invalid_file_path) {
    auto& config_manager = ConfigManager::instance();

    BOOST_CHECK_THROW(config_manager.load_config("non_existent_file.yaml",
                                                 ConfigFormat::YAML),
                      std::runtime_error);
    BOOST_CHECK_THROW(config_manager.load_config("non_existent_file.json",
                                                 ConfigFormat::JSON),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_config_manager_singleton) {
    auto& config1 = ConfigManager::instance();
    auto& config2 = ConfigManager::instance();

    BOOST_CHECK_EQUAL(&config1, &config2);
}

BOOST_AUTO_TEST_CASE(test_config_reset) {
    const std::string yaml_content = R"(
temp:
  data: should_be_reset
)";

    fs::path config_path = create_temp_file("reset_test.yaml", yaml_content);
    auto& config_manager = ConfigManager::instance();
    config_manager.register_configuration_properties(
        std::make_shared<ContainerConfig>());
    config_manager.load_config(config_path.string(), ConfigFormat::YAML);

    config_manager.reset();

    BOOST_CHECK(config_manager.get_config_tree().empty());
    BOOST_CHECK(!config_manager.get_configuration_properties<ContainerConfig>());
}

BOOST_AUTO_TEST_CASE(test_format_from_extension) {
    BOOST_CHECK(wirebox::config::format_from_path("app.yaml") ==
                ConfigFormat::YAML);
    BOOST_CHECK(wirebox::config::format_from_path("conf/app.YML") ==
                ConfigFormat::YAML);
    BOOST_CHECK(wirebox::config::format_from_path("app.json") ==
                ConfigFormat::JSON);
    BOOST_CHECK(wirebox::config::format_from_path("app.ini") ==
                ConfigFormat::INI);
    BOOST_CHECK_THROW(wirebox::config::format_from_path("app.toml"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(wirebox::config::format_from_path("Makefile"),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_load_detects_format) {
    fs::path config_path = create_temp_file(
        "detect.json", R"({"container": {"trace_resolution": true}})");
    auto& config_manager = ConfigManager::instance();

    auto container_config = std::make_shared<ContainerConfig>();
    config_manager.register_configuration_properties(container_config);
    config_manager.load_config(config_path.string());

    BOOST_CHECK(container_config->trace_resolution);
}

BOOST_AUTO_TEST_CASE(test_load_config_string) {
    auto& config_manager = ConfigManager::instance();

    auto container_config = std::make_shared<ContainerConfig>();
    config_manager.register_configuration_properties(container_config);
    config_manager.load_config_string(R"(
container:
  disabled_providers: [cache, metrics]
)",
                                      ConfigFormat::YAML);

    BOOST_REQUIRE_EQUAL(container_config->disabled_providers.size(), 2u);
    BOOST_CHECK_EQUAL(container_config->disabled_providers[1], "metrics");

    BOOST_CHECK_THROW(
        config_manager.load_config_string("{ not json", ConfigFormat::JSON),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_register_after_load_applies_tree) {
    auto& config_manager = ConfigManager::instance();
    config_manager.load_config_string(
        "[container]\ntrace_resolution=true\n", ConfigFormat::INI);

    auto container_config = std::make_shared<ContainerConfig>();
    config_manager.register_configuration_properties(container_config);

    BOOST_CHECK(container_config->trace_resolution);
}

// =====================================
// Log configuration
// =====================================

BOOST_AUTO_TEST_CASE(test_log_config_from_yaml) {
    const std::string yaml_content = R"(
log:
  level: warning
  console:
    enabled: false
    stderr: true
  file:
    enabled: true
    path: logs/test.log
    rotation_size: 2048
    max_files: 3
)";

    fs::path config_path = create_temp_file("log.yaml", yaml_content);
    auto& config_manager = ConfigManager::instance();

    auto log_config = std::make_shared<LogConfig>();
    config_manager.register_configuration_properties(log_config);
    config_manager.load_config(config_path.string(), ConfigFormat::YAML);

    BOOST_CHECK(log_config->level == LogLevel::WARN);
    BOOST_CHECK(!log_config->console.enabled);
    BOOST_CHECK(log_config->console.use_stderr);
    BOOST_CHECK(log_config->file.enabled);
    BOOST_CHECK_EQUAL(log_config->file.path, "logs/test.log");
    BOOST_CHECK_EQUAL(log_config->file.rotation_size, 2048u);
    BOOST_CHECK_EQUAL(log_config->file.max_files, 3);
    BOOST_CHECK(log_config->file.auto_flush);
}

BOOST_AUTO_TEST_CASE(test_log_level_names) {
    BOOST_CHECK(wirebox::log::parse_level("TRACE") == LogLevel::TRACE);
    BOOST_CHECK(wirebox::log::parse_level("warn") == LogLevel::WARN);
    BOOST_CHECK(wirebox::log::parse_level("Warning") == LogLevel::WARN);
    BOOST_CHECK(wirebox::log::parse_level("critical") == LogLevel::FATAL);
    BOOST_CHECK_EQUAL(std::string(wirebox::log::level_name(LogLevel::ERROR)),
                      "error");
    BOOST_CHECK_THROW(wirebox::log::parse_level("verbose"),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_invalid_log_level_rejected) {
    auto& config_manager = ConfigManager::instance();
    config_manager.register_configuration_properties(
        std::make_shared<LogConfig>());

    BOOST_CHECK_THROW(config_manager.load_config_string(
                          "log:\n  level: loud\n", ConfigFormat::YAML),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_log_config_validation) {
    LogConfig config;
    config.file.path = "";
    BOOST_CHECK_NO_THROW(config.validate());

    config.file.enabled = true;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config.file.path = "logs/wirebox.log";
    config.file.max_files = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config.file.max_files = 2;
    config.file.rotation_size = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
