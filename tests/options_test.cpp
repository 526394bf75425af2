// Option layer headers
#include "manager/ManagerOptions.hpp"
#include "options/Options.hpp"
#include "sim/SimulatorOptions.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace spaman::test {

  using namespace std::chrono_literals;
  using shared_opts::Options;

  class OptionsTest : public ::testing::Test {
  protected:
    void TearDown() override {
      for (const auto& path : written_files) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
      }
    }

    Options::ParseResult parse(std::vector<std::string> args) {
      args.insert(args.begin(), "spaman");
      std::vector<char*> argv;
      for (auto& arg : args) {
        argv.push_back(arg.data());
      }
      error.clear();
      return Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), error);
    }

    std::string write_config(const std::string& name, const std::string& content) {
      auto path = std::filesystem::temp_directory_path() / ("spaman_options_test_" + name + ".json");
      std::ofstream out(path);
      out << content;
      written_files.push_back(path);
      return path.string();
    }

    std::string error;
    std::vector<std::filesystem::path> written_files;
  };

  TEST_F(OptionsTest, defaults_WithoutArguments) {
    ASSERT_EQ(parse({}), Options::ParseResult::Ok) << error;

    auto config = manager_opts::make_manager_config();
    EXPECT_EQ(config.client_uuid, "a0b1c2d3-spaman-cli");
    EXPECT_FALSE(config.spa_address.has_value());
    EXPECT_FALSE(config.spa_identifier.has_value());
    EXPECT_FALSE(config.spa_name.has_value());
    EXPECT_EQ(config.pump_interval, 0ms);
    EXPECT_EQ(config.error_backoff, 1000ms);
    EXPECT_EQ(manager_opts::get_log_level(), LogLevel::Info);
    EXPECT_FALSE(manager_opts::get_run_duration().has_value());
    EXPECT_FALSE(Options::get_config_file().has_value());

    auto network = sim::sim_opts::get_network_config();
    EXPECT_EQ(network.discovery_latency, 200ms);
    EXPECT_EQ(network.connect_latency, 100ms);
    EXPECT_EQ(network.ping_interval, 1000ms);
    EXPECT_FALSE(network.discovery_fails);
    EXPECT_TRUE(sim::sim_opts::get_spas().empty());
  }

  TEST_F(OptionsTest, commandLine_SetsHintsAndTiming) {
    ASSERT_EQ(parse({ "--client-uuid", "feed-beef", "--spa-address", "10.1.1.4", "--spa-identifier", "SPA42",
                      "--spa-name", "Garden", "--log-level", "debug", "--pump-interval-ms", "50",
                      "--error-backoff-ms", "250", "--run-seconds", "1.5" }),
              Options::ParseResult::Ok)
        << error;

    auto config = manager_opts::make_manager_config();
    EXPECT_EQ(config.client_uuid, "feed-beef");
    EXPECT_EQ(config.spa_address, std::optional<std::string>("10.1.1.4"));
    EXPECT_EQ(config.spa_identifier, std::optional<std::string>("SPA42"));
    EXPECT_EQ(config.spa_name, std::optional<std::string>("Garden"));
    EXPECT_EQ(config.pump_interval, 50ms);
    EXPECT_EQ(config.error_backoff, 250ms);
    EXPECT_EQ(manager_opts::get_log_level(), LogLevel::Debug);
    EXPECT_EQ(manager_opts::get_run_duration(), std::optional<std::chrono::milliseconds>(1500ms));
  }

  TEST_F(OptionsTest, jsonConfig_SuppliesDefaultsThatCommandLineOverrides) {
    const auto path = write_config("layered", R"({
      "spaman": { "client_uuid": "from-json", "spa_identifier": "JSONSPA", "spa_address": "",
                  "log_level": "warning", "error_backoff_ms": 20 },
      "simulator": { "ping_interval_ms": 5, "discovery_fails": true,
                     "spas": [ { "identifier": "S1", "name": "Deck", "address": "10.0.0.8", "outcome": "throws" } ] }
    })");

    ASSERT_EQ(parse({ "-c", path, "--spa-identifier", "CLISPA" }), Options::ParseResult::Ok) << error;

    auto config = manager_opts::make_manager_config();
    EXPECT_EQ(config.client_uuid, "from-json");
    EXPECT_EQ(config.spa_identifier, std::optional<std::string>("CLISPA"));
    EXPECT_FALSE(config.spa_address.has_value());
    EXPECT_EQ(config.error_backoff, 20ms);
    EXPECT_EQ(manager_opts::get_log_level(), LogLevel::Warning);
    ASSERT_TRUE(Options::get_config_file().has_value());
    EXPECT_EQ(Options::get_config_file()->filename(), std::filesystem::path(path).filename());

    auto network = sim::sim_opts::get_network_config();
    EXPECT_EQ(network.ping_interval, 5ms);
    EXPECT_TRUE(network.discovery_fails);

    auto spas = sim::sim_opts::get_spas();
    ASSERT_EQ(spas.size(), 1u);
    EXPECT_EQ(spas[0].descriptor.identifier, "S1");
    EXPECT_EQ(spas[0].descriptor.name, "Deck");
    EXPECT_EQ(spas[0].descriptor.address, "10.0.0.8");
    EXPECT_EQ(spas[0].descriptor.port, spa::kDefaultSpaPort);
    EXPECT_EQ(spas[0].outcome, sim::HandshakeOutcome::Throws);
  }

  TEST_F(OptionsTest, laterParse_ForgetsEarlierValues) {
    ASSERT_EQ(parse({ "--spa-identifier", "ONCE", "--sim-spa", "A:Alpha:10.0.0.2" }), Options::ParseResult::Ok);
    ASSERT_EQ(parse({}), Options::ParseResult::Ok);

    EXPECT_FALSE(manager_opts::get_spa_identifier().has_value());
    EXPECT_TRUE(sim::sim_opts::get_spas().empty());
  }

  TEST_F(OptionsTest, configFile_MissingOrMalformedIsError) {
    EXPECT_EQ(parse({ "--config", "/nonexistent/spaman.json" }), Options::ParseResult::Error);
    EXPECT_NE(error.find("cannot open config file"), std::string::npos);

    const auto broken = write_config("broken", "{ \"spaman\": ");
    EXPECT_EQ(parse({ "--config", broken }), Options::ParseResult::Error);
    EXPECT_NE(error.find("malformed config file"), std::string::npos);

    const auto array = write_config("array", "[1, 2, 3]");
    EXPECT_EQ(parse({ "--config", array }), Options::ParseResult::Error);

    const auto bad_outcome = write_config("bad_outcome",
                                          R"({ "simulator": { "spas": [ { "identifier": "S1", "outcome": "explode" } ] } })");
    EXPECT_EQ(parse({ "--config", bad_outcome }), Options::ParseResult::Error);
    EXPECT_NE(error.find("invalid value in config file"), std::string::npos);
  }

  TEST_F(OptionsTest, commandLine_RejectsInvalidValues) {
    EXPECT_EQ(parse({ "--log-level", "verbose" }), Options::ParseResult::Error);
    EXPECT_EQ(parse({ "--error-backoff-ms", "-5" }), Options::ParseResult::Error);
    EXPECT_EQ(parse({ "--no-such-option" }), Options::ParseResult::Error);
    EXPECT_EQ(parse({ "--sim-spa", "missing-address" }), Options::ParseResult::Error);
  }

  TEST_F(OptionsTest, simSpa_RepeatableDefinitionsAppendToJsonSpas) {
    const auto path = write_config("sim", R"({ "simulator": { "spas": [ { "identifier": "J1" } ] } })");
    ASSERT_EQ(parse({ "-c", path, "--sim-spa", "C1:Patio:10.0.0.3", "--sim-spa", "C2::10.0.0.4" }),
              Options::ParseResult::Ok)
        << error;

    auto spas = sim::sim_opts::get_spas();
    ASSERT_EQ(spas.size(), 3u);
    EXPECT_EQ(spas[0].descriptor.identifier, "J1");
    EXPECT_EQ(spas[0].descriptor.name, "J1");
    EXPECT_EQ(spas[0].descriptor.address, "127.0.0.1");
    EXPECT_EQ(spas[1].descriptor.name, "Patio");
    EXPECT_EQ(spas[2].descriptor.identifier, "C2");
    EXPECT_EQ(spas[2].descriptor.name, "C2");
    EXPECT_EQ(spas[2].descriptor.address, "10.0.0.4");
  }

  TEST(SpaSpecTest, parseSpaSpec_SplitsOnFirstTwoColons) {
    auto spa = sim::sim_opts::parse_spa_spec("SPA1:Hot Tub:fe80::1");
    EXPECT_EQ(spa.descriptor.identifier, "SPA1");
    EXPECT_EQ(spa.descriptor.name, "Hot Tub");
    EXPECT_EQ(spa.descriptor.address, "fe80::1");
    EXPECT_EQ(spa.outcome, sim::HandshakeOutcome::Ready);
    EXPECT_TRUE(spa.reachable);

    EXPECT_THROW(sim::sim_opts::parse_spa_spec("SPA1"), std::invalid_argument);
    EXPECT_THROW(sim::sim_opts::parse_spa_spec("SPA1:Name"), std::invalid_argument);
    EXPECT_THROW(sim::sim_opts::parse_spa_spec(":Name:10.0.0.1"), std::invalid_argument);
    EXPECT_THROW(sim::sim_opts::parse_spa_spec("SPA1:Name:"), std::invalid_argument);
  }

  TEST(SpaSpecTest, handshakeOutcome_ParsesKnownNames) {
    EXPECT_EQ(sim::parse_handshake_outcome("ready"), sim::HandshakeOutcome::Ready);
    EXPECT_EQ(sim::parse_handshake_outcome("retry_exceeded"), sim::HandshakeOutcome::RetryCountExceeded);
    EXPECT_EQ(sim::parse_handshake_outcome("throws"), sim::HandshakeOutcome::Throws);
    EXPECT_THROW(sim::parse_handshake_outcome("sometimes"), std::invalid_argument);
    EXPECT_EQ(sim::to_string(sim::HandshakeOutcome::RetryCountExceeded), "retry_exceeded");
  }

} // namespace spaman::test
