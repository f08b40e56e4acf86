/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "app/demo_scenario.hpp"
#include "log/logger.hpp"
#include "storage/storage_factory.hpp"

namespace {
  using filetx::app::Configuration;
  using filetx::log::LoggingSystem;

  int run_demo(qtils::SharedRef<LoggingSystem> logsys,
               qtils::SharedRef<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", filetx::log::defaultGroupName);
    SL_INFO(logger, "filetx demo started. Version: {} ", appcfg->version());

    auto storage_res = filetx::storage::makeStorage(logsys, appcfg);
    if (storage_res.has_error()) {
      SL_CRITICAL(
          logger, "Can't open storage: {}", storage_res.error().message());
      return EXIT_FAILURE;
    }

    filetx::app::DemoScenario scenario(logsys, storage_res.value());
    if (auto res = scenario.run(); res.has_error()) {
      SL_CRITICAL(logger, "Scenario failed: {}", res.error().message());
      return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("filetx-demo");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  auto app_configurator =
      std::make_unique<filetx::app::Configurator>(argc, argv, env);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<LoggingSystem>(std::move(logging_system));
  });

  if (auto res =
          logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::println(std::cerr, "Bad logging filter: {}", res.error().message());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "application");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error.message());
      fmt::println(std::cerr, "Failed to calculate config: {}", error.message());
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  auto exit_code = run_demo(logging_system, app_configuration);

  auto logger =
      logging_system->getLogger("Main", filetx::log::defaultGroupName);
  SL_INFO(logger, "Demo finished with exit code {}", exit_code);
  logger->flush();

  return exit_code;
}
