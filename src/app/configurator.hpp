/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <log/logger.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

namespace soralog {
  class Logger;
}  // namespace soralog

namespace filetx::app {
  class Configuration;
}  // namespace filetx::app

namespace filetx::app {

  /**
   * Builds Configuration from command line and optional YAML config file.
   * Values of the file are overridden by command line options.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed,
      ConfigFileParseFailed,
      InvalidValue,
    };

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv, const char **env);

    /**
     * Looks only for --help, --version and --config. Loads config file.
     * @return true if the program has nothing more to do
     */
    outcome::result<bool> step1();

    /// Parses all options, rejecting unknown ones
    outcome::result<bool> step2();

    /// `logging` section of config file, or built-in default
    outcome::result<YAML::Node> getLoggingConfig();

    /// Values of --log options, to tune the logging system with
    const std::vector<std::string> &getLoggingCliArgs() const {
      return logger_cli_args_;
    }

    /**
     * Merges built-in defaults, config file values and CLI options (in
     * increasing priority), then resolves and checks paths.
     */
    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initGeneralConfig();
    outcome::result<void> initStorageConfig();
    outcome::result<void> reportFileErrors();

    int argc_;
    const char **argv_;
    const char **env_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<std::filesystem::path> config_file_path_;
    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace filetx::app

OUTCOME_HPP_DECLARE_ERROR(filetx::app, Configurator::Error);
