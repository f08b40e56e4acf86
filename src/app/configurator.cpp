/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(filetx::app, Configurator::Error, e) {
  using E = filetx::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown Configurator::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    BOOST_ASSERT(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  // Reads optional scalar `name` of YAML map `section`
  std::optional<std::string> scalar_value(const YAML::Node &section,
                                          std::string_view section_name,
                                          const char *name,
                                          std::ostringstream &errors,
                                          bool &has_error) {
    auto node = section[name];
    if (not node.IsDefined()) {
      return std::nullopt;
    }
    if (not node.IsScalar()) {
      errors << "E: Value '" << section_name << "." << name
             << "' must be scalar\n";
      has_error = true;
      return std::nullopt;
    }
    auto value = node.as<std::string>();
    boost::trim(value);
    return value;
  }

}  // namespace

namespace filetx::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();

    config_->storage_.backend = Configuration::Backend::Memory;
    config_->storage_.directory = "storage";
    config_->storage_.cache_size = 64 << 20;  // 64MiB

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -luow=trace.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("backend", po::value<std::string>(), "Storage backend: memory, filesystem or rocksdb. Default: memory.")
        ("storage-path", po::value<std::string>()->default_value(config_->storage_.directory.native()), "Path to storage directory. Can be relative on base path.")
        ("cache-size", po::value<std::string>(), "Limit the memory the RocksDB cache can use (e.g. 4096, 512Mb, 1G).")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(storage_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "filetx_demo version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "filetx_demo version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      config_file_path_ = path;
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: filetx
        children:
          - name: application
          - name: storage
          - name: uow
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initStorageConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    SL_ERROR(logger_,
             "Config file `{}` has some problems:",
             config_file_path_.value_or("").native());
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto value = scalar_value(section,
                                        "general",
                                        "base-path",
                                        file_errors_,
                                        file_has_error_)) {
            config_->base_path_ = *value;
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });

    // Check values
    if (config_->base_path_.empty()) {
      config_->base_path_ = std::filesystem::current_path();
    }
    config_->base_path_ = std::filesystem::absolute(config_->base_path_);
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initStorageConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["storage"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto value = scalar_value(
                  section, "storage", "backend", file_errors_, file_has_error_)) {
            if (auto backend = backendFromString(*value)) {
              config_->storage_.backend = *backend;
            } else {
              file_errors_ << "E: Bad 'storage.backend' value; "
                              "Expected: memory, filesystem or rocksdb\n";
              file_has_error_ = true;
            }
          }
          if (auto value = scalar_value(
                  section, "storage", "path", file_errors_, file_has_error_)) {
            config_->storage_.directory = *value;
          }
          if (auto value = scalar_value(section,
                                        "storage",
                                        "cache_size",
                                        file_errors_,
                                        file_has_error_)) {
            if (auto size = util::parseByteQuantity(*value)) {
              config_->storage_.cache_size = *size;
            } else {
              file_errors_ << "E: Bad 'storage.cache_size' value; "
                              "Expected: 4096, 512Mb, 1G, etc.\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'storage' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    find_argument<std::string>(
        cli_values_map_, "backend", [&](const std::string &value) {
          if (auto backend = backendFromString(value)) {
            config_->storage_.backend = *backend;
          } else {
            std::cerr << "Option --backend has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    find_argument<std::string>(
        cli_values_map_, "storage-path", [&](const std::string &value) {
          config_->storage_.directory = value;
        });
    find_argument<std::string>(
        cli_values_map_, "cache-size", [&](const std::string &value) {
          if (auto size = util::parseByteQuantity(value)) {
            config_->storage_.cache_size = *size;
          } else {
            std::cerr << "Option --cache-size has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(path.is_absolute()
                                  ? path
                                  : (config_->base_path_ / path));
    };

    config_->storage_.directory = make_absolute(config_->storage_.directory);

    if (config_->storage_.backend != Configuration::Backend::Memory
        and exists(config_->storage_.directory)
        and not is_directory(config_->storage_.directory)) {
      SL_ERROR(logger_,
               "The 'storage.path' exists but is not a directory: {}",
               config_->storage_.directory.c_str());
      return Error::InvalidValue;
    }

    return outcome::success();
  }

}  // namespace filetx::app
