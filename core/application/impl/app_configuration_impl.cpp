/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <iostream>

#include <boost/program_options.hpp>

#include "codec/alphabet.hpp"

namespace {
  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<bool>();
      }
    }
    return false;
  }

  const int def_address_version = 0;
  const std::string def_alphabet{base58check::codec::kBitcoinAlphabet};
}  // namespace

namespace base58check::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)),
        alphabet_(def_alphabet),
        address_version_(def_address_version) {}

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lcodec=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to YAML file with logging configuration")
        ;

    po::options_description codec_desc("Codec options");
    codec_desc.add_options()
        ("alphabet,a", po::value<std::string>(), "58 symbols to encode with instead of the Bitcoin alphabet")
        ("ripple", po::bool_switch(), "use the Ripple alphabet")
        ("address-version,v", po::value<int>()->default_value(def_address_version),
          "version byte of the address made by check-encode, 0..255")
        ("text,t", po::bool_switch(), "input of encode, encode-int and check-encode is text, not hex")
        ;

    po::options_description positional_desc;
    positional_desc.add_options()
        ("command", po::value<std::string>(), "encode | encode-int | decode | check-encode | check-decode | check-valid")
        ("input", po::value<std::string>(), "bytes to encode (hex by default) or string to decode")
        ;
    // clang-format on

    po::positional_options_description positional;
    positional.add("command", 1).add("input", 1);

    desc.add(codec_desc);

    po::options_description all_desc;
    all_desc.add(desc).add(positional_desc);

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(all_desc)
                    .positional(positional)
                    .run(),
                vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << "Usage: base58check <command> [options] <input>\n"
                   "Available commands: encode encode-int decode check-encode "
                   "check-decode check-valid\n";
      std::cout << desc << std::endl;
      help_requested_ = true;
      return false;
    }

    auto command_name = find_argument<std::string>(vm, "command");
    if (not command_name.has_value()) {
      SL_ERROR(logger_, "Command is not specified");
      return false;
    }
    auto command = commandFromString(command_name.value());
    if (not command.has_value()) {
      SL_ERROR(logger_, "Unknown command '{}'", command_name.value());
      return false;
    }
    command_ = command.value();

    auto input = find_argument<std::string>(vm, "input");
    if (not input.has_value()) {
      SL_ERROR(logger_, "Input of '{}' is not specified", command_name.value());
      return false;
    }
    input_ = std::move(input.value());

    auto alphabet = find_argument<std::string>(vm, "alphabet");
    bool ripple = find_argument(vm, "ripple");
    if (alphabet.has_value() and ripple) {
      SL_ERROR(logger_,
               "Options --alphabet and --ripple are mutually exclusive");
      return false;
    }
    if (alphabet.has_value()) {
      alphabet_ = std::move(alphabet.value());
    } else if (ripple) {
      alphabet_ = codec::kRippleAlphabet;
    }

    address_version_ = vm["address-version"].as<int>();

    input_format_ =
        find_argument(vm, "text") ? InputFormat::Text : InputFormat::Hex;

    if (auto log = find_argument<std::vector<std::string>>(vm, "log")) {
      logger_tuning_config_ = std::move(log.value());
    }

    return true;
  }

}  // namespace base58check::application
