/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpkit.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file argument_parser.hpp
 * @brief This file declares a CLI argument parser.
 */
#pragma once
#ifndef TFTPKIT_ARGUMENT_PARSER_HPP
#define TFTPKIT_ARGUMENT_PARSER_HPP
#include <span>
#include <string_view>
#include <vector>
/** @brief For internal tftpkit implementation details. */
namespace tftpkit::detail {
/** @brief A command line argument parser. */
struct argument_parser {
  /**
   * @brief Command-line arguments are parsed into options.
   * @details A flag followed by a value is one option. A value without a
   * flag is a positional argument and has an empty flag.
   */
  struct option {
    /** @brief option flag. */
    std::string_view flag;
    /** @brief option value. */
    std::string_view value;
  };
  /**
   * @brief Parse all command-line arguments.
   * @param args The command line arguments to parse, including argv[0].
   * @returns The options in command line order.
   */
  static auto parse(std::span<char const *const> args) -> std::vector<option>;
  /**
   * @brief Parse all command-line arguments.
   * @param argc The number of command-line arguments.
   * @param argv The command-line arguments.
   * @returns The options in command line order.
   */
  static auto parse(int argc, char const *const *argv) -> std::vector<option>
  {
    return parse({argv, static_cast<std::size_t>(argc)});
  }
};
} // namespace tftpkit::detail
#endif // TFTPKIT_ARGUMENT_PARSER_HPP
