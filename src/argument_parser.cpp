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
 * @file argument_parser.cpp
 * @brief This file implements a CLI argument parser.
 */
#include "tftpkit/detail/argument_parser.hpp"

#include <algorithm>
namespace tftpkit::detail {
/** @brief The option type. */
using option_type = argument_parser::option;

/** @brief Splits "--name=value" into its flag and value. */
static auto split_flag(std::string_view token) noexcept -> option_type
{
  if (!token.starts_with("--"))
    return {.flag = token};

  const auto delim = token.find('=');
  if (delim == std::string_view::npos)
    return {.flag = token};

  return {.flag = token.substr(0, delim), .value = token.substr(delim + 1)};
}

/** @brief A bare "-" or "--" never takes a value. */
static auto takes_value(const option_type &opt) noexcept -> bool
{
  return opt.value.empty() &&
         opt.flag.find_first_not_of('-') != std::string_view::npos;
}

auto argument_parser::parse(std::span<char const *const> args)
    -> std::vector<option>
{
  auto options = std::vector<option>();
  for (std::string_view token : args.subspan(std::min(args.size(), std::size_t{1})))
  {
    if (token.empty())
      continue;

    if (token.front() == '-')
      options.push_back(split_flag(token));
    else if (!options.empty() && takes_value(options.back()))
      options.back().value = token;
    else
      options.push_back({.value = token});
  }

  return options;
}
} // namespace tftpkit::detail
