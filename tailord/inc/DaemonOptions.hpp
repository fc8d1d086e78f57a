/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief What the tailord command line asks for
 */
struct DaemonOptions
{
  static constexpr const char *DEFAULT_CONFIG_DIR = "/etc/tailord";

  enum class Action
  {
    Run,
    Stop,
    ShowVersion,
    ShowHelp
  };

  Action action = Action::Run;
  bool debug = false;
  std::filesystem::path configDir = DEFAULT_CONFIG_DIR;
};

/**
 * @brief Parse the arguments following the program name
 *
 * --version and --help end parsing at the point they appear.
 *
 * @param error Receives a message for the user on failure
 * @return false on an unknown option or a missing option value
 */
bool parseCommandLine( const std::vector< std::string > &arguments, DaemonOptions &options, std::string &error );
