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

#include "DaemonOptions.hpp"

bool parseCommandLine( const std::vector< std::string > &arguments, DaemonOptions &options, std::string &error )
{
  for ( size_t i = 0; i < arguments.size(); ++i )
  {
    const std::string &arg = arguments[ i ];

    if ( arg == "--version" or arg == "-v" )
    {
      options.action = DaemonOptions::Action::ShowVersion;
      return true;
    }

    if ( arg == "--help" or arg == "-h" )
    {
      options.action = DaemonOptions::Action::ShowHelp;
      return true;
    }

    if ( arg == "--debug" )
    {
      options.debug = true;
    }
    else if ( arg == "--start" )
    {
      // default action, does not override --stop
    }
    else if ( arg == "--stop" )
    {
      options.action = DaemonOptions::Action::Stop;
    }
    else if ( arg == "--config-dir" )
    {
      if ( i + 1 >= arguments.size() or arguments[ i + 1 ].empty() )
      {
        error = "--config-dir requires a directory";
        return false;
      }
      options.configDir = arguments[ ++i ];
    }
    else
    {
      error = "Unknown option: " + arg;
      return false;
    }
  }

  return true;
}
