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
#include <optional>
#include <sys/types.h>

/**
 * @brief Single-instance bookkeeping through a PID file
 */
class PidFile
{
public:
  static constexpr const char *DEFAULT_PATH = "/run/tailord.pid";

  explicit PidFile( std::filesystem::path path = DEFAULT_PATH );

  /**
   * @return PID stored in the file, nullopt if it is missing or malformed
   */
  [[nodiscard]] std::optional< pid_t > readPid() const;

  /**
   * @return PID of the live process that wrote the file, nullopt if the
   *         file is missing or stale
   */
  [[nodiscard]] std::optional< pid_t > runningOwner() const;

  bool write( pid_t pid );

  /// Remove the file; a missing file is not an error.
  void remove() noexcept;

  [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

private:
  std::filesystem::path m_path;
};
