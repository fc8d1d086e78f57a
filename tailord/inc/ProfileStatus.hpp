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

/**
 * @brief Outcome of a profile store or coordinator operation
 */
enum class ProfileStatus
{
  Ok,
  NotFound,         // referenced name is absent from the store
  Conflict,         // rename target already exists
  InvalidArgument,  // empty name, malformed payload, out of range value
  IoError           // persisting to disk or applying to hardware failed
};

inline const char *profileStatusToString( ProfileStatus status ) noexcept
{
  switch ( status )
  {
    case ProfileStatus::Ok:
      return "ok";
    case ProfileStatus::NotFound:
      return "not found";
    case ProfileStatus::Conflict:
      return "conflict";
    case ProfileStatus::InvalidArgument:
      return "invalid argument";
    case ProfileStatus::IoError:
      return "i/o error";
  }

  return "unknown";
}
