/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2000-2011 Free Software Foundation Europe e.V.
   Copyright (C) 2013-2026 Bareos GmbH & Co. KG

   This program is Free Software; you can redistribute it and/or
   modify it under the terms of version three of the GNU Affero General Public
   License as published by the Free Software Foundation and included
   in the file LICENSE.

   This program is distributed in the hope that it will be useful, but
   WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
   Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program; if not, write to the Free Software
   Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
   02110-1301, USA.
*/
// Kern Sibbald, 2000
/**
 * @file
 * Message routing for the metakeep library and tools
 */

#ifndef METAKEEP_LIB_MESSAGE_H_
#define METAKEEP_LIB_MESSAGE_H_

#include "include/messages.h"
#include "lib/source_location.h"

#include <functional>
#include <string>
#include <utility>
#include <fmt/format.h>

extern int debug_level;
extern bool dbg_timestamp; /* print timestamp in debug output */
extern int verbose;
extern char my_name[];

const char* get_basename(const char* pathname);
void MyNameIs(int argc, char* argv[], const char* name);

/*
 * Error and warning messages (Emsg) are handed to the registered callback.
 * Without a callback they are written to stderr.
 */
using MessageCallback = std::function<void(int type, const char* msg)>;
void RegisterMessageCallback(MessageCallback c);

/* wrap an integer with its source location for logging */
struct LevelAndLocation {
  int level;
  libmetakeep::source_location loc;

  constexpr LevelAndLocation(int t_level,
                             const libmetakeep::source_location& t_loc
                             = libmetakeep::source_location::current())
      : level(t_level), loc(t_loc)
  {
  }
};

/* emit a fmt-formatted debug message */
template <typename... Args>
void Dfmt(LevelAndLocation lal,
          fmt::format_string<Args...> fmt,
          Args&&... args)
{
  if (lal.level > debug_level) { return; }
  const auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
  d_msg(lal.loc.file_name(), lal.loc.line(), lal.level, "%s\n",
        formatted.c_str());
}

#endif  // METAKEEP_LIB_MESSAGE_H_
