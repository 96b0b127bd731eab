/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2022-2026 Bareos GmbH & Co. KG

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
#ifndef METAKEEP_LIB_CLI_H_
#define METAKEEP_LIB_CLI_H_

#include "CLI/App.hpp"
#include "CLI/Config.hpp"
#include "CLI/Formatter.hpp"

#include "include/exit_codes.h"

#include <string>

void InitCLIApp(CLI::App& app, std::string description, int copyright_year = 0);
void AddDebugOptions(CLI::App& app);
void AddVerboseOption(CLI::App& app);

/* Parse the command line, print help or the error and exit on failure. */
#define ParseMetakeepApp(app, argc, argv)                         \
  do {                                                            \
    try {                                                         \
      (app).parse((argc), (argv));                                \
    } catch (const CLI::ParseError& e) {                          \
      int rc = (app).exit(e);                                     \
      exit(rc == 0 ? MKEXIT_SUCCESS : MKEXIT_CLI_PARSING_ERROR);  \
    }                                                             \
  } while (0)

#endif  // METAKEEP_LIB_CLI_H_
