/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2000-2012 Free Software Foundation Europe e.V.
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
/**
 * @file
 * main header file to include in all metakeep sources
 */

#ifndef METAKEEP_INCLUDE_METAKEEP_H_
#define METAKEEP_INCLUDE_METAKEEP_H_

#include "include/config.h"

#if defined(HAVE_AIX_OS)
#  define _LINUX_SOURCE_COMPAT 1
#endif

#define _REENTRANT 1
#define _THREAD_SAFE 1
#define _POSIX_PTHREAD_SEMANTICS 1

/* System includes */
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/types.h>
#include <sys/stat.h>

#if defined(HAVE_MSVC)
#  define NOMINMAX  // suppress definition of min() and max() macros on windows
#endif

#if defined(HAVE_WIN32)
#  include <windows.h>
#else
#  include <unistd.h>
#endif

#if defined(HAVE_WIN32)
//   Windows
#  define PathSeparator '\\'

inline bool IsPathSeparator(int ch) { return ch == '/' || ch == '\\'; }
#else
//   Unix/Linux
#  define PathSeparator '/'

inline bool IsPathSeparator(int ch) { return ch == '/'; }
#endif

// Local metakeep includes. Be sure to put all the system includes before
// these.
#include "include/messages.h"
#include "lib/bsys.h"

#endif  // METAKEEP_INCLUDE_METAKEEP_H_
