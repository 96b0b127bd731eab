/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2000-2012 Free Software Foundation Europe e.V.
   Copyright (C) 2011-2012 Planets Communications B.V.
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
/*
 * BAREOS message handling routines
 *
 * Kern Sibbald, April 2000
 */

#include "include/metakeep.h"
#include "lib/message.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

int debug_level = 0;    /* debug level */
bool dbg_timestamp = false; /* print timestamp in debug output */
int verbose = 0;        /* increase User messages */
char my_name[128] = {0}; /* daemon name is stored here */

static MessageCallback message_callback;
static std::mutex output_mutex;

void RegisterMessageCallback(MessageCallback c)
{
  message_callback = std::move(c);
}

void MyNameIs(int argc, char* argv[], const char* name)
{
  const char* l = nullptr;

  if (name) {
    bstrncpy(my_name, name, sizeof(my_name));
  } else if (argc > 0 && argv && argv[0]) {
    // Use the executable name without any leading path
    l = argv[0];
    for (const char* p = argv[0]; *p; p++) {
      if (IsPathSeparator(*p)) { l = p + 1; }
    }
    bstrncpy(my_name, l, sizeof(my_name));
  }
  Dmsg1(500, "my_name=%s\n", my_name);
}

/*
 * Return the last two components of the path, e.g. "findlib/xattr.cc".
 */
const char* get_basename(const char* pathname)
{
  const char* basename = pathname + strlen(pathname);
  int separators = 0;

  while (basename > pathname) {
    if (IsPathSeparator(basename[-1]) && ++separators == 2) { break; }
    basename--;
  }
  return basename;
}

// Format a printf style argument list into a string, growing as needed.
static std::string FormatArgs(const char* fmt, va_list ap)
{
  std::string out(256, '\0');

  while (1) {
    va_list cp;
    va_copy(cp, ap);
    int len = vsnprintf(out.data(), out.size(), fmt, cp);
    va_end(cp);

    if (len < 0) {
      out.clear();
      break;
    }
    if (static_cast<size_t>(len) >= out.size()) {
      out.resize(len + 1);
      continue;
    }

    out.resize(len);
    break;
  }

  return out;
}

static void pt_out(const std::string& buf)
{
  std::lock_guard<std::mutex> lock(output_mutex);
  fputs(buf.c_str(), stdout);
  fflush(stdout);
}

static std::string TimestampPrefix()
{
  using namespace std::chrono;
  auto now = system_clock::now();
  auto usecs = duration_cast<microseconds>(now.time_since_epoch()).count()
               % 1000000;
  time_t ttime = system_clock::to_time_t(now);
  struct tm tm;
  char ed1[50];

#if defined(HAVE_WIN32)
  localtime_s(&tm, &ttime);
#else
  localtime_r(&ttime, &tm);
#endif
  strftime(ed1, sizeof(ed1), "%d-%b %H:%M:%S", &tm);

  std::string prefix;
  Mmsg(prefix, "%s.%06d ", ed1, static_cast<int>(usecs));
  return prefix;
}

/*
 * This subroutine prints a debug message if the level number is less than or
 * equal the debug_level. File and line numbers are included for more detail
 * if desired, but not currently printed.
 *
 * If the level is negative, the details of file and line number are not
 * printed.
 */
void d_msg(const char* file, int line, int level, const char* fmt, ...)
{
  va_list ap;
  bool details = true;
  std::string buf;

  if (level < 0) {
    details = false;
    level = -level;
  }

  if (level <= debug_level) {
    if (dbg_timestamp) { buf = TimestampPrefix(); }

    if (details) {
      std::string where;
      Mmsg(where, "%s (%d): %s:%d ", my_name, level, get_basename(file), line);
      buf += where;
    }

    va_start(ap, fmt);
    buf += FormatArgs(fmt, ap);
    va_end(ap);

    pt_out(buf);
  }
}

/*
 * This subroutine prints a message regardless of the debug level
 *
 * If the level is negative, the details of file and line number are not
 * printed.
 */
void p_msg(const char* file, int line, int level, const char* fmt, ...)
{
  va_list ap;
  std::string buf;

  if (level >= 0) {
    Mmsg(buf, "%s: %s:%d ", my_name, get_basename(file), line);
  }

  va_start(ap, fmt);
  buf += FormatArgs(fmt, ap);
  va_end(ap);

  pt_out(buf);
}

/*
 * Handle a message for this process. The message is shown as debug message
 * (level 10) and handed to the registered message callback, or written to
 * stderr when no callback is registered.
 */
void e_msg(const char* file,
           int line,
           int type,
           int level,
           const char* fmt,
           ...)
{
  va_list ap;
  std::string buf, more, typestr;

  switch (type) {
    case M_ABORT:
      typestr = "ABORT";
      Mmsg(buf, T_("%s: ABORTING due to ERROR in %s:%d\n"), my_name,
           get_basename(file), line);
      break;
    case M_ERROR_TERM:
      typestr = "ERROR TERMINATION";
      Mmsg(buf, T_("%s: ERROR TERMINATION at %s:%d\n"), my_name,
           get_basename(file), line);
      break;
    case M_FATAL:
      typestr = "FATAL ERROR";
      if (level == -1) /* skip details */
        Mmsg(buf, T_("%s: Fatal Error because: "), my_name);
      else
        Mmsg(buf, T_("%s: Fatal Error at %s:%d because:\n"), my_name,
             get_basename(file), line);
      break;
    case M_ERROR:
      typestr = "ERROR";
      if (level == -1) /* skip details */
        Mmsg(buf, T_("%s: ERROR: "), my_name);
      else
        Mmsg(buf, T_("%s: ERROR in %s:%d "), my_name, get_basename(file),
             line);
      break;
    case M_WARNING:
      typestr = "WARNING";
      Mmsg(buf, T_("%s: Warning: "), my_name);
      break;
    default:
      typestr = "INFO";
      Mmsg(buf, "%s: ", my_name);
      break;
  }

  va_start(ap, fmt);
  more = FormatArgs(fmt, ap);
  va_end(ap);

  // show error message also as debug message (level 10)
  d_msg(file, line, 10, "%s: %s", typestr.c_str(), more.c_str());

  buf += more;
  if (message_callback) {
    message_callback(type, buf.c_str());
  } else {
    std::lock_guard<std::mutex> lock(output_mutex);
    fputs(buf.c_str(), stderr);
    fflush(stderr);
  }

  if (type == M_ABORT) {
    abort();
  } else if (type == M_ERROR_TERM) {
    exit(1);
  }
}

// Edit a message into a string buffer, returns the edited length.
int Mmsg(std::string& msgbuf, const char* fmt, ...)
{
  va_list ap;

  va_start(ap, fmt);
  msgbuf = FormatArgs(fmt, ap);
  va_end(ap);

  return static_cast<int>(msgbuf.size());
}
