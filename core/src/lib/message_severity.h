/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2000-2011 Free Software Foundation Europe e.V.
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

#ifndef METAKEEP_LIB_MESSAGE_SEVERITY_H_
#define METAKEEP_LIB_MESSAGE_SEVERITY_H_

#undef M_DEBUG
#undef M_ABORT
#undef M_FATAL
#undef M_ERROR
#undef M_WARNING
#undef M_INFO
#undef M_ERROR_TERM

/**
 * M_ABORT       immediately abort. Only for really serious errors.
 * M_ERROR_TERM  immediately terminate the program without a dump.
 * M_DEBUG       Debug Messages
 * M_FATAL       A fatal error for the current operation.
 * M_ERROR       An error, the operation continues.
 * M_WARNING     Warning message.
 * M_INFO        Information message.
 */
enum
{
  // Keep M_ABORT=1
  M_ABORT = 1,
  M_DEBUG,
  M_FATAL,
  M_ERROR,
  M_WARNING,
  M_INFO,
  M_ERROR_TERM,
};

#define M_MAX M_ERROR_TERM /* keep this updated ! */

#endif  // METAKEEP_LIB_MESSAGE_SEVERITY_H_
