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
/**
 * @file
 * File options for metadata capture and restore.
 */

#ifndef METAKEEP_INCLUDE_FILEOPTS_H_
#define METAKEEP_INCLUDE_FILEOPTS_H_

#include "lib/bits.h"

/**
 * Options saved in "flags" of MetadataOptions
 * Note, if you add to this list, make sure FO_MAX is the last one.
 */
enum
{
  FO_XATTR = 0,           /**< Capture and restore extended attributes */
  FO_GENERIC = 1,         /**< Capture and restore generic attributes */
  FO_SECURITY_DESCRIPTOR = 2, /**< Include the security descriptor */
  FO_MAX
};

#define FOPTS_BYTES NbytesForBits(FO_MAX)

/* Everything enabled by default */
struct MetadataOptions {
  char flags[FOPTS_BYTES]{};

  MetadataOptions()
  {
    SetBit(FO_XATTR, flags);
    SetBit(FO_GENERIC, flags);
    SetBit(FO_SECURITY_DESCRIPTOR, flags);
  }

  bool IsSet(int option) const { return BitIsSet(option, flags); }
};

#endif  // METAKEEP_INCLUDE_FILEOPTS_H_
