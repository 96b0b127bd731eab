/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2000-2011 Free Software Foundation Europe e.V.
   Copyright (C) 2016-2026 Bareos GmbH & Co. KG

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
 * Kern Sibbald, MM
 */
/*
 * Some elementary bit manipulations
 * NOTE:  base 0
 */

#ifndef METAKEEP_LIB_BITS_H_
#define METAKEEP_LIB_BITS_H_

/*
 * Number of bytes to hold n bits
 */
#define NbytesForBits(n) ((((n)-1) >> 3) + 1)

/*
 * Test if bit is set
 */
#define BitIsSet(b, var) (((var)[(b) >> 3] & (1 << ((b)&0x7))) != 0)

/*
 * Set bit
 */
#define SetBit(b, var) ((var)[(b) >> 3] |= (1 << ((b)&0x7)))

/*
 * Clear bit
 */
#define ClearBit(b, var) ((var)[(b) >> 3] &= ~(1 << ((b)&0x7)))

#endif  // METAKEEP_LIB_BITS_H_
