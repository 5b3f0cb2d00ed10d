/* Cirrus: Snapshot Backups for Self-Hosted Document Stacks
 * Copyright (C) 2026 The Cirrus Developers
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

/* Header file with common definitions needed for cirrus. */

#ifndef _CIRRUS_CIRRUS_H
#define _CIRRUS_CIRRUS_H

/* All Boost includes are grouped here, so we can more easily switch to other
 * implementations in the future. */
#include <boost/scoped_ptr.hpp>

using boost::scoped_ptr;

/* Version information.  This will be filled in by the build system. */
#ifndef CIRRUS_VERSION
#define CIRRUS_VERSION Unknown
#endif
#define CIRRUS_STRINGIFY(s) CIRRUS_STRINGIFY2(s)
#define CIRRUS_STRINGIFY2(s) #s

/* Whether verbose output is enabled. */
extern bool verbose;

#endif // _CIRRUS_CIRRUS_H
