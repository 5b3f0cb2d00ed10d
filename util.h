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

/* Utility functions for converting various datatypes to text format and back,
 * plus the small set of filesystem helpers shared by the rest of cirrus. */

#ifndef _CIRRUS_UTIL_H
#define _CIRRUS_UTIL_H

#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>

std::string uri_encode(const std::string &in);
std::string uri_decode(const std::string &in);
std::string encode_int(long long n, int base=10);

long long parse_int(const std::string &s);
void cloexec(int fd);

std::string string_printf(const char *fmt, ...)
    __attribute__((format(printf, 1, 2)));

/* Strip leading and trailing whitespace. */
std::string trim(const std::string &s);

void fatal(std::string msg) __attribute__((noreturn));

/* Generate a fresh UUID, used to name temporary staging directories. */
std::string generate_uuid();

/* Sleep for the given number of milliseconds, restarting if interrupted. */
void sleep_ms(long ms);

/* Base class for objects which should not have implicit copy constructors and
 * assignment operators. */
class noncopyable {
protected:
    noncopyable() { }
private:
    noncopyable(const noncopyable&);
    const noncopyable& operator=(const noncopyable&);
};

/* Date/time string formatting and parsing utility functions.  All data and
 * methods are static, so this class should not be instantiated. */
class TimeFormat {
public:
    // Abbreviated time format encoded in snapshot names.
    static const char FORMAT_FILENAME[];
    // A timestamp, in UTC, written out in an ISO 8601 format (compatible with
    // the SQLite datetime function).
    static const char FORMAT_ISO8601[];

    static std::string format(time_t timestamp, const char *format, bool utc);

    static std::string isoformat(time_t timestamp)
        { return format(timestamp, FORMAT_ISO8601, true); }

    // Parse a UTC timestamp in the given format.  The whole string must be
    // consumed.  Returns false if the string does not match.
    static bool parse(const std::string &s, const char *format,
                      time_t *timestamp);

private:
    TimeFormat() { }
};

/* Filesystem helpers.  Functions which cannot complete throw a CirrusError of
 * kind ERR_LOCAL_IO. */
std::string path_join(const std::string &dir, const std::string &name);
bool path_exists(const std::string &path);
bool is_directory(const std::string &path);
int64_t file_size(const std::string &path);
void make_dirs(const std::string &path, int mode = 0755);
void remove_tree(const std::string &path);
void rename_file(const std::string &from, const std::string &to);

// Names of the entries in a directory (excluding "." and ".."), sorted.
std::vector<std::string> list_directory(const std::string &path);

std::string read_file(const std::string &path);
// Write to a temporary file beside path and rename it into place, so that
// readers see either the old or the complete new contents.
void write_file(const std::string &path, const std::string &data,
                int mode = 0644);
// The copy is private (mode 0600) unless attributes are preserved, in which
// case it takes the permission bits and times of the original.
void copy_file(const std::string &from, const std::string &to);
void copy_file_preserving(const std::string &from, const std::string &to);

// Create a new, private directory "<base>/<prefix>.<uuid>".
std::string make_temp_dir(const std::string &base, const std::string &prefix);

#endif // _CIRRUS_UTIL_H
