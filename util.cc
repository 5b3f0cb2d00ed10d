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

/* Utility functions for converting various datatypes to text format (and
 * parsing them back), and small filesystem helpers. */

#include <ctype.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>
#include <uuid/uuid.h>

#include <algorithm>
#include <string>
#include <vector>

#include "error.h"
#include "util.h"

using std::string;
using std::vector;

bool verbose = false;

/* Perform URI-style escaping of a string.  Bytes which cannot be represented
 * directly are encoded in the form %xx (where "xx" is a string of two
 * hexadecimal digits). */
string uri_encode(const string &in)
{
    string out;

    for (size_t i = 0; i < in.length(); i++) {
        unsigned char c = in[i];

        if (c >= '+' && c < 0x7f && c != '@') {
            out += c;
        } else {
            char buf[4];
            sprintf(buf, "%%%02x", c);
            out += buf;
        }
    }

    return out;
}

/* Decoding of strings produced by uri_encode. */
string uri_decode(const string &in)
{
    string out;
    const char *input = in.c_str();

    while (*input != '\0') {
        if (*input == '%') {
            if (isxdigit(input[1]) && isxdigit(input[2])) {
                char hexbuf[3];
                hexbuf[0] = input[1];
                hexbuf[1] = input[2];
                hexbuf[2] = '\0';
                out += static_cast<char>(strtol(hexbuf, NULL, 16));
                input += 3;
            } else {
                input++;
            }
        } else {
            out += *input++;
        }
    }

    return out;
}

/* Return the string representation of an integer.  Will try to produce output
 * in decimal, hexadecimal, or octal according to base, though this is just
 * advisory.  For negative numbers, will always use decimal. */
string encode_int(long long n, int base)
{
    char buf[64];

    if (n >= 0 && base == 16) {
        sprintf(buf, "0x%llx", n);
        return buf;
    }

    if (n > 0 && base == 8) {
        sprintf(buf, "0%llo", n);
        return buf;
    }

    sprintf(buf, "%lld", n);
    return buf;
}

/* Parse the string representation of an integer.  Accepts decimal, octal, and
 * hexadecimal, just as C would (recognizes the 0 and 0x prefixes). */
long long parse_int(const string &s)
{
    return strtoll(s.c_str(), NULL, 0);
}

/* Mark a file descriptor as close-on-exec. */
void cloexec(int fd)
{
    long flags = fcntl(fd, F_GETFD);

    if (flags < 0)
        return;

    fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

string string_printf(const char *fmt, ...)
{
    va_list args;
    char *result = NULL;

    va_start(args, fmt);
    int len = vasprintf(&result, fmt, args);
    va_end(args);

    if (len < 0 || result == NULL)
        return "";

    string out(result, len);
    free(result);
    return out;
}

string trim(const string &s)
{
    size_t start = 0, end = s.size();

    while (start < end && isspace(static_cast<unsigned char>(s[start])))
        start++;
    while (end > start && isspace(static_cast<unsigned char>(s[end - 1])))
        end--;

    return s.substr(start, end - start);
}

void fatal(string msg)
{
    fprintf(stderr, "FATAL: %s\n", msg.c_str());
    exit(1);
}

string generate_uuid()
{
    uuid_t uuid;
    char buf[40];

    uuid_generate(uuid);
    uuid_unparse_lower(uuid, buf);
    return buf;
}

void sleep_ms(long ms)
{
    struct timespec req, rem;

    req.tv_sec = ms / 1000;
    req.tv_nsec = (ms % 1000) * 1000000L;
    while (nanosleep(&req, &rem) < 0 && errno == EINTR)
        req = rem;
}

const char TimeFormat::FORMAT_FILENAME[] = "%Y-%m-%d_%H-%M-%S";
const char TimeFormat::FORMAT_ISO8601[] = "%Y-%m-%d %H:%M:%S";

string TimeFormat::format(time_t timestamp, const char *format, bool utc)
{
    struct tm time_buf;

    if (utc) {
        if (gmtime_r(&timestamp, &time_buf) == NULL)
            return "";
    } else {
        if (localtime_r(&timestamp, &time_buf) == NULL)
            return "";
    }

    char buf[64];
    if (strftime(buf, sizeof(buf), format, &time_buf) == 0)
        return "";

    return buf;
}

bool TimeFormat::parse(const string &s, const char *format,
                       time_t *timestamp)
{
    struct tm time_buf;
    memset(&time_buf, 0, sizeof(time_buf));

    const char *end = strptime(s.c_str(), format, &time_buf);
    if (end == NULL || *end != '\0')
        return false;

    *timestamp = timegm(&time_buf);
    return true;
}

string path_join(const string &dir, const string &name)
{
    if (dir.empty())
        return name;
    if (name.empty())
        return dir;
    if (dir[dir.size() - 1] == '/')
        return dir + name;
    return dir + "/" + name;
}

bool path_exists(const string &path)
{
    struct stat stat_buf;
    return lstat(path.c_str(), &stat_buf) == 0;
}

bool is_directory(const string &path)
{
    struct stat stat_buf;
    if (stat(path.c_str(), &stat_buf) < 0)
        return false;
    return S_ISDIR(stat_buf.st_mode);
}

int64_t file_size(const string &path)
{
    struct stat stat_buf;
    if (stat(path.c_str(), &stat_buf) < 0)
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("stat(%s): %s", path.c_str(),
                                        strerror(errno)));
    return stat_buf.st_size;
}

void make_dirs(const string &path, int mode)
{
    if (path.empty() || is_directory(path))
        return;

    size_t slash = path.rfind('/');
    if (slash != string::npos && slash > 0)
        make_dirs(path.substr(0, slash), mode);

    if (mkdir(path.c_str(), mode) < 0 && errno != EEXIST) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("mkdir(%s): %s", path.c_str(),
                                        strerror(errno)));
    }
}

/* Recursively delete a file or directory tree.  Symlinks are removed, never
 * followed.  A path which does not exist is not an error. */
void remove_tree(const string &path)
{
    struct stat stat_buf;

    if (lstat(path.c_str(), &stat_buf) < 0) {
        if (errno == ENOENT)
            return;
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("lstat(%s): %s", path.c_str(),
                                        strerror(errno)));
    }

    if (S_ISDIR(stat_buf.st_mode)) {
        vector<string> contents = list_directory(path);
        for (vector<string>::const_iterator i = contents.begin();
             i != contents.end(); ++i) {
            remove_tree(path_join(path, *i));
        }
        if (rmdir(path.c_str()) < 0) {
            throw CirrusError(ERR_LOCAL_IO,
                              string_printf("rmdir(%s): %s", path.c_str(),
                                            strerror(errno)));
        }
    } else if (unlink(path.c_str()) < 0) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("unlink(%s): %s", path.c_str(),
                                        strerror(errno)));
    }
}

void rename_file(const string &from, const string &to)
{
    if (rename(from.c_str(), to.c_str()) < 0) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("rename(%s, %s): %s", from.c_str(),
                                        to.c_str(), strerror(errno)));
    }
}

vector<string> list_directory(const string &path)
{
    DIR *dir = opendir(path.c_str());
    if (dir == NULL) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Error reading directory %s: %s",
                                        path.c_str(), strerror(errno)));
    }

    struct dirent *ent;
    vector<string> contents;
    while ((ent = readdir(dir)) != NULL) {
        string filename(ent->d_name);
        if (filename == "." || filename == "..")
            continue;
        contents.push_back(filename);
    }

    closedir(dir);

    sort(contents.begin(), contents.end());
    return contents;
}

string read_file(const string &path)
{
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to open file %s: %s",
                                        path.c_str(), strerror(errno)));
    }

    string result;
    char buf[65536];
    while (true) {
        ssize_t res = read(fd, buf, sizeof(buf));
        if (res < 0) {
            if (errno == EINTR)
                continue;
            int saved_errno = errno;
            close(fd);
            throw CirrusError(ERR_LOCAL_IO,
                              string_printf("error reading %s: %s",
                                            path.c_str(),
                                            strerror(saved_errno)));
        } else if (res == 0) {
            break;
        }
        result.append(buf, res);
    }

    close(fd);
    return result;
}

static void write_all(int fd, const char *data, size_t len,
                      const string &path)
{
    while (len > 0) {
        ssize_t res = write(fd, data, len);

        if (res < 0) {
            if (errno == EINTR)
                continue;
            throw CirrusError(ERR_LOCAL_IO,
                              string_printf("Write error on %s: %s",
                                            path.c_str(), strerror(errno)));
        }

        len -= res;
        data += res;
    }
}

void write_file(const string &path, const string &data, int mode)
{
    string tmp_path = path + ".tmp";

    int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (fd < 0) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Error opening output file %s: %s",
                                        tmp_path.c_str(), strerror(errno)));
    }

    try {
        write_all(fd, data.data(), data.size(), tmp_path);
    } catch (CirrusError &) {
        close(fd);
        unlink(tmp_path.c_str());
        throw;
    }

    if (fsync(fd) < 0 || close(fd) < 0) {
        unlink(tmp_path.c_str());
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Error closing %s: %s",
                                        tmp_path.c_str(), strerror(errno)));
    }

    rename_file(tmp_path, path);
}

void copy_file(const string &from, const string &to)
{
    int in = open(from.c_str(), O_RDONLY);
    if (in < 0) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to open file %s: %s",
                                        from.c_str(), strerror(errno)));
    }

    int out = open(to.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (out < 0) {
        int saved_errno = errno;
        close(in);
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Error opening output file %s: %s",
                                        to.c_str(), strerror(saved_errno)));
    }

    char buf[65536];
    try {
        while (true) {
            ssize_t res = read(in, buf, sizeof(buf));
            if (res < 0) {
                if (errno == EINTR)
                    continue;
                throw CirrusError(ERR_LOCAL_IO,
                                  string_printf("error reading %s: %s",
                                                from.c_str(),
                                                strerror(errno)));
            } else if (res == 0) {
                break;
            }
            write_all(out, buf, res, to);
        }
    } catch (CirrusError &) {
        close(in);
        close(out);
        throw;
    }

    close(in);
    if (close(out) < 0) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Error closing %s: %s", to.c_str(),
                                        strerror(errno)));
    }
}

void copy_file_preserving(const string &from, const string &to)
{
    struct stat stat_buf;
    if (stat(from.c_str(), &stat_buf) < 0)
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("stat(%s): %s", from.c_str(),
                                        strerror(errno)));

    copy_file(from, to);

    if (chmod(to.c_str(), stat_buf.st_mode & 07777) < 0)
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("chmod(%s): %s", to.c_str(),
                                        strerror(errno)));

    struct timeval times[2];
    times[0].tv_sec = stat_buf.st_atime;
    times[0].tv_usec = 0;
    times[1].tv_sec = stat_buf.st_mtime;
    times[1].tv_usec = 0;
    if (utimes(to.c_str(), times) < 0)
        fprintf(stderr, "Warning: utimes(%s): %s\n", to.c_str(),
                strerror(errno));
}

string make_temp_dir(const string &base, const string &prefix)
{
    string dir = path_join(base, prefix + "." + generate_uuid());

    if (mkdir(dir.c_str(), 0700) < 0) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Cannot create temporary directory "
                                        "%s: %s", dir.c_str(),
                                        strerror(errno)));
    }

    return dir;
}
