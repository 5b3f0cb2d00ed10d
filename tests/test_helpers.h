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

/* Shared fixtures for the unit tests: scratch directories, file helpers and
 * in-memory stand-ins for the container runtime and database dumper. */

#ifndef _CIRRUS_TEST_HELPERS_H
#define _CIRRUS_TEST_HELPERS_H

#include <time.h>

#include <string>
#include <vector>

#include "config.h"
#include "dumper.h"
#include "runtime.h"
#include "util.h"

/* A scratch directory removed again at the end of the test. */
class ScratchDir : public noncopyable {
public:
    ScratchDir();
    ~ScratchDir();

    const std::string &Path() const { return path; }
    std::string Sub(const std::string &name) const
        { return path_join(path, name); }

private:
    std::string path;
};

// Create a file (and any missing parent directories) with the given data.
void put_file(const std::string &path, const std::string &data);

// Set the modification time of a path, in whole seconds.
void set_mtime(const std::string &path, time_t mtime);

// Seconds since the epoch for a UTC calendar time.
time_t utc_time(int year, int month, int day, int hour = 0, int min = 0,
                int sec = 0);

// A configuration whose every path lies below root and whose remote is a
// local directory.
Config scratch_config(const std::string &root);

/* Records every call instead of talking to a container engine.  Image
 * lookups are not recorded. */
class FakeRuntime : public ContainerRuntime {
public:
    FakeRuntime() : healthy(true), images_known(true) { }

    virtual void Down();
    virtual void Up(const std::string &service);
    virtual int Exec(const std::string &service,
                     const std::vector<std::string> &argv,
                     const std::string &stdin_path,
                     const std::string &stdout_path, int timeout);
    virtual bool IsHealthy(const std::string &service);
    virtual std::vector<std::string> ImageVersions();

    virtual void RunScratch(const std::string &name, const std::string &image,
                            const std::vector<std::string> &env);
    virtual int ExecScratch(const std::string &name,
                            const std::vector<std::string> &argv,
                            const std::string &stdin_path, int timeout);
    virtual void RemoveScratch(const std::string &name);

    std::vector<std::string> calls;
    bool healthy;
    std::vector<std::string> images;
    bool images_known;
};

/* Keeps the "database" as a string.  Dump writes it out; Restore reads it
 * back in. */
class FakeDumper : public DatabaseDumper {
public:
    FakeDumper() : contents("CREATE TABLE documents;\n"), reachable(true),
                   restores(0), trials(0), loads(true) { }

    virtual void Dump(const std::string &out_path);
    virtual void Restore(const std::string &dump_path);
    virtual void TrialRestore(const std::string &dump_path);

    std::string contents;
    bool reachable;
    int restores;
    int trials;
    bool loads;             // Whether a trial restore succeeds
};

#endif // _CIRRUS_TEST_HELPERS_H
