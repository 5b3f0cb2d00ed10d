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

/* The container runtime running the application stack.  The engine only
 * ever brings services down or up, runs a command inside a service, asks
 * whether a service is running and which images the stack uses; it never
 * looks at container internals.  Besides the stack, the runtime can start a
 * throwaway container, which the dumper uses to try a dump out. */

#ifndef _CIRRUS_RUNTIME_H
#define _CIRRUS_RUNTIME_H

#include <string>
#include <vector>

#include "config.h"
#include "subprocess.h"

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() { }

    // Stop every service of the stack.
    virtual void Down() = 0;
    // Start one service, or all of them if service is empty.
    virtual void Up(const std::string &service) = 0;

    // Run argv inside a service and return its exit status.  stdin_path and
    // stdout_path, if non-empty, name local files connected to the command.
    virtual int Exec(const std::string &service,
                     const std::vector<std::string> &argv,
                     const std::string &stdin_path,
                     const std::string &stdout_path, int timeout) = 0;

    virtual bool IsHealthy(const std::string &service) = 0;

    // The image references of the stack's services, one per service.
    // Throws ERR_UNREACHABLE if the runtime cannot tell.
    virtual std::vector<std::string> ImageVersions() = 0;

    // Start a detached container from image, outside the stack, with the
    // given NAME=value environment.  It is removed when stopped.
    virtual void RunScratch(const std::string &name, const std::string &image,
                            const std::vector<std::string> &env) = 0;
    virtual int ExecScratch(const std::string &name,
                            const std::vector<std::string> &argv,
                            const std::string &stdin_path, int timeout) = 0;
    // Stop and remove a container started by RunScratch.  Never throws.
    virtual void RemoveScratch(const std::string &name) = 0;
};

/* Drives "docker compose" for the instance's project. */
class ComposeRuntime : public ContainerRuntime {
public:
    explicit ComposeRuntime(const Config &config);

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

private:
    std::string project_name, compose_file, stack_dir;
    int timeout;

    std::vector<std::string> Command() const;
    int Run(const std::vector<std::string> &args,
            const CommandOptions &options);
    // Plain "docker", for containers outside the stack.
    int RunDocker(const std::vector<std::string> &args,
                  const CommandOptions &options);
};

#endif // _CIRRUS_RUNTIME_H
