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

#include <stdio.h>

#include <sstream>
#include <string>
#include <vector>

#include "cirrus.h"
#include "error.h"
#include "runtime.h"
#include "subprocess.h"
#include "util.h"

using std::istringstream;
using std::string;
using std::vector;

ComposeRuntime::ComposeRuntime(const Config &config)
    : project_name(config.project_name), compose_file(config.compose_file),
      stack_dir(config.stack_dir), timeout(config.db_timeout)
{
}

vector<string> ComposeRuntime::Command() const
{
    vector<string> argv;
    argv.push_back("docker");
    argv.push_back("compose");
    if (!project_name.empty()) {
        argv.push_back("--project-name");
        argv.push_back(project_name);
    }
    argv.push_back("-f");
    argv.push_back(compose_file);
    return argv;
}

int ComposeRuntime::Run(const vector<string> &args,
                        const CommandOptions &options)
{
    vector<string> argv = Command();
    argv.insert(argv.end(), args.begin(), args.end());

    if (verbose)
        printf("Running %s\n", format_command(argv).c_str());

    CommandOptions opts = options;
    if (opts.cwd.empty() && is_directory(stack_dir))
        opts.cwd = stack_dir;
    return run_command(argv, opts);
}

void ComposeRuntime::Down()
{
    vector<string> args;
    args.push_back("down");

    CommandOptions options;
    options.timeout = timeout;
    int status = Run(args, options);
    if (status != 0)
        throw CirrusError(ERR_UNREACHABLE,
                          string_printf("docker compose down exited with "
                                        "status %d", status));
}

void ComposeRuntime::Up(const string &service)
{
    vector<string> args;
    args.push_back("up");
    args.push_back("-d");
    if (!service.empty())
        args.push_back(service);

    CommandOptions options;
    options.timeout = timeout;
    int status = Run(args, options);
    if (status != 0)
        throw CirrusError(ERR_UNREACHABLE,
                          string_printf("docker compose up exited with "
                                        "status %d", status));
}

int ComposeRuntime::Exec(const string &service, const vector<string> &argv,
                         const string &stdin_path, const string &stdout_path,
                         int timeout)
{
    vector<string> args;
    args.push_back("exec");
    args.push_back("-T");
    args.push_back(service);
    args.insert(args.end(), argv.begin(), argv.end());

    CommandOptions options;
    options.stdin_path = stdin_path;
    options.stdout_path = stdout_path;
    options.timeout = timeout;
    return Run(args, options);
}

bool ComposeRuntime::IsHealthy(const string &service)
{
    vector<string> args;
    args.push_back("ps");
    args.push_back("--status");
    args.push_back("running");
    args.push_back("-q");
    args.push_back(service);

    string output;
    CommandOptions options;
    options.timeout = 60;
    options.capture_stdout = &output;
    if (Run(args, options) != 0)
        return false;
    return !trim(output).empty();
}

vector<string> ComposeRuntime::ImageVersions()
{
    vector<string> args;
    args.push_back("config");
    args.push_back("--images");

    string output;
    CommandOptions options;
    options.timeout = 60;
    options.capture_stdout = &output;
    int status = Run(args, options);
    if (status != 0)
        throw CirrusError(ERR_UNREACHABLE,
                          string_printf("docker compose config exited with "
                                        "status %d", status));

    vector<string> images;
    istringstream in(output);
    string line;
    while (getline(in, line)) {
        line = trim(line);
        if (!line.empty())
            images.push_back(line);
    }
    return images;
}

int ComposeRuntime::RunDocker(const vector<string> &args,
                              const CommandOptions &options)
{
    vector<string> argv;
    argv.push_back("docker");
    argv.insert(argv.end(), args.begin(), args.end());

    if (verbose)
        printf("Running %s\n", format_command(argv).c_str());
    return run_command(argv, options);
}

void ComposeRuntime::RunScratch(const string &name, const string &image,
                                const vector<string> &env)
{
    vector<string> args;
    args.push_back("run");
    args.push_back("-d");
    args.push_back("--rm");
    args.push_back("--name");
    args.push_back(name);
    for (vector<string>::const_iterator i = env.begin(); i != env.end(); ++i) {
        args.push_back("-e");
        args.push_back(*i);
    }
    args.push_back(image);

    string id;
    CommandOptions options;
    options.timeout = timeout;
    options.capture_stdout = &id;
    int status = RunDocker(args, options);
    if (status != 0)
        throw CirrusError(ERR_UNREACHABLE,
                          string_printf("Starting a %s container exited with "
                                        "status %d", image.c_str(), status));
}

int ComposeRuntime::ExecScratch(const string &name, const vector<string> &argv,
                                const string &stdin_path, int timeout)
{
    vector<string> args;
    args.push_back("exec");
    args.push_back("-i");
    args.push_back(name);
    args.insert(args.end(), argv.begin(), argv.end());

    string discarded;
    CommandOptions options;
    options.stdin_path = stdin_path;
    options.timeout = timeout;
    options.capture_stdout = &discarded;
    return RunDocker(args, options);
}

void ComposeRuntime::RemoveScratch(const string &name)
{
    vector<string> args;
    args.push_back("rm");
    args.push_back("-f");
    args.push_back(name);

    string discarded;
    CommandOptions options;
    options.timeout = 60;
    options.capture_stdout = &discarded;
    try {
        int status = RunDocker(args, options);
        if (status != 0)
            fprintf(stderr, "Warning: removing container %s exited with "
                    "status %d\n", name.c_str(), status);
    } catch (CirrusError &e) {
        fprintf(stderr, "Warning: unable to remove container %s: %s\n",
                name.c_str(), e.what());
    }
}
