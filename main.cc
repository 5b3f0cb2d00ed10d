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

/* Main entry point for cirrus.  Parses the command line, loads the stack's
 * configuration, wires the components together and runs a single verb. */

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "archiver.h"
#include "cirrus.h"
#include "config.h"
#include "dumper.h"
#include "engine.h"
#include "error.h"
#include "hash.h"
#include "localdb.h"
#include "remote.h"
#include "runtime.h"
#include "sealer.h"
#include "snapshot.h"
#include "util.h"

using std::string;
using std::vector;

static const char cirrus_version[] = CIRRUS_STRINGIFY(CIRRUS_VERSION);

/* Exit codes. */
enum {
    EXIT_OK = 0,
    EXIT_FAILED = 1,
    EXIT_INVALID = 2,
    EXIT_BUSY = 3,
};

void usage(const char *program)
{
    fprintf(
        stderr,
        "Cirrus %s\n\n"
        "Usage: %s [OPTION]... VERB [ARGUMENTS]...\n"
        "Take, verify, prune and restore snapshots of a document stack.\n"
        "\n"
        "Verbs:\n"
        "  snapshot create {full|incremental|archive}\n"
        "                       take a snapshot and upload it\n"
        "  snapshot list        list the committed snapshots\n"
        "  snapshot verify ID   download a snapshot and check its artifacts\n"
        "  snapshot prune       delete snapshots outside the retention policy\n"
        "  restore [ID]         restore a snapshot (default: the latest)\n"
        "\n"
        "Options:\n"
        "  --config=FILE        read settings from FILE\n"
        "                           (defaults to the stack's .env file)\n"
        "  --dest=PATH          store snapshots in the local directory PATH\n"
        "                           instead of the configured remote\n"
        "  --state-dir=PATH     keep the local database and change state in PATH\n"
        "  --tmpdir=PATH        path for staging snapshot files\n"
        "                           (defaults to CIRRUS_TMPDIR, then the TMPDIR\n"
        "                           environment variable, then /tmp)\n"
        "  --passphrase-file=FILE\n"
        "                       read the configuration passphrase from FILE\n"
        "  --ask-passphrase     prompt for the configuration passphrase\n"
        "  --keep-config        on restore, leave the current .env file in place\n"
        "  --no-prune           do not prune after taking a snapshot\n"
        "  -v --verbose         report progress\n"
        "  --help               show this message\n",
        cirrus_version, program
    );
}

static int exit_code(ErrorKind kind)
{
    switch (kind) {
    case ERR_INVALID_INPUT:
        return EXIT_INVALID;
    case ERR_BUSY:
        return EXIT_BUSY;
    default:
        return EXIT_FAILED;
    }
}

static void report_error(const CirrusError &e)
{
    if (e.get_snapshot().empty()) {
        fprintf(stderr, "error [%s]: %s\n", error_kind_name(e.get_kind()),
                e.what());
    } else {
        fprintf(stderr, "error [%s] %s: %s\n", error_kind_name(e.get_kind()),
                e.get_snapshot().c_str(), e.what());
    }
}

static string format_size(int64_t size)
{
    static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = size;
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    if (unit == 0)
        return string_printf("%lld B", static_cast<long long>(size));
    return string_printf("%.1f %s", value, units[unit]);
}

static void list_snapshots(SnapshotEngine *engine)
{
    vector<Snapshot> snapshots = engine->List();
    for (vector<Snapshot>::const_iterator i = snapshots.begin();
         i != snapshots.end(); ++i) {
        printf("%s  %-11s  %-19s  %-8s  %s\n", i->id.c_str(),
               kind_to_string(i->kind),
               i->parent_id.empty() ? "-" : i->parent_id.c_str(),
               status_to_string(i->status),
               format_size(i->total_size()).c_str());
        if (verbose) {
            for (vector<string>::const_iterator image = i->images.begin();
                 image != i->images.end(); ++image)
                printf("    image %s\n", image->c_str());
        }
    }

    if (verbose) {
        vector<SnapshotRecord> runs = engine->RecentRuns(20);
        if (!runs.empty())
            printf("\nRecent runs on this host:\n");
        for (vector<SnapshotRecord>::const_iterator i = runs.begin();
             i != runs.end(); ++i) {
            printf("%s  %-11s  %-8s  %s\n", i->id.c_str(),
                   kind_to_string(i->kind), status_to_string(i->status),
                   i->message.c_str());
        }
    }
}

static int run_verb(SnapshotEngine *engine, const vector<string> &args,
                    const char *program)
{
    const string &verb = args[0];

    if (verb == "snapshot") {
        if (args.size() < 2) {
            usage(program);
            return EXIT_INVALID;
        }
        const string &action = args[1];

        if (action == "create" && args.size() == 3) {
            SnapshotKind kind;
            if (!parse_kind(args[2], &kind)) {
                throw CirrusError(ERR_INVALID_INPUT,
                                  "Unknown snapshot kind \"" + args[2] + "\"");
            }
            string id = engine->Create(kind);
            printf("%s\n", id.c_str());
        } else if (action == "list" && args.size() == 2) {
            list_snapshots(engine);
        } else if (action == "verify" && args.size() == 3) {
            engine->Verify(args[2]);
        } else if (action == "prune" && args.size() == 2) {
            vector<string> deleted = engine->Prune();
            for (vector<string>::const_iterator i = deleted.begin();
                 i != deleted.end(); ++i)
                printf("%s\n", i->c_str());
        } else {
            usage(program);
            return EXIT_INVALID;
        }
    } else if (verb == "restore" && args.size() <= 2) {
        engine->Restore(args.size() == 2 ? args[1] : "");
    } else {
        usage(program);
        return EXIT_INVALID;
    }

    return EXIT_OK;
}

int main(int argc, char *argv[])
{
    hash_init();

    string config_file = "", dest = "", state_dir = "";
    string passphrase_file = "";
    bool ask_passphrase = false, keep_config = false, no_prune = false;

    string tmp_dir = "";

    while (1) {
        static struct option long_options[] = {
            {"config", 1, 0, 0},            // 0
            {"dest", 1, 0, 0},              // 1
            {"state-dir", 1, 0, 0},         // 2
            {"tmpdir", 1, 0, 0},            // 3
            {"passphrase-file", 1, 0, 0},   // 4
            {"ask-passphrase", 0, 0, 0},    // 5
            {"keep-config", 0, 0, 0},       // 6
            {"no-prune", 0, 0, 0},          // 7
            {"help", 0, 0, 0},              // 8
            // Aliases for short options
            {"verbose", 0, 0, 'v'},
            {NULL, 0, 0, 0},
        };

        int long_index;
        int c = getopt_long(argc, argv, "v", long_options, &long_index);

        if (c == -1)
            break;

        if (c == 0) {
            switch (long_index) {
            case 0:     // --config
                config_file = optarg;
                break;
            case 1:     // --dest
                dest = optarg;
                break;
            case 2:     // --state-dir
                state_dir = optarg;
                break;
            case 3:     // --tmpdir
                tmp_dir = optarg;
                break;
            case 4:     // --passphrase-file
                passphrase_file = optarg;
                break;
            case 5:     // --ask-passphrase
                ask_passphrase = true;
                break;
            case 6:     // --keep-config
                keep_config = true;
                break;
            case 7:     // --no-prune
                no_prune = true;
                break;
            case 8:     // --help
                usage(argv[0]);
                return EXIT_OK;
            default:
                fprintf(stderr, "Unhandled long option!\n");
                return EXIT_FAILED;
            }
        } else {
            switch (c) {
            case 'v':
                verbose = true;
                break;
            default:
                usage(argv[0]);
                return EXIT_INVALID;
            }
        }
    }

    if (optind == argc) {
        usage(argv[0]);
        return EXIT_INVALID;
    }

    if (ask_passphrase && passphrase_file != "") {
        fprintf(stderr, "Error: Cannot specify both --ask-passphrase and "
                "--passphrase-file=\n");
        usage(argv[0]);
        return EXIT_INVALID;
    }

    vector<string> args;
    for (int i = optind; i < argc; i++)
        args.push_back(argv[i]);

    try {
        if (config_file == "")
            config_file = Config().env_file;
        Config config = load_config(config_file);

        if (dest != "") {
            config.remote_type = REMOTE_LOCAL;
            config.remote_root = dest;
        }
        if (state_dir != "")
            config.state_dir = state_dir;
        config.choose_tmp_dir(tmp_dir, getenv("TMPDIR"));
        config.validate();
        if (verbose) {
            printf("Instance %s, remote %s/%s, config bundle %s\n",
                   config.instance_name.c_str(), config.remote_root.c_str(),
                   config.namespace_name().c_str(),
                   config_mode_to_string(config.config_mode));
        }

        // Without either option the engine reads ENV_BACKUP_PASSPHRASE_FILE.
        PassphraseSource passphrase = PassphraseSource::FromValue("");
        bool have_passphrase = false;
        if (passphrase_file != "") {
            passphrase = PassphraseSource::FromFile(passphrase_file);
            have_passphrase = true;
        } else if (ask_passphrase) {
            char *entered = getpass("Configuration passphrase: ");
            if (entered == NULL)
                throw CirrusError(ERR_INVALID_INPUT,
                                  "Unable to read the passphrase");
            passphrase = PassphraseSource::FromValue(entered);
            memset(entered, 0, strlen(entered));
            have_passphrase = true;
        }

        make_dirs(config.state_dir, 0700);

        scoped_ptr<RemoteStore> remote(RemoteStore::New(config));
        TarArchiver archiver(config.state_dir);
        ComposeRuntime runtime(config);
        ComposeDatabaseDumper dumper(&runtime, config);

        SnapshotEngine engine(config, remote.get(), &archiver, &dumper,
                              &runtime);
        if (have_passphrase)
            engine.set_passphrase(&passphrase);
        engine.set_keep_config(keep_config);
        engine.set_prune(config.prune_after_backup && !no_prune);

        return run_verb(&engine, args, argv[0]);
    } catch (CirrusError &e) {
        report_error(e);
        return exit_code(e.get_kind());
    }
}
