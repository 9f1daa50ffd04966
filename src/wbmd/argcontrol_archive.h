#pragma once

#include <QString>

/// Subcommands operating on the archive store
/// (create, extract, list, digests, digests-raw, add-file).
namespace argcontrol_archive {
    bool isArchiveCmd(const QString& cmd);

    [[noreturn]]
    void parse(const QString& cmd, int argc, char *argv[], int parallelism);
}
