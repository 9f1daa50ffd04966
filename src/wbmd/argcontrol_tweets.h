#pragma once

#include <QString>

/// Subcommands operating on the tweet index
/// (tweets-add, tweets-get, tweets-users).
namespace argcontrol_tweets {
    bool isTweetsCmd(const QString& cmd);

    [[noreturn]]
    void parse(const QString& cmd, int argc, char *argv[]);
}
