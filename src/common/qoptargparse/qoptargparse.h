#pragma once

#include <QString>
#include <tsl/ordered_map.h>

#include "qoptarg.h"

/// Parser for options of the form --name value, -n value or --flag.
/// Parsing stops at the first argument which is no known option:
/// it and all following ones (the command and its arguments, or
/// positional arguments) are available via rest().
class QOptArgParse
{
public:
    struct Rest {
        char** argv {nullptr};
        int len {0};
    };

    void addArg(QOptArg* arg );

    void parse(int argc, char *argv[]);

    const Rest& rest() const;

    void setHelpIntroduction(const QString& txt);

    void printHelp() const;

private:
    QOptArg* find(const QString& argStr) const;

    tsl::ordered_map<QString, QOptArg*> m_args;
    tsl::ordered_map<QString, QOptArg*> m_argsShort;
    Rest m_rest;
    QString m_helpIntroduction;
};
