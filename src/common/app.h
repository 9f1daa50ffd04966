#pragma once

#include <QStringList>
#include <QVersionNumber>

namespace app {

const extern char* CURRENT_NAME;
const extern char* WBMD;

const QStringList& verbosities();

void setupNameAndVersion(const char *currentName);

const QVersionNumber& version();

}
