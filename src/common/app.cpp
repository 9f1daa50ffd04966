#include <QCoreApplication>
#include <QString>

#include "qoutstream.h"
#include "app.h"

// defined in the cmake file
#ifndef WBM_VERSION
static_assert (false, "WBM_VERSION not defined");
#endif


const char* app::CURRENT_NAME = "UNDEFINED";
const char* app::WBMD = "wbmd";


const QStringList &app::verbosities()
{
    static const QStringList vals = {"dbg", "info", "warning", "critical"};
    return vals;
}

/// Set the application name (which determines the config and cache
/// directories) and the prefix of QIErr messages.
void app::setupNameAndVersion(const char* currentName)
{
    app::CURRENT_NAME = currentName;
    QIErr::setPreamble(QString(currentName) + ": ");

    QCoreApplication::setApplicationName(currentName);
    QCoreApplication::setApplicationVersion(app::version().toString());
}

const QVersionNumber &app::version()
{
    static const QVersionNumber v = QVersionNumber::fromString(WBM_VERSION);
    return v;
}
