#pragma once

#include <QString>

#include "cfg.h"
#include "util.h"

/// Application wide settings, loaded from an ini-like config file
/// (see qsimplecfg::Cfg). Missing keys take their default value.
class Settings {
public:
    static Settings & instance();

    static QString defaultCfgFilepath();
    static QString defaultDataDir();

    void load(const QString& cfgFilepath=QString());

    const QString& cfgFilepath() const;

    const QString& archiveDir() const;
    int parallelism() const;

    const QString& tweetDatabase() const;
    const QString& tweetSchema() const;

    const QString& verbosity() const;
    bool logToFile() const;

    bool settingsLoaded() const;

public:
    ~Settings() = default;
    Q_DISABLE_COPY(Settings)
    DISABLE_MOVE(Settings)

private:
    Settings() = default;

    void loadSections();
    void loadSectArchive();
    void loadSectTweets();
    void loadSectLogging();

    qsimplecfg::Cfg m_cfg;
    QString m_cfgFilepath;
    QString m_archiveDir;
    int m_parallelism {6};
    QString m_tweetDatabase;
    QString m_tweetSchema;
    QString m_verbosity {"warning"};
    bool m_logToFile {false};
    bool m_settingsLoaded {false};
};
