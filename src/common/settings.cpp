#include <QCoreApplication>
#include <QFileInfo>
#include <QStandardPaths>

#include "settings.h"

#include "app.h"
#include "exccfg.h"
#include "logger.h"

using qsimplecfg::ExcCfg;


Settings &Settings::instance()
{
    static Settings s;
    return s;
}

QString Settings::defaultCfgFilepath()
{
    // don't make path static -> mutliple test cases...
    return pathJoinFilename(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation),
                            QCoreApplication::applicationName()) + "/config.ini";
}

QString Settings::defaultDataDir()
{
    return pathJoinFilename(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation),
                            QCoreApplication::applicationName());
}

/// Parse the config file (or the default one, if cfgFilepath is empty).
/// It is created with all defaults as comments, if it does not exist.
/// Unknown keys are reported as warnings.
/// @throws ExcCfg
void Settings::load(const QString &cfgFilepath)
{
    m_cfgFilepath = (cfgFilepath.isEmpty()) ? defaultCfgFilepath() : cfgFilepath;
    const bool cfgFileExisted = QFileInfo::exists(m_cfgFilepath);
    m_cfg.parse(m_cfgFilepath);
    try {
        loadSections();
        for(const auto& sectKeys : m_cfg.unknownKeys()){
            for(const QString& key : sectKeys.second){
                logWarning << qtr("Unexpected key in section [%1] - '%2'")
                              .arg(sectKeys.first, key);
            }
        }
        if(! cfgFileExisted){
            logDebug << "about to write the default config to" << m_cfgFilepath;
            m_cfg.store();
        }
    } catch(ExcCfg & ex) {
        ex.setDescrip(ex.descrip() + qtr(". The config file resides at %1").arg(m_cfgFilepath));
        throw;
    }
    m_settingsLoaded = true;
}

const QString &Settings::cfgFilepath() const
{
    return m_cfgFilepath;
}

const QString &Settings::archiveDir() const
{
    return m_archiveDir;
}

int Settings::parallelism() const
{
    return m_parallelism;
}

const QString &Settings::tweetDatabase() const
{
    return m_tweetDatabase;
}

/// empty, if the built-in schema shall be used
const QString &Settings::tweetSchema() const
{
    return m_tweetSchema;
}

const QString &Settings::verbosity() const
{
    return m_verbosity;
}

bool Settings::logToFile() const
{
    return m_logToFile;
}

bool Settings::settingsLoaded() const
{
    return m_settingsLoaded;
}

void Settings::loadSections()
{
    m_cfg.setInitialComments(qtr(
                                 "Configuration file for %1. Uncomment lines "
                                 "to change defaults. In paths $HOME or ~ may be "
                                 "used for your home directory.")
                             .arg(app::WBMD));
    loadSectArchive();
    loadSectTweets();
    loadSectLogging();
}

void Settings::loadSectArchive()
{
    auto sect = m_cfg["archive"];
    sect->setComments(qtr("The content addressed archive of captured files. "
                          "parallelism is the number of threads used to verify "
                          "digests."));
    m_archiveDir = expandHome(sect->getValue<QString>("dir", defaultDataDir() + "/archive"));
    m_parallelism = sect->getValue<int>("parallelism", 6);
    if(m_parallelism < 1){
        throw ExcCfg(qtr("parallelism must be at least 1 (key parallelism) in "
                         "section %1").arg(sect->sectionName()));
    }
}

void Settings::loadSectTweets()
{
    auto sect = m_cfg["tweets"];
    sect->setComments(qtr("The sqlite database indexing tweets of archived files. "
                          "If schema is empty, the built-in schema is used."));
    m_tweetDatabase = expandHome(sect->getValue<QString>("database",
                                                         defaultDataDir() + "/tweets.db"));
    m_tweetSchema = expandHome(sect->getValue<QString>("schema"));
}

void Settings::loadSectLogging()
{
    auto sect = m_cfg["logging"];
    sect->setComments(qtr("verbosity is one of %1. Log files are written "
                          "to %2.").arg(app::verbosities().join(", "), logger::logDir()));
    m_verbosity = sect->getValue<QString>("verbosity", "warning");
    if(! app::verbosities().contains(m_verbosity)){
        throw ExcCfg(qtr("Invalid verbosity '%1' (key verbosity) in section %2")
                     .arg(m_verbosity, sect->sectionName()));
    }
    m_logToFile = sect->getValue<bool>("log_to_file", false);
}
