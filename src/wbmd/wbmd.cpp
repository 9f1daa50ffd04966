#include <QCoreApplication>
#include <exception>

#include "app.h"
#include "argcontrol_archive.h"
#include "argcontrol_tweets.h"
#include "cpp_exit.h"
#include "exccfg.h"
#include "excoptargparse.h"
#include "logger.h"
#include "qoptargparse.h"
#include "qoutstream.h"
#include "settings.h"
#include "util.h"

/// Uncaught exception handler
void onterminate() {
    try {
        auto unknown = std::current_exception();
        if (unknown) {
            std::rethrow_exception(unknown);
        }
    } catch (const std::exception& e) {
        logCritical << e.what() << "\n";
    } catch (...) {
        logCritical << "unknown exception occurred\n";
    }
}


int wbmd_main(int argc, char *argv[])
{
    app::setupNameAndVersion(app::WBMD);
    logger::setup(app::CURRENT_NAME);

    std::set_terminate(onterminate);

    // ignore first arg (command to this app)
    --argc;
    ++argv;

    QOptArgParse parser;
    parser.setHelpIntroduction(qtr(
        "Maintain a content addressed archive of captured web pages and an "
        "index of the tweets found therein.\n"
        "Usage: %1 [options] COMMAND [command options]\n"
        "Archive commands:\n"
        "  create, extract, list, digests, digests-raw, add-file\n"
        "Tweet index commands:\n"
        "  tweets-add, tweets-get, tweets-users\n"
        "Type COMMAND --help for details.").arg(app::WBMD) + "\n");

    QOptArg argVersion("v", "version", qtr("Display version"), false);
    parser.addArg(&argVersion);

    QOptArg argVerbosity("", "verbosity", qtr("How much shall be printed to stderr. Note that "
                                              "'dbg'-messages are lost in Release-builds. "
                                              "Overrides the config-file."));
    argVerbosity.setAllowedOptions(app::verbosities());
    parser.addArg(&argVerbosity);

    QOptArg argParallelism("p", "parallelism", qtr("Number of threads used to verify "
                                                   "digests. Overrides the config-file."));
    parser.addArg(&argParallelism);

    QOptArg argCfgFile("", "cfg-file", qtr("Use the given config-file instead of %1")
                       .arg(Settings::defaultCfgFilepath()));
    parser.addArg(&argCfgFile);

    try {
        parser.parse(argc, argv);

        if(argVersion.wasParsed()){
            QOut() << app::WBMD << qtr(" version ") << app::version().toString() << "\n";
            cpp_exit(0);
        }

        auto & sets = Settings::instance();
        sets.load(argCfgFile.getValue<QString>());

        if(argVerbosity.wasParsed()){
            logger::setVerbosityLevel(argVerbosity.getOption());
        } else {
            logger::setVerbosityLevel(sets.verbosity());
        }
        if(sets.logToFile()){
            logger::enableLogToFile(app::WBMD);
        }

        int parallelism = sets.parallelism();
        if(argParallelism.wasParsed()){
            parallelism = argParallelism.getValue<int>();
            if(parallelism < 1){
                throw ExcOptArgParse(qtr("%1 must be at least 1").arg(argParallelism.name()));
            }
        }

        const auto & rest = parser.rest();
        if(rest.len == 0){
            QIErr() << qtr("No command specified. Show help with --help");
            cpp_exit(1);
        }
        const QString cmd(rest.argv[0]);
        if(argcontrol_archive::isArchiveCmd(cmd)){
            argcontrol_archive::parse(cmd, rest.len - 1, rest.argv + 1, parallelism);
        }
        if(argcontrol_tweets::isTweetsCmd(cmd)){
            argcontrol_tweets::parse(cmd, rest.len - 1, rest.argv + 1);
        }
        QIErr() << qtr("Invalid command: %1.\n"
                       "Show help with --help").arg(cmd);

    } catch (const ExcOptArgParse & ex) {
        QIErr() << qtr("Commandline seems to be erroneous:")
                << ex.descrip();
    } catch(const qsimplecfg::ExcCfg & ex){
        logCritical << qtr("Failed to load config file: ") << ex.descrip();
    } catch (const QExcIo& ex){
        logCritical << qtr("IO-operation failed: ") << ex.descrip();
    } catch (const QExcCommon& ex){
        logCritical << ex.descrip();
    }
    cpp_exit(1);
}


int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    try {
        wbmd_main(argc, argv);
    } catch (const ExcCppExit& e) {
        return e.ret();
    }
}
