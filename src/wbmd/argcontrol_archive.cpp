#include <QStringList>

#include "argcontrol_archive.h"

#include "app.h"
#include "archivestore.h"
#include "cpp_exit.h"
#include "digest.h"
#include "logger.h"
#include "qoptargparse.h"
#include "qoutstream.h"
#include "settings.h"
#include "storepathiterator.h"

namespace  {

const char* CMD_CREATE = "create";
const char* CMD_EXTRACT = "extract";
const char* CMD_LIST = "list";
const char* CMD_DIGESTS = "digests";
const char* CMD_DIGESTS_RAW = "digests-raw";
const char* CMD_ADD_FILE = "add-file";


QOptArg mkArgDir(){
    return QOptArg("d", "dir", qtr("Root directory of the archive. Defaults to %1")
                   .arg(Settings::instance().archiveDir()));
}

QOptArg mkArgPrefix(){
    return QOptArg("", "prefix", qtr("Only consider entries whose digest starts "
                                     "with the given hex-prefix"));
}

void exitOnRest(const QOptArgParse& parser){
    if(parser.rest().len != 0){
        QIErr() << qtr("Invalid parameters passed: %1.\n"
                       "Show help with --help").
                   arg(argvToQStr(parser.rest().len, parser.rest().argv));
        cpp_exit(1);
    }
}

[[noreturn]]
void create(int argc, char *argv[]){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Create an empty archive including its "
                                   "%1 shard directories.").arg(ArchiveStore::SHARD_COUNT) + "\n");
    auto argDir = mkArgDir();
    parser.addArg(&argDir);
    parser.parse(argc, argv);
    exitOnRest(parser);

    auto store = ArchiveStore::create(argDir.getValue<QString>(Settings::instance().archiveDir()));
    logInfo << qtr("Archive ready at %1").arg(store.root());
    cpp_exit(0);
}

[[noreturn]]
void extract(int argc, char *argv[]){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Print the decompressed content of the entry "
                                   "with the given digest:\n"
                                   "%1 %2 [options] DIGEST").arg(app::WBMD, CMD_EXTRACT) + "\n");
    auto argDir = mkArgDir();
    parser.addArg(&argDir);
    parser.parse(argc, argv);
    if(parser.rest().len != 1){
        QIErr() << qtr("Exactly one digest expected. Show help with --help");
        cpp_exit(1);
    }
    const QString digest = digest::normalizeDigest(parser.rest().argv[0]);

    ArchiveStore store(argDir.getValue<QString>(Settings::instance().archiveDir()));
    auto content = store.extract(digest);
    if(content.isNull()){
        logInfo << qtr("No entry for digest %1").arg(digest);
        cpp_exit(0);
    }
    QOut() << content.value();
    cpp_exit(0);
}

[[noreturn]]
void list(int argc, char *argv[]){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Print the digests of all archive entries, one per line.") + "\n");
    auto argDir = mkArgDir();
    parser.addArg(&argDir);
    auto argPrefix = mkArgPrefix();
    parser.addArg(&argPrefix);
    parser.parse(argc, argv);
    exitOnRest(parser);

    ArchiveStore store(argDir.getValue<QString>(Settings::instance().archiveDir()));
    auto paths = store.pathsForPrefix(argPrefix.getValue<QString>());
    int errorCount = 0;
    QOut out;
    while(true){
        try {
            if(! paths->next()){
                break;
            }
            out << paths->value().digest << "\n";
        } catch (const ExcArchiveEntry& ex) {
            logWarning << ex.descrip();
            ++errorCount;
        }
    }
    cpp_exit((errorCount == 0) ? 0 : 1);
}

[[noreturn]]
void digests(int argc, char *argv[], int parallelism){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Re-compute the digests of all archive entries "
                                   "and compare them against their location. Exits "
                                   "with a nonzero value, if any entry is invalid "
                                   "or broken.") + "\n");
    auto argDir = mkArgDir();
    parser.addArg(&argDir);
    auto argPrefix = mkArgPrefix();
    parser.addArg(&argPrefix);
    parser.parse(argc, argv);
    exitOnRest(parser);

    ArchiveStore store(argDir.getValue<QString>(Settings::instance().archiveDir()));
    auto verifier = store.computeDigests(argPrefix.getValue<QString>(), parallelism);
    int valid = 0;
    int invalid = 0;
    int broken = 0;
    while(verifier->next()){
        const DigestCheck& check = verifier->value();
        if(check.isBroken()){
            logCritical << qtr("Error: %1").arg(check.error);
            ++broken;
        } else if(check.isValid()){
            ++valid;
        } else {
            logCritical << qtr("Invalid digest: expected %1, got %2 (%3)")
                           .arg(check.expected, check.actual, check.path);
            ++invalid;
        }
    }
    const QString summary = qtr("Valid: %1; invalid: %2; broken: %3")
            .arg(valid).arg(invalid).arg(broken);
    logInfo << summary;
    QOut() << summary << "\n";
    cpp_exit((invalid == 0 && broken == 0) ? 0 : 1);
}

[[noreturn]]
void digestsRaw(int argc, char *argv[]){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Print name,digest for every gzip file directly "
                                   "within the given directory. The digest is computed "
                                   "from the decompressed content.") + "\n");
    QOptArg argDir("d", "dir", qtr("The directory to digest"));
    argDir.setRequired(true);
    parser.addArg(&argDir);
    parser.parse(argc, argv);
    exitOnRest(parser);

    int errorCount = 0;
    QOut out;
    for(const RawDigest& raw : ArchiveStore::digestRawDirectory(argDir.getValue<QString>())){
        if(! raw.error.isEmpty()){
            logCritical << qtr("Error: %1").arg(raw.error);
            ++errorCount;
            continue;
        }
        out << raw.name << ',' << raw.digest << "\n";
    }
    cpp_exit((errorCount == 0) ? 0 : 1);
}

[[noreturn]]
void addFile(int argc, char *argv[]){
    QOptArgParse parser;
    parser.setHelpIntroduction(qtr("Compress a file into the archive. If its name "
                                   "is a digest, the content must match it.") + "\n");
    auto argDir = mkArgDir();
    parser.addArg(&argDir);
    QOptArg argInput("i", "input", qtr("The file to add"));
    argInput.setRequired(true);
    parser.addArg(&argInput);
    parser.parse(argc, argv);
    exitOnRest(parser);
    const QString input = argInput.getValue<QString>();

    ArchiveStore store(argDir.getValue<QString>(Settings::instance().archiveDir()));
    const FileLocation loc = store.addFile(input);
    switch (loc.status) {
    case FileLocation::AlreadyPresent:
        logWarning << qtr("File already exists in store: %1").arg(loc.targetPath);
        cpp_exit(0);
    case FileLocation::DigestMismatch:
        logCritical << qtr("File to add has invalid digest (expected: %1; actual: %2): %3")
                       .arg(loc.expectedDigest, loc.digest, input);
        cpp_exit(1);
    case FileLocation::Free:
        break;
    }
    QOut() << input << ',' << loc.targetPath << "\n";
    cpp_exit(0);
}

} // namespace


bool argcontrol_archive::isArchiveCmd(const QString &cmd)
{
    static const QStringList cmds = {CMD_CREATE, CMD_EXTRACT, CMD_LIST,
                                     CMD_DIGESTS, CMD_DIGESTS_RAW, CMD_ADD_FILE};
    return cmds.contains(cmd);
}


void argcontrol_archive::parse(const QString& cmd, int argc, char *argv[], int parallelism)
{
    if(cmd == CMD_CREATE){
        create(argc, argv);
    }
    if(cmd == CMD_EXTRACT){
        extract(argc, argv);
    }
    if(cmd == CMD_LIST){
        list(argc, argv);
    }
    if(cmd == CMD_DIGESTS){
        digests(argc, argv, parallelism);
    }
    if(cmd == CMD_DIGESTS_RAW){
        digestsRaw(argc, argv);
    }
    if(cmd == CMD_ADD_FILE){
        addFile(argc, argv);
    }
    throw QExcProgramming(qtr("Not an archive command: %1").arg(cmd));
}
