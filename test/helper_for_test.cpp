#include <QStandardPaths>
#include <QBuffer>
#include <QDir>
#include <QTextStream>

#include "helper_for_test.h"
#include "digest.h"
#include "util.h"
#include "exccommon.h"
#include "qfilethrow.h"

namespace  {

const QList<QStandardPaths::StandardLocation>& locations(){
    static const QList<QStandardPaths::StandardLocation> locs = {
        QStandardPaths::ConfigLocation,
        QStandardPaths::GenericConfigLocation,
        QStandardPaths::DataLocation,
        QStandardPaths::GenericDataLocation,
        QStandardPaths::CacheLocation};
    return locs;
}


} //  namespace

/// Create the application directories. QStandardPaths must be in
/// test mode, so application stuff is saved somewhere else.
void testhelper::setupPaths()
{
    for(const auto& l : locations()){
        const QString path = QStandardPaths::writableLocation(l);
        QDir d(path);
        if( ! d.mkpath(path)){
            throw QExcIo(QString("Failed to create %1").arg(path));
        }
    }
}


void testhelper::deletePaths()
{
    if(! QStandardPaths::isTestModeEnabled()){
        throw QExcProgramming(QString(__func__) + " called while test mode disabled");
    }
    for(const auto& l : locations()){
        const QString path = QStandardPaths::writableLocation(l);
        QDir d(path);
        d.removeRecursively();
    }
}


std::shared_ptr<QTemporaryDir> testhelper::mkAutoDelTmpDir()
{
    auto pDir = std::make_shared<QTemporaryDir>();
    if (! pDir->isValid()) {
         throw QExcIo("Failed to mk temp dir");
    }
    pDir->setAutoRemove(true);
    return pDir;
}

void testhelper::writeStringToFile(const QString &filepath, const QString &str)
{
    QFileThrow f(filepath);
    f.open(QFile::WriteOnly | QFile::Text);

    QTextStream stream(&f);
    stream.setCodec("UTF-8");
    stream << str;
}

void testhelper::writeBytesToFile(const QString &filepath, const QByteArray &bytes)
{
    QFileThrow f(filepath);
    f.open(QFile::WriteOnly);
    f.write(bytes);
}

/// Write repeated string pattern of len to the file at path
void testhelper::writeStuffToFile(const QString &fpath, int len){
    const QByteArray stuff("ABCDEFGHIJKLMNOPQRSTUVWXYZ");
    QFileThrow f(fpath);
    f.open(QFile::WriteOnly | QFile::Text);
    for(int i=0; i < len / stuff.size(); i++){
        f.write(stuff);
    }
    int rest = len % stuff.size();
    if(rest){
        auto stuffrest = QByteArray::fromRawData(stuff, rest);
        f.write(stuffrest);
    }

}

QString testhelper::readStringFromFile(const QString &fpath)
{
    QFileThrow f(fpath);
    f.open(QFile::ReadOnly | QFile::Text);

    QTextStream stream(&f);
    stream.setCodec("UTF-8");
    return stream.readAll();
}

QByteArray testhelper::readBytesFromFile(const QString &fpath)
{
    QFileThrow f(fpath);
    f.open(QFile::ReadOnly);
    return f.readAll();
}

QByteArray testhelper::gzipBytes(const QByteArray &content)
{
    QBuffer in;
    in.setData(content);
    in.open(QBuffer::ReadOnly);
    QBuffer out;
    out.open(QBuffer::WriteOnly);
    digest::gzip(in, out);
    return out.data();
}
