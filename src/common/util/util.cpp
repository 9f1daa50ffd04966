#include <QDir>
#include <QStringList>

#include "util.h"


QString argvToQStr(int argc, char * const argv[]){
    QStringList l;
    for(int i=0; i < argc; i++){
        l.push_back(argv[i]);
    }
    return l.join(" ");
}

/// Replace a leading ~ or $HOME by the home directory of the user
QString expandHome(const QString &path)
{
    QString p = path;
    if(p.startsWith("$HOME")){
        p.replace(0, 5, QDir::homePath());
    } else if(p == "~" || p.startsWith("~/")) {
        p.replace(0, 1, QDir::homePath());
    }
    return p;
}

QString pathJoinFilename(const QString &path, const QString &filename)
{
    if(path.endsWith('/')){
        return path + filename;
    }
    return path + '/' + filename;
}
