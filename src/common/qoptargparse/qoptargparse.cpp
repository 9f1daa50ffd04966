#include "qoptargparse.h"
#include "excoptargparse.h"
#include "qoutstream.h"
#include "cpp_exit.h"


void QOptArgParse::addArg(QOptArg *arg)
{
    if(find(arg->name()) != nullptr ||
            (! arg->shortName().isEmpty() && find(arg->shortName()) != nullptr)){
        throw QExcProgramming(qtr("Option %1 added twice").arg(arg->name()));
    }
    m_args.insert({arg->name(), arg});
    if(! arg->shortName().isEmpty()){
        m_argsShort.insert({arg->shortName(), arg});
    }
}

/// Parse argv, which must not contain the program (or command) name.
/// -h or --help as first argument print the help and EXIT.
/// @throws ExcOptArgParse
void QOptArgParse::parse(int argc, char *argv[])
{
    m_rest = Rest();
    for(auto& nameArg : m_args){
        nameArg.second->reset();
    }

    if(argc > 0){
        const QByteArray first(argv[0]);
        if(first == "-h" || first == "--help"){
            printHelp();
            cpp_exit(0);
        }
    }

    int i = 0;
    for(; i < argc; ++i){
        QOptArg* arg = find(argv[i]);
        if(arg == nullptr){
            break;
        }
        if(arg->wasParsed()){
            throw ExcOptArgParse(qtr("%1 was passed multiple times").arg(arg->name()));
        }
        if(! arg->hasValue()){
            arg->markParsed(nullptr);
            continue;
        }
        if(++i >= argc){
            throw ExcOptArgParse(qtr("Missing value for %1").arg(arg->name()));
        }
        if(argv[i][0] == '\0'){
            throw ExcOptArgParse(qtr("%1 has an empty value").arg(arg->name()));
        }
        arg->markParsed(argv[i]);
    }
    if(i < argc){
        m_rest.argv = &argv[i];
        m_rest.len = argc - i;
    }

    for(const auto& nameArg : m_args){
        const QOptArg* arg = nameArg.second;
        if(arg->isRequired() && ! arg->wasParsed()){
            throw ExcOptArgParse(qtr("Missing required argument %1").arg(arg->name()));
        }
    }
}

const QOptArgParse::Rest &QOptArgParse::rest() const
{
    return m_rest;
}

void QOptArgParse::setHelpIntroduction(const QString &txt)
{
    m_helpIntroduction = txt;
}

void QOptArgParse::printHelp() const
{
    QOut s;
    s << m_helpIntroduction
      << "\n-h, --help\n      " << qtr("Print this help and exit") << "\n";

    for(const auto &nameArg : m_args){
        const QOptArg* arg = nameArg.second;
        if(! arg->shortName().isEmpty()){
            s << arg->shortName() << ", ";
        }
        s << arg->name();
        if(arg->hasValue()){
            if(arg->allowedOptions().isEmpty()){
                s << " " << arg->name().mid(2).toUpper();
            } else {
                s << " " << arg->allowedOptions().join('|');
            }
        }
        if(arg->isRequired()){
            s << " (" << qtr("required") << ")";
        }
        s << "\n      " << arg->description() << "\n";
    }
}

/// @return the option matching a long (--dir) or short (-d) name or nullptr
QOptArg *QOptArgParse::find(const QString &argStr) const
{
    const auto& args = (argStr.startsWith("--")) ? m_args : m_argsShort;
    auto it = args.find(argStr);
    return (it == args.end()) ? nullptr : it->second;
}
