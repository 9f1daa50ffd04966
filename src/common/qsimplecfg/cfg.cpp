#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QTextStream>

#include "cfg.h"
#include "exccfg.h"
#include "util.h"

namespace  {

QString lockPath(const QString& filepath){
    return filepath + "_LOCK";
}

/// @throws ExcCfg
void lockOrThrow(QLockFile& lock, const QString& filepath){
    if(! lock.lock()){
        throw qsimplecfg::ExcCfg(qtr("Failed to obtain lock on %1 (error %2)")
                                 .arg(filepath).arg(int(lock.error())));
    }
}

} // namespace


/// Parse the config file at filepath, which is created, if it does not
/// exist. A file of the same name plus _LOCK is locked meanwhile.
/// Multi-line values keep their inner newlines; the lines are trimmed.
/// @throws ExcCfg
void qsimplecfg::Cfg::parse(const QString &filepath)
{
    m_parsedSections.clear();
    m_sections.clear();
    m_filepath = filepath;

    createDirsToFilename(filepath);
    QLockFile lock(lockPath(filepath));
    lockOrThrow(lock, filepath);

    QFile file(filepath);
    if(! file.open(QIODevice::ReadWrite | QIODevice::Text)){
        throw ExcCfg(qtr("Failed to open %1 - %2").
                     arg(filepath, file.errorString()));
    }

    QTextStream in(&file);
    in.setCodec("UTF-8");
    try{
        parse(&in);
    } catch(ExcCfg & ex){
        ex.setDescrip(ex.descrip() +
                       qtr(". Please correct the file at %1").arg(m_filepath));
        throw;
    }
}

/// Write the requested sections back to the parsed file. Keys the file
/// lacks are written with their default, commented out unless requested
/// with writeDefault. Unknown keys are kept.
/// @throws ExcCfg
void qsimplecfg::Cfg::store()
{
    if(m_filepath.isEmpty()){
        throw QExcProgramming(qtr("%1 called before parse").arg(__func__));
    }
    QLockFile lock(lockPath(m_filepath));
    lockOrThrow(lock, m_filepath);

    QFile file(m_filepath);
    if(! file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)){
        throw ExcCfg(qtr("Failed to open %1 - %2").
                     arg(m_filepath, file.errorString()));
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    writeComments(stream, m_initialComments);
    stream << "\n";

    for(const auto& nameSect : m_sections){
        const Section& sect = *nameSect.second;
        stream << '[' << nameSect.first << "]\n";
        writeComments(stream, sect.comments());

        for(const auto& keyEntry : sect.entries()){
            const Section::Entry& e = keyEntry.second;
            QString linePrefix;
            QString val = e.value;
            if(! e.inFile){
                val = e.defaultValue;
                if(! e.writeDefault){
                    linePrefix = "# ";
                }
            }
            stream << linePrefix << keyEntry.first << " = "
                   << quoteMultiLine(val.trimmed(), linePrefix) << '\n';
        }
        stream << "\n";
    }
    stream.flush();
    if(stream.status() != QTextStream::Ok){
        throw ExcCfg(qtr("Failed to write %1 - %2").arg(m_filepath, file.errorString()));
    }
}

/// @return the section of the given name, which is created, if it was not
/// parsed. Only sections requested this way are stored.
qsimplecfg::Section_Ptr qsimplecfg::Cfg::operator[](const QString &sectionName)
{
    auto it = m_sections.find(sectionName);
    if(it != m_sections.end()){
        return it->second;
    }
    Section_Ptr sect;
    auto parsedIt = m_parsedSections.find(sectionName);
    if(parsedIt == m_parsedSections.end()){
        sect = std::make_shared<Section>(sectionName);
    } else {
        sect = parsedIt->second;
    }
    m_sections[sectionName] = sect;
    return sect;
}

void qsimplecfg::Cfg::setInitialComments(const QString &comments)
{
    m_initialComments = comments;
}

/// @return the keys of all parsed sections which were not requested.
/// A section never requested via operator[] is reported with all keys.
qsimplecfg::SectionKeys qsimplecfg::Cfg::unknownKeys() const
{
    SectionKeys unknown;
    for(const auto& nameSect : m_parsedSections){
        const QStringList keys = nameSect.second->unrequestedKeys();
        if(! keys.isEmpty()){
            unknown.push_back({nameSect.first, keys});
        }
    }
    return unknown;
}


void qsimplecfg::Cfg::parse(QTextStream *in)
{
    Section_Ptr currentSection;
    int currentLine = 0;

    QString lineBuf;
    while (!in->atEnd()) {
        if(! in->readLineInto(&lineBuf)){
            break;
        }
        const QString line = lineBuf.trimmed();
        currentLine++;

        if(line.startsWith('#') || line.isEmpty()){
            // No point in reading comments.
            continue;
        }
        if(line.startsWith('[')){
            if(! line.endsWith(']')){
                throw ExcCfg(qtr("Line %1 - %2: section start [ without closing end ] detected").
                             arg(currentLine).arg(line));
            }
            const QString name = line.mid(1, line.size() - 2).trimmed();
            if(name.isEmpty()){
                throw ExcCfg(qtr("Line %1 - %2: empty section detected").
                             arg(currentLine).arg(line));
            }
            auto it = m_parsedSections.find(name);
            if(it == m_parsedSections.end()){
                currentSection = std::make_shared<Section>(name);
                m_parsedSections[name] = currentSection;
            } else {
                currentSection = it->second;
            }
            continue;
        }
        if(currentSection == nullptr){
            throw ExcCfg(qtr("Line %1 - %2: Content before first section").
                         arg(currentLine).arg(line));
        }
        handleKeyValue(line, &currentLine, in, currentSection.get());
    }
}


void qsimplecfg::Cfg::handleKeyValue(const QString &line, int *pLineNumber,
                                     QTextStream *stream, Section *section)
{
    const int equalIdx = line.indexOf('=');
    if(equalIdx == -1){
        throw ExcCfg(qtr("Line %1 - %2: Unexpected content (missing =)").
                     arg(*pLineNumber).arg(line));
    }

    const QString key = line.left(equalIdx).trimmed();
    QString value = line.mid(equalIdx + 1).trimmed();
    if(key.isEmpty()){
        throw ExcCfg(qtr("Line %1 - %2: empty key").arg(*pLineNumber).arg(line));
    }
    if(! value.startsWith("'''")){
        // simple case: not a multi line string
        section->addParsed(key, value);
        return;
    }

    // ignore leading '''
    value = value.mid(3);
    // still possible that string ends in same line:
    int tripleIdx = value.indexOf("'''");
    if(tripleIdx != -1){
        if(tripleIdx != value.length()-3){
            throw ExcCfg(qtr("Line %1 - %2: content after closing triple quotes '''").
                         arg(*pLineNumber).arg(line));
        }
        section->addParsed(key, value.left(value.size() - 3));
        return;
    }

    QString keyValBuf = value;
    QString readBuf;

    // multi line string: keep going through file until the next '''
    const int startingLine = *pLineNumber;
    while (!stream->atEnd()) {
        if(! stream->readLineInto(&readBuf)){
            break;
        }
        (*pLineNumber)++;
        const QString currentLine = readBuf.trimmed();

        tripleIdx = currentLine.indexOf("'''");
        if(tripleIdx == -1){
            keyValBuf += '\n' + currentLine;
            continue;
        }
        if(tripleIdx != currentLine.length()-3){
            throw ExcCfg(qtr("Line %1 - %2: content after closing triple quotes '''").
                         arg(*pLineNumber).arg(currentLine));
        }
        if(tripleIdx != 0){
            keyValBuf += '\n' + currentLine.left(currentLine.size() - 3);
        }
        section->addParsed(key, keyValBuf.trimmed());
        return;
    }
    throw ExcCfg(qtr("Line %1 - %2: missing closing triple quotes '''").
                 arg(startingLine).arg(line));
}

/// @throws ExcCfg
void qsimplecfg::Cfg::createDirsToFilename(const QString &filename)
{
    QFileInfo fileInfo(filename);
    QDir dir;
    if(! dir.mkpath(fileInfo.absolutePath())){
        throw ExcCfg(qtr("Failed to create directories for path %1")
                     .arg(fileInfo.absolutePath()) );
    }
}

void qsimplecfg::Cfg::writeComments(QTextStream &stream, const QString &comments)
{
    if(comments.isEmpty()){
        return;
    }
    for(const QString& line : comments.split('\n')){
        if(line.isEmpty()){
            continue;
        }
        stream << "# " << line << '\n';
    }
}

/// Wrap a value containing newlines in triple quotes. A commented out
/// value gets linePrefix on each of its lines.
QString qsimplecfg::Cfg::quoteMultiLine(const QString &val, const QString& linePrefix)
{
    if(! val.contains('\n')){
        return val;
    }
    QString quoted = "'''\n" + val + "\n'''";
    if(! linePrefix.isEmpty()){
        quoted.replace('\n', "\n" + linePrefix);
    }
    return quoted;
}
