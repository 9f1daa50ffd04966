#pragma once

#include <QString>
#include <QStringList>
#include <QPair>
#include <QVector>
#include <tsl/ordered_map.h>

#include "section.h"

class QTextStream;
class CfgTest;

namespace qsimplecfg {

/// Section name and the keys of it the application never requested
typedef QVector<QPair<QString, QStringList> > SectionKeys;


/// Parser for the ini-like config file of wbmd:
///   # comment
///   [section]
///   key = value
///   multi = '''line one
///   line two'''
/// Comments are ignored when parsing and re-generated on store().
/// Sections and keys keep their order.
class Cfg
{
public:
    typedef tsl::ordered_map<QString, Section_Ptr> SectionHash;

    void parse(const QString& filepath);
    void store();

    Section_Ptr operator[](const QString &sectionName);

    void setInitialComments(const QString &comments);

    SectionKeys unknownKeys() const;

private:
    friend class ::CfgTest;

    void parse(QTextStream *in);

    void handleKeyValue(const QString &line,
                        int* pLineNumber,
                        QTextStream* stream,
                        Section* section);

    static void createDirsToFilename(const QString& filename);
    static void writeComments(QTextStream& stream, const QString& comments);
    static QString quoteMultiLine(const QString& val, const QString &linePrefix);

    SectionHash m_parsedSections;
    SectionHash m_sections; // requested via operator[]
    QString m_initialComments;
    QString m_filepath;
};

} // namespace qsimplecfg
