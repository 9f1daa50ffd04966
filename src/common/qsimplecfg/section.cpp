#include <utility>

#include "section.h"

qsimplecfg::Section::Section(QString sectionName) :
    m_sectionName(std::move(sectionName))
{}

void qsimplecfg::Section::setComments(const QString &comments)
{
    m_comments = comments;
}

const QString& qsimplecfg::Section::comments() const
{
    return m_comments;
}

const QString& qsimplecfg::Section::sectionName() const
{
    return m_sectionName;
}

/// @return the keys read from file but never requested via getValue
QStringList qsimplecfg::Section::unrequestedKeys() const
{
    QStringList keys;
    for(const auto& keyEntry : m_entries){
        if(! keyEntry.second.requested){
            keys.push_back(keyEntry.first);
        }
    }
    return keys;
}

void qsimplecfg::Section::addParsed(const QString &key, const QString &value)
{
    Entry& e = m_entries[key];
    e.value = value;
    e.inFile = true;
}

const qsimplecfg::Section::EntryMap &qsimplecfg::Section::entries() const
{
    return m_entries;
}

const qsimplecfg::Section::Entry&
qsimplecfg::Section::request(const QString &key, const QString &defaultValue,
                             bool writeDefault)
{
    Entry& e = m_entries[key];
    e.requested = true;
    e.defaultValue = defaultValue;
    e.writeDefault = writeDefault;
    return e;
}
