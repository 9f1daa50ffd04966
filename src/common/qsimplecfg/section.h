#pragma once

#include <memory>

#include <QString>
#include <QStringList>
#include <QVariant>
#include <tsl/ordered_map.h>

#include "exccfg.h"
#include "util.h"


namespace qsimplecfg {

/// A section of key = value pairs, in file order. Keys the
/// application requests but the file lacks are kept as well, so
/// Cfg::store can write their defaults (by default as comment).
class Section
{
public:
    explicit Section(QString sectionName);

    template <typename T>
    T getValue(const QString & key, const T& defaultValue=T(),
               bool writeDefault=false);

    void setComments(const QString &comments);
    const QString & comments() const;

    const QString &sectionName() const;

    QStringList unrequestedKeys() const;

public:
    ~Section() = default;
    Q_DISABLE_COPY(Section)
    DISABLE_MOVE(Section)

private:
    struct Entry {
        QString value;
        QString defaultValue;
        bool inFile {false};
        bool requested {false};
        bool writeDefault {false};
    };
    typedef tsl::ordered_map<QString, Entry> EntryMap;

    friend class Cfg;
    void addParsed(const QString & key, const QString& value);
    const EntryMap& entries() const;

    const Entry& request(const QString& key, const QString& defaultValue,
                         bool writeDefault);

    QString m_comments;
    EntryMap m_entries;
    QString m_sectionName;
};

typedef std::shared_ptr<Section> Section_Ptr;


/// Convert the value of key to T. An absent or empty value yields
/// defaultValue, which must be convertible to QString.
/// @param writeDefault: if the file lacks the key, Cfg::store writes
///                      the default uncommented.
/// @throws ExcCfg
template <typename T>
T Section::getValue(const QString & key, const T& defaultValue,
                    bool writeDefault){
    const Entry& e = request(key, QVariant::fromValue(defaultValue).toString(),
                             writeDefault);
    if(e.value.isEmpty()){
        return defaultValue;
    }
    try {
        return qVariantTo_throw<T>(e.value, false);
    } catch (const ExcQVariantConvert& ex) {
        throw ExcCfg( qtr("%1 (key %2) in section %3")
                      .arg(ex.descrip(), key, m_sectionName));
    }
}

} // namespace qsimplecfg
