#pragma once

#include <QString>
#include <QStringList>

#include "util.h"
#include "excoptargparse.h"

/// A command line option of a wbmd (sub)command. It is either a flag
/// or takes exactly one value, which is converted lazily by getValue().
class QOptArg {
public:
    QOptArg(const QString& shortName, const QString & name,
            QString description,
            bool hasValue=true );

    const QString& shortName() const;
    const QString& name() const;
    const QString& description() const;
    bool hasValue() const;

    void setRequired(bool required);
    bool isRequired() const;

    void setAllowedOptions(const QStringList& options);
    const QStringList& allowedOptions() const;

    // after parse:
    bool wasParsed() const;

    template <typename T>
    T getValue(const T& defaultValue=T()) const;

    QString getOption(const QString& defaultValue=QString()) const;

private:
    friend class QOptArgParse;
    void markParsed(const char* value);
    void reset();

    [[noreturn]]
    void throwValueOfFlag(const char* functionname) const;

    QString m_shortName;
    QString m_name;
    QString m_description;
    bool m_hasValue;
    bool m_required;
    bool m_parsed;
    const char* m_value;
    QStringList m_allowedOptions;
};


/// Convert the parsed value to the target type. If the option was not
/// passed, defaultValue is returned.
/// @throws ExcOptArgParse
template <typename T>
T QOptArg::getValue(const T& defaultValue) const{
    if(! m_hasValue){
        throwValueOfFlag(__func__);
    }
    if(m_value == nullptr){
        return defaultValue;
    }
    try {
        return qVariantTo_throw<T>(QString(m_value), false);
    } catch (const ExcQVariantConvert& ex) {
        throw ExcOptArgParse(qtr("%1 (argument %2)").arg(ex.descrip(), m_name));
    }
}
