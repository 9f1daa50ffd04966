#include <utility>

#include "qoptarg.h"
#include "exccommon.h"


/// @param shortName e.g. d for -d. May be empty.
/// @param name e.g. dir for --dir
/// @param hasValue false for a flag like --recreate
QOptArg::QOptArg(const QString &shortName,
                 const QString &name,
                 QString description,
                 bool hasValue) :
    m_name("--" + name),
    m_description(std::move(description)),
    m_hasValue(hasValue),
    m_required(false),
    m_parsed(false),
    m_value(nullptr)
{
    if(name.isEmpty() || name.startsWith('-')){
        throw QExcProgramming(qtr("Bad option name '%1'").arg(name));
    }
    if(shortName.startsWith('-')){
        throw QExcProgramming(qtr("Bad short option name '%1'").arg(shortName));
    }
    if(! shortName.isEmpty()){
        m_shortName = '-' + shortName;
    }
}

const QString &QOptArg::shortName() const
{
    return m_shortName;
}

/// @return the long name including the leading --
const QString& QOptArg::name() const
{
    return m_name;
}

const QString& QOptArg::description() const
{
    return m_description;
}

bool QOptArg::hasValue() const
{
    return m_hasValue;
}

/// A required option missing on the command line makes
/// QOptArgParse::parse throw.
void QOptArg::setRequired(bool required)
{
    m_required = required;
}

bool QOptArg::isRequired() const
{
    return m_required;
}

void QOptArg::setAllowedOptions(const QStringList &options)
{
    if(! m_hasValue){
        throwValueOfFlag(__func__);
    }
    m_allowedOptions = options;
}

const QStringList& QOptArg::allowedOptions() const
{
    return m_allowedOptions;
}

bool QOptArg::wasParsed() const
{
    return m_parsed;
}

/// @return the parsed value, which must be one of the allowed options.
/// @throws ExcOptArgParse
QString QOptArg::getOption(const QString &defaultValue) const
{
    if(m_allowedOptions.isEmpty()){
        throw QExcProgramming(qtr("%1 called without allowed options for %2")
                              .arg(__func__, m_name));
    }
    const QString val = getValue<QString>(defaultValue);
    if(m_value != nullptr && ! m_allowedOptions.contains(val)){
        throw ExcOptArgParse(qtr("'%1' is not a supported option for %2. Use one of %3")
                             .arg(val, m_name, m_allowedOptions.join(", ")));
    }
    return val;
}

void QOptArg::markParsed(const char *value)
{
    m_parsed = true;
    m_value = value;
}

void QOptArg::reset()
{
    m_parsed = false;
    m_value = nullptr;
}

void QOptArg::throwValueOfFlag(const char *functionname) const
{
    throw QExcProgramming(qtr("%1() called for %2, which is a flag")
                          .arg(functionname, m_name));
}
