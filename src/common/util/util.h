#pragma once

#ifndef qtr
#define qtr QObject::tr
#endif

#include <QtGlobal>
#include <QObject>
#include <QVariant>
#include <QString>

#include "exccommon.h"


#define DISABLE_MOVE(Class) \
    Class(const Class &&) Q_DECL_EQ_DELETE;\
    Class &operator=(Class &&) Q_DECL_EQ_DELETE;

#define DEFAULT_MOVE(Class) \
    Class(Class &&) noexcept Q_DECL_EQ_DEFAULT;\
    Class &operator=(Class &&) noexcept Q_DECL_EQ_DEFAULT ;


QString argvToQStr(int argc, char * const argv[]);

QString expandHome(const QString& path);

QString pathJoinFilename(const QString& path, const QString& filename);


class ExcQVariantConvert : public QExcCommon
{
public:
     using QExcCommon::QExcCommon;
};

/// Convert src (usually a QString from the command line or the
/// config file) to the target type.
/// @throws ExcQVariantConvert
template<typename T>
T qVariantTo_throw(QVariant src, bool collectStacktrace=true)
{
    const QString srcStr = src.toString();
    if(! src.convert(qMetaTypeId<T>())){
        const char* typeName = QMetaType::typeName(qMetaTypeId<T>());
        throw ExcQVariantConvert(qtr("Failed to convert '%1' to type '%2'")
                                 .arg(srcStr, (typeName == nullptr) ? "unknown" : typeName),
                                 collectStacktrace);
    }
    return src.value<T>();
}
