#pragma once

#include <QtGlobal>
#include <QString>

#if QT_VERSION < QT_VERSION_CHECK(5, 14, 0)
namespace Qt
{
    using SplitBehavior = QString::SplitBehavior;
    const SplitBehavior SkipEmptyParts = SplitBehavior::SkipEmptyParts;
    const SplitBehavior KeepEmptyParts = SplitBehavior::KeepEmptyParts;
}
#endif
