#pragma once

#include "exccommon.h"

namespace qsimplecfg {

/// Parse error or invalid value in a config file.
class ExcCfg : public QExcCommon
{
public:
    explicit ExcCfg(const QString & text) :
        QExcCommon(text, false) {}
};

} // namespace qsimplecfg
