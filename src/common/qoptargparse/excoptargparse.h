#pragma once

#include "exccommon.h"

/// Invalid or missing command line argument.
class ExcOptArgParse : public QExcCommon
{
public:
    explicit ExcOptArgParse(const QString & text) :
        QExcCommon(text, false) {}
};
