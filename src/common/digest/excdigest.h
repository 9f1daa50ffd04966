#pragma once

#include "exccommon.h"

/// Thrown if a stream is not valid gzip (or cannot be compressed).
class ExcDecompress : public QExcCommon
{
public:
    explicit ExcDecompress(const QString & text) :
        QExcCommon(text, false) {}
};

/// Thrown if decompressed content was expected to be text but is not
/// valid UTF-8.
class ExcDecode : public QExcCommon
{
public:
    explicit ExcDecode(const QString & text) :
        QExcCommon(text, false) {}
};
