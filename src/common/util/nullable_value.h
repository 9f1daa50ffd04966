#pragma once


#include "exccommon.h"


class QExcNullDeref : public QExcCommon
{
public:
    using QExcCommon::QExcCommon;
};


/// A value which may be absent, e.g. a digest not found in
/// the archive or a tweet without parent.
template <class T>
class NullableValue {
public:

    typedef T value_type;

    NullableValue() : m_isNull(true), m_value(){}
    NullableValue(const T& t) : m_isNull(false), m_value(t){}

    const T& value() const {
        if(m_isNull){
            throw QExcNullDeref("Tried to obtain value while it is set to null");
        }
        return m_value;
    }

    T valueOr(const T& other) const {
        return (m_isNull) ? other : m_value;
    }

    void setValue(const T& val){
        m_value = val;
        m_isNull = false;
    }

    bool isNull() const {
        return m_isNull;
    }

    void setNull(){
        m_isNull = true;
    }

    bool operator==(const NullableValue& rhs) const
    {
        if(isNull()){
            return rhs.isNull();
        }
        if( rhs.isNull()){
            return false;
        }
        return value() == rhs.value();
    }

    bool operator!=(const NullableValue& rhs) const
    {
        return ! (*this == rhs);
    }

    NullableValue& operator=(const T& val)
    {
        setValue(val);
        return *this;
    }

protected:
    bool m_isNull;
    T m_value;
};
