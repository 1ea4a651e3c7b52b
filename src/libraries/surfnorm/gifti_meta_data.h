//=============================================================================================================
/**
 * @file     gifti_meta_data.h
 * @author   SurfNorm authors
 * @since    0.1.0
 * @date     October, 2026
 *
 * @section  LICENSE
 *
 * Copyright (C) 2026, SurfNorm authors. All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without modification, are permitted provided that
 * the following conditions are met:
 *     * Redistributions of source code must retain the above copyright notice, this list of conditions and the
 *       following disclaimer.
 *     * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and
 *       the following disclaimer in the documentation and/or other materials provided with the distribution.
 *     * Neither the name of SurfNorm authors nor the names of its contributors may be used
 *       to endorse or promote products derived from this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED
 * WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT,
 * INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
 * HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 *
 *
 * @brief    GiftiMetaData class declaration.
 *
 */

#ifndef GIFTI_META_DATA_H
#define GIFTI_META_DATA_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>
#include <QVector>

//=============================================================================================================
// DEFINE NAMESPACE SURFNORMLIB
//=============================================================================================================

namespace SURFNORMLIB {

//=============================================================================================================
/**
 * Single GIFTI <MD> entry.
 *
 * @brief Name/value metadata pair.
 */
struct SURFNORMSHARED_EXPORT GiftiNVPair
{
    QString name;       /**< Metadata key. */
    QString value;      /**< Metadata value, always a string. */

    GiftiNVPair() {}
    GiftiNVPair(const QString& n, const QString& v)
    : name(n)
    , value(v)
    {}
};

inline bool operator== (const GiftiNVPair& a, const GiftiNVPair& b)
{
    return a.name == b.name && a.value == b.value;
}

//=============================================================================================================
/**
 * Ordered GIFTI <MetaData> list.
 *
 * Entries keep the order they were read or inserted in; positional insertion is part of the
 * contract, so this is a list and not a map. Duplicate names are allowed, lookups act on the first match.
 *
 * @brief Ordered name/value metadata of a GIFTI file or data array.
 */
class SURFNORMSHARED_EXPORT GiftiMetaData
{
public:
    //=========================================================================================================
    /**
     * Default constructor, empty list.
     */
    GiftiMetaData();

    //=========================================================================================================
    /**
     * @return Number of entries.
     */
    inline int size() const
    {
        return static_cast<int>(m_entries.size());
    }

    //=========================================================================================================
    /**
     * @return True if there are no entries.
     */
    inline bool isEmpty() const
    {
        return m_entries.isEmpty();
    }

    //=========================================================================================================
    /**
     * @param[in] i  Position, 0 <= i < size().
     *
     * @return The entry at position i.
     */
    inline const GiftiNVPair& at(int i) const
    {
        return m_entries.at(i);
    }

    //=========================================================================================================
    /**
     * @return All entries in file order.
     */
    inline const QVector<GiftiNVPair>& entries() const
    {
        return m_entries;
    }

    //=========================================================================================================
    /**
     * Returns the position of the first entry called name.
     *
     * @param[in] name  Key to look up.
     *
     * @return The position, -1 if absent.
     */
    int indexOf(const QString& name) const;

    //=========================================================================================================
    /**
     * Returns the position of the last entry called name. Dictionary-style readers keep the last of
     * several entries with the same name.
     *
     * @param[in] name  Key to look up.
     *
     * @return The position, -1 if absent.
     */
    int lastIndexOf(const QString& name) const;

    //=========================================================================================================
    /**
     * @param[in] name  Key to look up.
     *
     * @return True if an entry called name exists.
     */
    bool contains(const QString& name) const;

    //=========================================================================================================
    /**
     * Returns the value of the first entry called name.
     *
     * @param[in] name          Key to look up.
     * @param[in] defaultValue  Returned when the key is absent.
     *
     * @return The stored value or defaultValue.
     */
    QString value(const QString& name, const QString& defaultValue = QString()) const;

    //=========================================================================================================
    /**
     * Returns the value of the last entry called name.
     *
     * @param[in] name          Key to look up.
     * @param[in] defaultValue  Returned when the key is absent.
     *
     * @return The stored value or defaultValue.
     */
    QString lastValue(const QString& name, const QString& defaultValue = QString()) const;

    //=========================================================================================================
    /**
     * Replaces the value of the first entry called name in place, or appends a new entry.
     *
     * @param[in] name   Key.
     * @param[in] value  New value.
     */
    void setValue(const QString& name, const QString& value);

    //=========================================================================================================
    /**
     * Replaces the value of every entry called name in place. Nothing is appended.
     *
     * @param[in] name   Key.
     * @param[in] value  New value.
     *
     * @return Number of entries changed.
     */
    int replaceAll(const QString& name, const QString& value);

    //=========================================================================================================
    /**
     * Inserts an entry before position index. The index is clamped to [0, size()], so inserting past
     * the end appends.
     *
     * @param[in] index  Target position.
     * @param[in] name   Key.
     * @param[in] value  Value.
     */
    void insert(int index, const QString& name, const QString& value);

    //=========================================================================================================
    /**
     * Appends an entry without checking for an existing one.
     *
     * @param[in] name   Key.
     * @param[in] value  Value.
     */
    void append(const QString& name, const QString& value);

    //=========================================================================================================
    /**
     * Removes all entries.
     */
    void clear();

    friend bool operator== (const GiftiMetaData& a, const GiftiMetaData& b);

private:
    QVector<GiftiNVPair> m_entries;     /**< Entries in file order. */
};

//=============================================================================================================

inline bool operator== (const GiftiMetaData& a, const GiftiMetaData& b)
{
    return a.m_entries == b.m_entries;
}

} // namespace SURFNORMLIB

#endif // GIFTI_META_DATA_H
