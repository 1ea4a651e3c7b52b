//=============================================================================================================
/**
 * @file     gifti_meta_data.cpp
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
 * @brief    GiftiMetaData class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "gifti_meta_data.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QtGlobal>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

GiftiMetaData::GiftiMetaData()
{
}

//=============================================================================================================

int GiftiMetaData::indexOf(const QString& name) const
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].name == name) {
            return i;
        }
    }
    return -1;
}

//=============================================================================================================

int GiftiMetaData::lastIndexOf(const QString& name) const
{
    for (int i = static_cast<int>(m_entries.size()) - 1; i >= 0; --i) {
        if (m_entries[i].name == name) {
            return i;
        }
    }
    return -1;
}

//=============================================================================================================

bool GiftiMetaData::contains(const QString& name) const
{
    return indexOf(name) >= 0;
}

//=============================================================================================================

QString GiftiMetaData::value(const QString& name, const QString& defaultValue) const
{
    int idx = indexOf(name);
    return idx >= 0 ? m_entries[idx].value : defaultValue;
}

//=============================================================================================================

QString GiftiMetaData::lastValue(const QString& name, const QString& defaultValue) const
{
    int idx = lastIndexOf(name);
    return idx >= 0 ? m_entries[idx].value : defaultValue;
}

//=============================================================================================================

void GiftiMetaData::setValue(const QString& name, const QString& value)
{
    int idx = indexOf(name);
    if (idx >= 0) {
        m_entries[idx].value = value;
    } else {
        m_entries.append(GiftiNVPair(name, value));
    }
}

//=============================================================================================================

int GiftiMetaData::replaceAll(const QString& name, const QString& value)
{
    int count = 0;
    for (GiftiNVPair& pair : m_entries) {
        if (pair.name == name) {
            pair.value = value;
            ++count;
        }
    }
    return count;
}

//=============================================================================================================

void GiftiMetaData::insert(int index, const QString& name, const QString& value)
{
    index = qBound(0, index, static_cast<int>(m_entries.size()));
    m_entries.insert(index, GiftiNVPair(name, value));
}

//=============================================================================================================

void GiftiMetaData::append(const QString& name, const QString& value)
{
    m_entries.append(GiftiNVPair(name, value));
}

//=============================================================================================================

void GiftiMetaData::clear()
{
    m_entries.clear();
}
