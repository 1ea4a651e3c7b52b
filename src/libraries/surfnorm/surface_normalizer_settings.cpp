//=============================================================================================================
/**
 * @file     surface_normalizer_settings.cpp
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
 * @brief    SurfaceNormalizerSettings class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surface_normalizer_settings.h"
#include "surfnorm_types.h"
#include "surfnorm_exceptions.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QDebug>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

SurfaceNormalizerSettings::SurfaceNormalizerSettings()
: m_bInvert(true)
, m_bCenter(false)
, m_lOffsetKeys(QStringList() << META_VOLGEOM_C_R << META_VOLGEOM_C_A << META_VOLGEOM_C_S)
, m_bVerbose(false)
{
}

//=============================================================================================================

bool SurfaceNormalizerSettings::invert() const
{
    return m_bInvert;
}

//=============================================================================================================

void SurfaceNormalizerSettings::setInvert(bool invert)
{
    m_bInvert = invert;
}

//=============================================================================================================

bool SurfaceNormalizerSettings::center() const
{
    return m_bCenter;
}

//=============================================================================================================

void SurfaceNormalizerSettings::setCenter(bool center)
{
    m_bCenter = center;
}

//=============================================================================================================

QString SurfaceNormalizerSettings::outputDirectory() const
{
    return m_sOutputDirectory;
}

//=============================================================================================================

void SurfaceNormalizerSettings::setOutputDirectory(const QString& directory)
{
    m_sOutputDirectory = directory;
}

//=============================================================================================================

QStringList SurfaceNormalizerSettings::offsetKeys() const
{
    return m_lOffsetKeys;
}

//=============================================================================================================

void SurfaceNormalizerSettings::setOffsetKeys(const QStringList& keys)
{
    if (keys.size() != 3) {
        qCritical() << "SurfaceNormalizerSettings::setOffsetKeys - Expected 3 offset keys, got" << keys;
        throw SettingsError(QString("Expected 3 geometry center keys (R, A, S), got %1").arg(keys.size()));
    }
    m_lOffsetKeys = keys;
}

//=============================================================================================================

bool SurfaceNormalizerSettings::verbose() const
{
    return m_bVerbose;
}

//=============================================================================================================

void SurfaceNormalizerSettings::setVerbose(bool verbose)
{
    m_bVerbose = verbose;
}
