//=============================================================================================================
/**
 * @file     surface_normalizer_settings.h
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
 * @brief    SurfaceNormalizerSettings class declaration.
 *
 */

#ifndef SURFACE_NORMALIZER_SETTINGS_H
#define SURFACE_NORMALIZER_SETTINGS_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>
#include <QStringList>

//=============================================================================================================
// DEFINE NAMESPACE SURFNORMLIB
//=============================================================================================================

namespace SURFNORMLIB {

//=============================================================================================================
/**
 * Caller supplied parameters of SurfaceNormalizer. Defaults match an LTA registration produced by
 * FreeSurfer's bbregister/mri_coreg, which maps target to source and therefore needs to be inverted.
 *
 * @brief Settings for SurfaceNormalizer.
 */
class SURFNORMSHARED_EXPORT SurfaceNormalizerSettings
{
public:
    //=========================================================================================================
    /**
     * Constructs the default settings: invert, no recentring, current directory, VolGeomC_* keys.
     */
    SurfaceNormalizerSettings();

    //=========================================================================================================
    /**
     * @return Whether applyTransform() inverts the loaded matrix.
     */
    bool invert() const;
    void setInvert(bool invert);

    //=========================================================================================================
    /**
     * @return Whether applyTransform() adds the geometry center offset after transforming.
     */
    bool center() const;
    void setCenter(bool center);

    //=========================================================================================================
    /**
     * @return Directory applyTransform() writes to, empty for the working directory at call time.
     */
    QString outputDirectory() const;
    void setOutputDirectory(const QString& directory);

    //=========================================================================================================
    /**
     * @return Metadata keys holding the R, A and S geometry center offset used by applyTransform().
     *         setOffsetKeys() throws SettingsError unless exactly three keys are given.
     */
    QStringList offsetKeys() const;
    void setOffsetKeys(const QStringList& keys);

    //=========================================================================================================
    /**
     * @return Whether progress is logged at info level instead of debug level.
     */
    bool verbose() const;
    void setVerbose(bool verbose);

private:
    bool        m_bInvert;              /**< Invert the loaded transform. */
    bool        m_bCenter;              /**< Recenter after transforming. */
    QString     m_sOutputDirectory;     /**< Output directory, empty = working directory. */
    QStringList m_lOffsetKeys;          /**< Geometry center keys (R, A, S). */
    bool        m_bVerbose;             /**< Log progress at info level. */
};

} // namespace SURFNORMLIB

#endif // SURFACE_NORMALIZER_SETTINGS_H
