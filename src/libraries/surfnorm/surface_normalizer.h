//=============================================================================================================
/**
 * @file     surface_normalizer.h
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
 * @brief    SurfaceNormalizer class declaration.
 *
 *           FreeSurfer records the center of the conformed volume (c_ras) in the point set metadata of
 *           surfaces exported with mris_convert (VolGeomC_R/A/S) and expects readers to add it. Other
 *           packages ignore it. SurfaceNormalizer bakes the offset and, optionally, an affine registration
 *           into the vertex coordinates, so that every consumer sees the same geometry.
 *
 *
 */

#ifndef SURFACE_NORMALIZER_H
#define SURFACE_NORMALIZER_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"
#include "surface_normalizer_settings.h"
#include "gifti_meta_data.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>
#include <QStringList>

//=============================================================================================================
// EIGEN INCLUDES
//=============================================================================================================

#include <Eigen/Core>

//=============================================================================================================
// DEFINE NAMESPACE SURFNORMLIB
//=============================================================================================================

namespace SURFNORMLIB {

//=============================================================================================================
/**
 * Rewrites GIFTI surfaces so that their vertex coordinates need no further correction.
 *
 * Each call reads one surface and at most one transform file and writes one new surface. Nothing is
 * shared between calls, so separate instances or separate calls may run in parallel as long as they
 * write to different output paths. A call either writes the complete output file or throws before
 * anything is written.
 *
 * @brief Normalizes FreeSurfer GIFTI surface coordinates.
 */
class SURFNORMSHARED_EXPORT SurfaceNormalizer
{
public:
    //=========================================================================================================
    /**
     * Constructs the normalizer.
     *
     * @param[in] settings  Parameters of applyTransform() and logging.
     */
    explicit SurfaceNormalizer(const SurfaceNormalizerSettings& settings = SurfaceNormalizerSettings());

    //=========================================================================================================
    /**
     * Recenters a surface with its own geometry center offset and optionally applies an affine:
     *
     *   new = transform * (old + c_ras)
     *
     * Every VolGeomC_R/A/S entry present in the point set metadata is set to "0.000000" afterwards.
     * Surfaces whose file name contains "midthickness" or "graymid" (any case) get
     * AnatomicalStructureSecondary=MidThickness at position 1 and GeometricType=Anatomical at position 2,
     * unless those keys already exist.
     *
     * The output is written to the current working directory under the input's file name.
     *
     * @param[in] inFile         GIFTI surface from FreeSurfer.
     * @param[in] transformFile  Optional .mat or .lta file; empty for identity.
     *
     * @return Absolute path of the written surface.
     */
    QString normalize(const QString& inFile, const QString& transformFile = QString()) const;

    //=========================================================================================================
    /**
     * Moves a surface into the target space of an affine registration:
     *
     *   new = T * old (+ c_ras if center())     with T = transform, or transform^-1 if invert()
     *
     * With center() every entry of the offset keys is set to "0.000000". The point set coordinate system becomes
     * NIFTI_XFORM_ALIGNED_ANAT -> NIFTI_XFORM_ALIGNED_ANAT with identity xform. Vertices and face indices
     * are stored as float32; face set metadata and coordinate systems are dropped.
     *
     * The output is <outputDirectory>/<input name without last extension>_target.surf.gii.
     *
     * @param[in] inFile         GIFTI surface.
     * @param[in] transformFile  .mat or .lta file.
     *
     * @return Absolute path of the written surface.
     */
    QString applyTransform(const QString& inFile, const QString& transformFile) const;

    //=========================================================================================================
    /**
     * @param[in] fileName  Surface file name or path.
     *
     * @return True if the base name marks a mid-thickness surface.
     */
    static bool isMidThickness(const QString& fileName);

    //=========================================================================================================
    /**
     * @param[in] inFile  Input surface path.
     *
     * @return Where normalize() writes: the input file name in the current working directory.
     */
    static QString normalizedFileName(const QString& inFile);

    //=========================================================================================================
    /**
     * @param[in] inFile           Input surface path.
     * @param[in] outputDirectory  Output directory, empty for the current working directory.
     *
     * @return Where applyTransform() writes.
     */
    static QString targetFileName(const QString& inFile, const QString& outputDirectory = QString());

    //=========================================================================================================
    /**
     * @return The settings.
     */
    const SurfaceNormalizerSettings& settings() const;

private:
    //=========================================================================================================
    /**
     * Reads the R, A, S geometry center offset. A key that occurs more than once is read from its last
     * entry.
     *
     * @param[in] meta        Point set metadata.
     * @param[in] keys        The three offset keys.
     * @param[in] required    If false, missing keys count as 0.0.
     * @param[in] sourceName  Name used in error messages.
     *
     * @return The offset. Throws MeshStructureError for missing required keys or non-numeric values.
     */
    static Eigen::Vector3d readOffset(const GiftiMetaData& meta,
                                      const QStringList& keys,
                                      bool required,
                                      const QString& sourceName);

    void logProgress(const QString& message) const;

    SurfaceNormalizerSettings m_settings;   /**< Parameters. */
};

} // namespace SURFNORMLIB

#endif // SURFACE_NORMALIZER_H
