//=============================================================================================================
/**
 * @file     gifti_coord_system.h
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
 * @brief    GiftiCoordSystem class declaration.
 *
 */

#ifndef GIFTI_COORD_SYSTEM_H
#define GIFTI_COORD_SYSTEM_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"
#include "surfnorm_types.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>

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
 * GIFTI <CoordinateSystemTransformMatrix>: the space the array data is in, the space the recorded
 * xform maps it to, and the xform itself. The xform is provenance only; nothing in this library applies it.
 *
 * @brief Coordinate system record of a GIFTI data array.
 */
class SURFNORMSHARED_EXPORT GiftiCoordSystem
{
public:
    //=========================================================================================================
    /**
     * Constructs an UNKNOWN -> UNKNOWN record with identity xform.
     */
    GiftiCoordSystem();

    //=========================================================================================================
    /**
     * Constructs a record from space codes and xform.
     *
     * @param[in] dataSpace         NIFTI_XFORM_* code of the data.
     * @param[in] transformedSpace  NIFTI_XFORM_* code the xform maps to.
     * @param[in] xform             The recorded 4x4 transform.
     */
    GiftiCoordSystem(int dataSpace, int transformedSpace, const AffineTransform& xform = AffineTransform::Identity());

    //=========================================================================================================
    /**
     * Maps a NIFTI_XFORM_* name to its code.
     *
     * @param[in]  name  Space name, e.g. "NIFTI_XFORM_TALAIRACH".
     * @param[out] ok    Set to false if the name is unknown.
     *
     * @return The code, NIFTI_XFORM_UNKNOWN when unknown.
     */
    static int spaceFromName(const QString& name, bool* ok = nullptr);

    //=========================================================================================================
    /**
     * Maps a NIFTI_XFORM_* code to its name.
     *
     * @param[in] code  Space code.
     *
     * @return The name, "NIFTI_XFORM_UNKNOWN" for codes out of range.
     */
    static QString spaceName(int code);

    int dataSpace;                                          /**< NIFTI_XFORM_* code of the stored coordinates. */
    int transformedSpace;                                   /**< NIFTI_XFORM_* code reached by applying xform. */
    Eigen::Matrix<double, 4, 4, Eigen::DontAlign> xform;   /**< Recorded transform, row-major MatrixData in the file. */
};

//=============================================================================================================

inline bool operator== (const GiftiCoordSystem& a, const GiftiCoordSystem& b)
{
    return a.dataSpace == b.dataSpace
           && a.transformedSpace == b.transformedSpace
           && a.xform == b.xform;
}

} // namespace SURFNORMLIB

#endif // GIFTI_COORD_SYSTEM_H
