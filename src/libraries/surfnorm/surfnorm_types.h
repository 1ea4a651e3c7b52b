//=============================================================================================================
/**
 * @file     surfnorm_types.h
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
 * @brief    SurfNorm type definitions and constants.
 *
 *           GIFTI and NIfTI codes used by the surface container, following the GIFTI 1.0 format
 *           specification (https://www.nitrc.org/projects/gifti/) and nifti1.h.
 *
 *           Also holds the reserved metadata keys written by FreeSurfer's mris_convert.
 *
 */

#ifndef SURFNORM_TYPES_H
#define SURFNORM_TYPES_H

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QLatin1String>

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
 * Homogeneous 4x4 affine map (rotation/scale/shear, translation in the last column).
 */
typedef Eigen::Matrix4d AffineTransform;

//=============================================================================================================
/**
 * @name NIfTI Data Types
 *
 * Values of the GIFTI DataType attribute (nifti1.h NIFTI_TYPE_*).
 *
 * @{
 */

constexpr int NIFTI_TYPE_UINT8      = 2;
constexpr int NIFTI_TYPE_INT16      = 4;
constexpr int NIFTI_TYPE_INT32      = 8;
constexpr int NIFTI_TYPE_FLOAT32    = 16;
constexpr int NIFTI_TYPE_FLOAT64    = 64;
constexpr int NIFTI_TYPE_INT8       = 256;
constexpr int NIFTI_TYPE_UINT16     = 512;
constexpr int NIFTI_TYPE_UINT32     = 768;

/** @} */

//=============================================================================================================
/**
 * @name NIfTI Coordinate Spaces
 *
 * Values of the GIFTI DataSpace / TransformedSpace elements (nifti1.h NIFTI_XFORM_*).
 *
 * @{
 */

constexpr int NIFTI_XFORM_UNKNOWN        = 0;
constexpr int NIFTI_XFORM_SCANNER_ANAT   = 1;
constexpr int NIFTI_XFORM_ALIGNED_ANAT   = 2;
constexpr int NIFTI_XFORM_TALAIRACH      = 3;
constexpr int NIFTI_XFORM_MNI_152        = 4;

/** @} */

//=============================================================================================================
/**
 * @name GIFTI Intents
 * @{
 */

const QLatin1String GIFTI_INTENT_POINTSET("NIFTI_INTENT_POINTSET");     /**< Vertex coordinates, N x 3. */
const QLatin1String GIFTI_INTENT_TRIANGLE("NIFTI_INTENT_TRIANGLE");     /**< Face vertex indices, M x 3. */

/** @} */

//=============================================================================================================
/**
 * @name Reserved Metadata Keys
 * @{
 */

const QLatin1String META_VOLGEOM_C_R("VolGeomC_R");     /**< Volume geometry center, R axis. */
const QLatin1String META_VOLGEOM_C_A("VolGeomC_A");     /**< Volume geometry center, A axis. */
const QLatin1String META_VOLGEOM_C_S("VolGeomC_S");     /**< Volume geometry center, S axis. */

const QLatin1String META_ANATOMICAL_STRUCTURE_SECONDARY("AnatomicalStructureSecondary");
const QLatin1String META_GEOMETRIC_TYPE("GeometricType");

const QLatin1String META_VALUE_MIDTHICKNESS("MidThickness");
const QLatin1String META_VALUE_ANATOMICAL("Anatomical");

/** Value written in place of a consumed offset ("%f" of 0.0). */
const QLatin1String META_ZERO_OFFSET("0.000000");

/** @} */

//=============================================================================================================
/**
 * @name Transform File Extensions
 * @{
 */

const QLatin1String TRANSFORM_EXT_PLAIN_MATRIX(".mat");     /**< FSL-style 4x4 plain text matrix. */
const QLatin1String TRANSFORM_EXT_LTA(".lta");              /**< FreeSurfer linear transform array. */

/** Line that opens the 4x4 matrix block of an LTA file (1 transform, 4 rows, 4 columns). */
const QLatin1String LTA_MATRIX_MARKER("1 4 4");

/** @} */

/** Suffix that replaces the extension of a surface written into target space. */
const QLatin1String TARGET_SURFACE_SUFFIX("_target.surf.gii");

} // namespace SURFNORMLIB

#endif // SURFNORM_TYPES_H
