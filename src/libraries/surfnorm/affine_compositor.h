//=============================================================================================================
/**
 * @file     affine_compositor.h
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
 * @brief    AffineCompositor class declaration.
 *
 */

#ifndef AFFINE_COMPOSITOR_H
#define AFFINE_COMPOSITOR_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"
#include "surfnorm_types.h"

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
 * Numeric operations on 4x4 homogeneous affines. No I/O.
 *
 * @brief Composition, inversion and application of affine transforms.
 */
class SURFNORMSHARED_EXPORT AffineCompositor
{
public:
    //=========================================================================================================
    /**
     * Inverts an affine.
     *
     * @param[in] m  The matrix to invert.
     *
     * @return m^-1. Throws SingularMatrixError if m is not invertible.
     */
    static AffineTransform invert(const AffineTransform& m);

    //=========================================================================================================
    /**
     * Matrix product a * b: the returned transform applies b first, then a.
     *
     * @param[in] a  Outer transform.
     * @param[in] b  Inner transform.
     *
     * @return a * b.
     */
    static AffineTransform compose(const AffineTransform& a, const AffineTransform& b);

    //=========================================================================================================
    /**
     * Pure translation by offset.
     *
     * @param[in] offset  Translation vector.
     *
     * @return Identity with offset in the last column.
     */
    static AffineTransform translation(const Eigen::Vector3d& offset);

    //=========================================================================================================
    /**
     * Applies m to every point: [x' y' z'] = (m * [x y z 1]^T)[0..2].
     * All points go through one homogeneous matrix product, so the rounding of a point never depends
     * on how many points are transformed with it.
     *
     * @param[in] points  N x 3 coordinates.
     * @param[in] m       The affine.
     *
     * @return N x 3 transformed coordinates.
     */
    static Eigen::MatrixX3d apply(const Eigen::MatrixX3d& points, const AffineTransform& m);
};

} // namespace SURFNORMLIB

#endif // AFFINE_COMPOSITOR_H
