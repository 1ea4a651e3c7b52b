//=============================================================================================================
/**
 * @file     affine_compositor.cpp
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
 * @brief    AffineCompositor class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "affine_compositor.h"
#include "surfnorm_exceptions.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QDebug>

//=============================================================================================================
// EIGEN INCLUDES
//=============================================================================================================

#include <Eigen/LU>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;
using namespace Eigen;

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

AffineTransform AffineCompositor::invert(const AffineTransform& m)
{
    FullPivLU<Matrix4d> lu(m);
    if (!lu.isInvertible()) {
        qCritical() << "AffineCompositor::invert - Matrix is singular, rank" << lu.rank();
        throw SingularMatrixError(QString("Cannot invert affine transform of rank %1").arg(lu.rank()));
    }
    return lu.inverse();
}

//=============================================================================================================

AffineTransform AffineCompositor::compose(const AffineTransform& a, const AffineTransform& b)
{
    return a * b;
}

//=============================================================================================================

AffineTransform AffineCompositor::translation(const Vector3d& offset)
{
    AffineTransform t = AffineTransform::Identity();
    t.block<3,1>(0,3) = offset;
    return t;
}

//=============================================================================================================

MatrixX3d AffineCompositor::apply(const MatrixX3d& points, const AffineTransform& m)
{
    MatrixX4d rr_ones(points.rows(), 4);
    rr_ones.setOnes();
    rr_ones.block(0, 0, points.rows(), 3) = points;
    return rr_ones * m.block<3,4>(0,0).transpose();
}
