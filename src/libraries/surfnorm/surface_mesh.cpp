//=============================================================================================================
/**
 * @file     surface_mesh.cpp
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
 * @brief    SurfaceMesh class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surface_mesh.h"
#include "gifti_io.h"
#include "surfnorm_exceptions.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QDebug>

//=============================================================================================================
// STL INCLUDES
//=============================================================================================================

#include <utility>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;
using namespace Eigen;

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

SurfaceMesh::SurfaceMesh()
: m_iPointSet(-1)
, m_iFaceSet(-1)
{
}

//=============================================================================================================

SurfaceMesh SurfaceMesh::read(const QString& fileName)
{
    return fromImage(GiftiIO::read(fileName), fileName);
}

//=============================================================================================================

SurfaceMesh SurfaceMesh::fromImage(GiftiImage image, const QString& sourceName)
{
    SurfaceMesh mesh;
    mesh.m_image = std::move(image);
    mesh.m_iPointSet = mesh.m_image.indexOfIntent(GIFTI_INTENT_POINTSET);
    mesh.m_iFaceSet = mesh.m_image.indexOfIntent(GIFTI_INTENT_TRIANGLE);

    if (mesh.m_iPointSet < 0) {
        qCritical() << "SurfaceMesh::fromImage -" << sourceName << "has no" << GIFTI_INTENT_POINTSET << "array";
        throw MeshStructureError(QString("%1 has no %2 array").arg(sourceName, GIFTI_INTENT_POINTSET));
    }
    if (mesh.m_iFaceSet < 0) {
        qCritical() << "SurfaceMesh::fromImage -" << sourceName << "has no" << GIFTI_INTENT_TRIANGLE << "array";
        throw MeshStructureError(QString("%1 has no %2 array").arg(sourceName, GIFTI_INTENT_TRIANGLE));
    }
    if (mesh.pointSet().cols() != 3 || mesh.faceSet().cols() != 3) {
        qCritical() << "SurfaceMesh::fromImage -" << sourceName << "point or face set is not N x 3";
        throw MeshStructureError(QString("%1: point set is %2 x %3, face set is %4 x %5, both must be N x 3")
                                 .arg(sourceName)
                                 .arg(mesh.pointSet().rows()).arg(mesh.pointSet().cols())
                                 .arg(mesh.faceSet().rows()).arg(mesh.faceSet().cols()));
    }

    return mesh;
}

//=============================================================================================================

void SurfaceMesh::write(const QString& fileName) const
{
    GiftiIO::write(m_image, fileName);
}

//=============================================================================================================

GiftiDataArray& SurfaceMesh::pointSet()
{
    return m_image.darrays[m_iPointSet];
}

//=============================================================================================================

const GiftiDataArray& SurfaceMesh::pointSet() const
{
    return m_image.darrays[m_iPointSet];
}

//=============================================================================================================

GiftiDataArray& SurfaceMesh::faceSet()
{
    return m_image.darrays[m_iFaceSet];
}

//=============================================================================================================

const GiftiDataArray& SurfaceMesh::faceSet() const
{
    return m_image.darrays[m_iFaceSet];
}

//=============================================================================================================

MatrixX3d SurfaceMesh::vertices() const
{
    return pointSet().data;
}

//=============================================================================================================

void SurfaceMesh::setVertices(const MatrixX3d& vertices)
{
    if (vertices.rows() != pointSet().rows()) {
        qCritical() << "SurfaceMesh::setVertices - Got" << vertices.rows() << "vertices, mesh has" << pointSet().rows();
        throw MeshStructureError(QString("Vertex count may not change (%1 -> %2)")
                                 .arg(pointSet().rows()).arg(vertices.rows()));
    }
    pointSet().setData(vertices);
}

//=============================================================================================================

MatrixX3i SurfaceMesh::faces() const
{
    return faceSet().data.cast<int>();
}
