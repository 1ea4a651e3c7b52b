//=============================================================================================================
/**
 * @file     surface_mesh.h
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
 * @brief    SurfaceMesh class declaration.
 *
 */

#ifndef SURFACE_MESH_H
#define SURFACE_MESH_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"
#include "gifti_image.h"

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
 * Triangulated surface backed by a GIFTI image.
 *
 * The point set is the first NIFTI_INTENT_POINTSET array (N x 3 vertices with metadata and coordinate
 * system), the face set the first NIFTI_INTENT_TRIANGLE array (M x 3 vertex indices). All other arrays and
 * file level data are carried along untouched. The vertex count never changes after construction.
 *
 * @brief Surface mesh: one point set and one face set.
 */
class SURFNORMSHARED_EXPORT SurfaceMesh
{
public:
    //=========================================================================================================
    /**
     * Reads a GIFTI surface.
     *
     * @param[in] fileName  Path to the .gii file.
     *
     * @return The mesh. Throws MeshStructureError if the point or face set is missing or not N x 3.
     */
    static SurfaceMesh read(const QString& fileName);

    //=========================================================================================================
    /**
     * Wraps an image already in memory.
     *
     * @param[in] image       The image, moved into the mesh.
     * @param[in] sourceName  Name used in error messages.
     *
     * @return The mesh. Throws MeshStructureError as read() does.
     */
    static SurfaceMesh fromImage(GiftiImage image, const QString& sourceName = QString());

    //=========================================================================================================
    /**
     * Writes the mesh as GIFTI.
     *
     * @param[in] fileName  Destination path.
     */
    void write(const QString& fileName) const;

    //=========================================================================================================
    /**
     * @return The point set array.
     */
    GiftiDataArray& pointSet();
    const GiftiDataArray& pointSet() const;

    //=========================================================================================================
    /**
     * @return The face set array.
     */
    GiftiDataArray& faceSet();
    const GiftiDataArray& faceSet() const;

    //=========================================================================================================
    /**
     * @return Vertex coordinates, N x 3.
     */
    Eigen::MatrixX3d vertices() const;

    //=========================================================================================================
    /**
     * Replaces the vertex coordinates. Values are converted to the point set's data type.
     *
     * @param[in] vertices  N x 3 coordinates; N must equal vertexCount(), otherwise MeshStructureError.
     */
    void setVertices(const Eigen::MatrixX3d& vertices);

    //=========================================================================================================
    /**
     * @return Face vertex indices, M x 3.
     */
    Eigen::MatrixX3i faces() const;

    inline int vertexCount() const
    {
        return static_cast<int>(pointSet().rows());
    }

    inline int faceCount() const
    {
        return static_cast<int>(faceSet().rows());
    }

    //=========================================================================================================
    /**
     * @return The underlying image.
     */
    inline const GiftiImage& image() const
    {
        return m_image;
    }

private:
    SurfaceMesh();

    GiftiImage  m_image;        /**< The complete file. */
    int         m_iPointSet;    /**< Index of the point set in m_image.darrays. */
    int         m_iFaceSet;     /**< Index of the face set in m_image.darrays. */
};

} // namespace SURFNORMLIB

#endif // SURFACE_MESH_H
