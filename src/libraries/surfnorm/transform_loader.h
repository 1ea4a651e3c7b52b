//=============================================================================================================
/**
 * @file     transform_loader.h
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
 * @brief    TransformLoader class declaration.
 *
 *           Reads a 4x4 affine from one of two text formats:
 *
 *           Plain matrix (.mat, FSL FLIRT style): 4 lines of 4 whitespace separated numbers, row major,
 *           no header. Blank lines and lines starting with '#' are ignored.
 *
 *           LTA (.lta, FreeSurfer linear transform array):
 *
 *               # transform file ...
 *               type      = 1 # LINEAR_RAS_TO_RAS
 *               nxforms   = 1
 *               mean      = 0.0000 0.0000 0.0000
 *               sigma     = 1.0000
 *               1 4 4
 *               m00 m01 m02 m03
 *               m10 m11 m12 m13
 *               m20 m21 m22 m23
 *               m30 m31 m32 m33
 *               src volume info
 *               ...
 *
 *           The matrix is the four lines following the first line that starts with "1 4 4".
 *
 */

#ifndef TRANSFORM_LOADER_H
#define TRANSFORM_LOADER_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"
#include "surfnorm_types.h"

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
 * Loads affine transform files. Read only.
 *
 * @brief Plain matrix and LTA transform reader.
 */
class SURFNORMSHARED_EXPORT TransformLoader
{
public:
    /** The transform file formats understood by the loader. */
    enum Format {
        PlainMatrix,    /**< FSL style .mat. */
        Lta             /**< FreeSurfer .lta. */
    };

    //=========================================================================================================
    /**
     * Loads a transform file. An empty fileName yields the identity.
     *
     * @param[in] fileName  Path to a .mat or .lta file, or empty.
     *
     * @return The affine. Throws UnsupportedFormatError, FormatError or FileAccessError.
     */
    static AffineTransform read(const QString& fileName = QString());

    //=========================================================================================================
    /**
     * Determines the format from the file extension (case insensitive).
     *
     * @param[in] fileName  Path to a transform file.
     *
     * @return The format. Throws UnsupportedFormatError for any other extension.
     */
    static Format formatOf(const QString& fileName);

    //=========================================================================================================
    /**
     * Parses plain matrix content.
     *
     * @param[in] lines       File content split into lines.
     * @param[in] sourceName  Name used in error messages.
     *
     * @return The affine. Throws FormatError.
     */
    static AffineTransform parsePlainMatrix(const QStringList& lines, const QString& sourceName = QString());

    //=========================================================================================================
    /**
     * Parses LTA content.
     *
     * @param[in] lines       File content split into lines.
     * @param[in] sourceName  Name used in error messages.
     *
     * @return The affine. Throws FormatError.
     */
    static AffineTransform parseLta(const QStringList& lines, const QString& sourceName = QString());

private:
    //=========================================================================================================
    /**
     * Parses exactly four numbers into one row of m.
     *
     * @param[in]  line  Text line.
     * @param[in]  row   Row index 0..3.
     * @param[out] m     Destination matrix.
     *
     * @return True if the line holds exactly four numbers.
     */
    static bool parseRow(const QString& line, int row, AffineTransform& m);
};

} // namespace SURFNORMLIB

#endif // TRANSFORM_LOADER_H
