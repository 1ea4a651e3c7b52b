//=============================================================================================================
/**
 * @file     gifti_coord_system.cpp
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
 * @brief    GiftiCoordSystem class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "gifti_coord_system.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QStringList>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;
using namespace Eigen;

//=============================================================================================================
// DEFINE GLOBAL METHODS
//=============================================================================================================

namespace {

// Indexed by NIFTI_XFORM_* code.
const QStringList& spaceNames()
{
    static const QStringList names = QStringList()
        << "NIFTI_XFORM_UNKNOWN"
        << "NIFTI_XFORM_SCANNER_ANAT"
        << "NIFTI_XFORM_ALIGNED_ANAT"
        << "NIFTI_XFORM_TALAIRACH"
        << "NIFTI_XFORM_MNI_152";
    return names;
}

} // anonymous namespace

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

GiftiCoordSystem::GiftiCoordSystem()
: dataSpace(NIFTI_XFORM_UNKNOWN)
, transformedSpace(NIFTI_XFORM_UNKNOWN)
, xform(Matrix4d::Identity())
{
}

//=============================================================================================================

GiftiCoordSystem::GiftiCoordSystem(int dataSpace, int transformedSpace, const AffineTransform& xform)
: dataSpace(dataSpace)
, transformedSpace(transformedSpace)
, xform(xform)
{
}

//=============================================================================================================

int GiftiCoordSystem::spaceFromName(const QString& name, bool* ok)
{
    int code = static_cast<int>(spaceNames().indexOf(name.trimmed()));
    if (ok) {
        *ok = (code >= 0);
    }
    return code >= 0 ? code : NIFTI_XFORM_UNKNOWN;
}

//=============================================================================================================

QString GiftiCoordSystem::spaceName(int code)
{
    if (code < 0 || code >= spaceNames().size()) {
        return spaceNames().first();
    }
    return spaceNames().at(code);
}
