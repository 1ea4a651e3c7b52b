//=============================================================================================================
/**
 * @file     surfnorm_exceptions.cpp
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
 * @brief    Exception types thrown by the surfnorm library.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_exceptions.h"

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

SurfNormException::SurfNormException(const QString& message)
: std::runtime_error(message.toStdString())
{
}

//=============================================================================================================

QString SurfNormException::message() const
{
    return QString::fromStdString(what());
}

//=============================================================================================================

FormatError::FormatError(const QString& message)
: SurfNormException(message)
{
}

//=============================================================================================================

UnsupportedFormatError::UnsupportedFormatError(const QString& message)
: SurfNormException(message)
{
}

//=============================================================================================================

SingularMatrixError::SingularMatrixError(const QString& message)
: SurfNormException(message)
{
}

//=============================================================================================================

MeshStructureError::MeshStructureError(const QString& message)
: SurfNormException(message)
{
}

//=============================================================================================================

MeshFormatError::MeshFormatError(const QString& message)
: SurfNormException(message)
{
}

//=============================================================================================================

FileAccessError::FileAccessError(const QString& message)
: SurfNormException(message)
{
}

//=============================================================================================================

SettingsError::SettingsError(const QString& message)
: SurfNormException(message)
{
}
