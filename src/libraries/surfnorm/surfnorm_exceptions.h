//=============================================================================================================
/**
 * @file     surfnorm_exceptions.h
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

#ifndef SURFNORM_EXCEPTIONS_H
#define SURFNORM_EXCEPTIONS_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>

//=============================================================================================================
// STL INCLUDES
//=============================================================================================================

#include <stdexcept>

//=============================================================================================================
// DEFINE NAMESPACE SURFNORMLIB
//=============================================================================================================

namespace SURFNORMLIB {

//=============================================================================================================
/**
 * Common base of all errors raised while loading, transforming or writing a surface.
 * None of them is retried internally; a caught exception means no output file was written.
 *
 * @brief Base class of surfnorm errors.
 */
class SURFNORMSHARED_EXPORT SurfNormException : public std::runtime_error
{
public:
    explicit SurfNormException(const QString& message);

    //=========================================================================================================
    /**
     * Returns the message as a QString.
     *
     * @return The error message.
     */
    QString message() const;
};

//=============================================================================================================
/**
 * @brief Malformed transform file (too few rows, missing LTA marker, non-numeric entries).
 */
class SURFNORMSHARED_EXPORT FormatError : public SurfNormException
{
public:
    explicit FormatError(const QString& message);
};

//=============================================================================================================
/**
 * @brief Transform file extension is neither plain matrix nor LTA.
 */
class SURFNORMSHARED_EXPORT UnsupportedFormatError : public SurfNormException
{
public:
    explicit UnsupportedFormatError(const QString& message);
};

//=============================================================================================================
/**
 * @brief Inversion requested on a non-invertible matrix.
 */
class SURFNORMSHARED_EXPORT SingularMatrixError : public SurfNormException
{
public:
    explicit SingularMatrixError(const QString& message);
};

//=============================================================================================================
/**
 * @brief Surface lacks a required component (point set, triangle array, offset metadata).
 */
class SURFNORMSHARED_EXPORT MeshStructureError : public SurfNormException
{
public:
    explicit MeshStructureError(const QString& message);
};

//=============================================================================================================
/**
 * @brief Surface container cannot be decoded (bad XML, unknown data type or encoding, size mismatch).
 */
class SURFNORMSHARED_EXPORT MeshFormatError : public SurfNormException
{
public:
    explicit MeshFormatError(const QString& message);
};

//=============================================================================================================
/**
 * @brief A file could not be opened, read or committed.
 */
class SURFNORMSHARED_EXPORT FileAccessError : public SurfNormException
{
public:
    explicit FileAccessError(const QString& message);
};

//=============================================================================================================
/**
 * @brief A caller-supplied setting is invalid.
 */
class SURFNORMSHARED_EXPORT SettingsError : public SurfNormException
{
public:
    explicit SettingsError(const QString& message);
};

} // namespace SURFNORMLIB

#endif // SURFNORM_EXCEPTIONS_H
