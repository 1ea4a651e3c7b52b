//=============================================================================================================
/**
 * @file     transform_loader.cpp
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
 * @brief    TransformLoader class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "transform_loader.h"
#include "surfnorm_exceptions.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QFile>
#include <QTextStream>
#include <QDebug>
#include <QRegularExpression>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;
using namespace Eigen;

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

AffineTransform TransformLoader::read(const QString& fileName)
{
    if (fileName.isEmpty()) {
        return AffineTransform::Identity();
    }

    Format format = formatOf(fileName);

    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCritical() << "TransformLoader::read - Could not open" << fileName;
        throw FileAccessError(QString("Could not open %1: %2").arg(fileName, file.errorString()));
    }

    QTextStream in(&file);
    QStringList lines;
    while (!in.atEnd()) {
        lines << in.readLine();
    }
    file.close();

    switch (format) {
        case PlainMatrix:
            return parsePlainMatrix(lines, fileName);
        case Lta:
            return parseLta(lines, fileName);
    }

    return AffineTransform::Identity();
}

//=============================================================================================================

TransformLoader::Format TransformLoader::formatOf(const QString& fileName)
{
    if (fileName.endsWith(TRANSFORM_EXT_PLAIN_MATRIX, Qt::CaseInsensitive)) {
        return PlainMatrix;
    }
    if (fileName.endsWith(TRANSFORM_EXT_LTA, Qt::CaseInsensitive)) {
        return Lta;
    }

    qCritical() << "TransformLoader::formatOf - Unknown transform type" << fileName;
    throw UnsupportedFormatError(QString("Unknown transform type %1; pass FSL (%2) or LTA (%3)")
                                 .arg(fileName, TRANSFORM_EXT_PLAIN_MATRIX, TRANSFORM_EXT_LTA));
}

//=============================================================================================================

AffineTransform TransformLoader::parsePlainMatrix(const QStringList& lines, const QString& sourceName)
{
    AffineTransform m = AffineTransform::Identity();
    int row = 0;

    for (const QString& rawLine : lines) {
        QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith('#')) {
            continue;
        }

        if (row == 4) {
            qCritical() << "TransformLoader::parsePlainMatrix - More than 4 rows in" << sourceName;
            throw FormatError(QString("%1: more than 4 matrix rows").arg(sourceName));
        }
        if (!parseRow(line, row, m)) {
            qCritical() << "TransformLoader::parsePlainMatrix - Bad matrix row" << line << "in" << sourceName;
            throw FormatError(QString("%1: \"%2\" is not a row of 4 numbers").arg(sourceName, line));
        }
        row++;
    }

    if (row < 4) {
        qCritical() << "TransformLoader::parsePlainMatrix - Only" << row << "rows in" << sourceName;
        throw FormatError(QString("%1: found %2 matrix rows, 4 expected").arg(sourceName).arg(row));
    }

    return m;
}

//=============================================================================================================

AffineTransform TransformLoader::parseLta(const QStringList& lines, const QString& sourceName)
{
    int marker = -1;
    for (int i = 0; i < lines.size(); ++i) {
        if (lines[i].startsWith(LTA_MATRIX_MARKER)) {
            marker = i;
            break;
        }
    }

    if (marker < 0) {
        qCritical() << "TransformLoader::parseLta - No" << LTA_MATRIX_MARKER << "line in" << sourceName;
        throw FormatError(QString("%1: no \"%2\" matrix block").arg(sourceName, LTA_MATRIX_MARKER));
    }

    AffineTransform m = AffineTransform::Identity();
    for (int row = 0; row < 4; ++row) {
        int i = marker + 1 + row;
        if (i >= lines.size()) {
            qCritical() << "TransformLoader::parseLta - Matrix block truncated in" << sourceName;
            throw FormatError(QString("%1: matrix block has %2 rows, 4 expected").arg(sourceName).arg(row));
        }
        if (!parseRow(lines[i], row, m)) {
            qCritical() << "TransformLoader::parseLta - Bad matrix row" << lines[i] << "in" << sourceName;
            throw FormatError(QString("%1: \"%2\" is not a row of 4 numbers").arg(sourceName, lines[i]));
        }
    }

    return m;
}

//=============================================================================================================

bool TransformLoader::parseRow(const QString& line, int row, AffineTransform& m)
{
    QStringList parts = line.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    if (parts.size() != 4) {
        return false;
    }

    for (int c = 0; c < 4; ++c) {
        bool ok;
        m(row, c) = parts[c].toDouble(&ok);
        if (!ok) {
            return false;
        }
    }
    return true;
}
