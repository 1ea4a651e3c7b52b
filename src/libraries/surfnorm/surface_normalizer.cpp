//=============================================================================================================
/**
 * @file     surface_normalizer.cpp
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
 * @brief    SurfaceNormalizer class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surface_normalizer.h"
#include "surface_mesh.h"
#include "transform_loader.h"
#include "affine_compositor.h"
#include "surfnorm_exceptions.h"
#include "surfnorm_types.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QDebug>
#include <QDir>
#include <QFileInfo>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;
using namespace Eigen;

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

SurfaceNormalizer::SurfaceNormalizer(const SurfaceNormalizerSettings& settings)
: m_settings(settings)
{
}

//=============================================================================================================

QString SurfaceNormalizer::normalize(const QString& inFile, const QString& transformFile) const
{
    logProgress(QString("Normalizing %1").arg(inFile));

    SurfaceMesh mesh = SurfaceMesh::read(inFile);
    const AffineTransform transform = TransformLoader::read(transformFile);

    GiftiDataArray& pointSet = mesh.pointSet();
    const QStringList keys = QStringList() << META_VOLGEOM_C_R << META_VOLGEOM_C_A << META_VOLGEOM_C_S;
    const Vector3d offset = readOffset(pointSet.meta, keys, false, inFile);

    logProgress(QString("Geometry center offset (%1, %2, %3)").arg(offset[0]).arg(offset[1]).arg(offset[2]));

    const AffineTransform m = AffineCompositor::compose(transform, AffineCompositor::translation(offset));
    mesh.setVertices(AffineCompositor::apply(mesh.vertices(), m));

    for (const QString& key : keys) {
        pointSet.meta.replaceAll(key, META_ZERO_OFFSET);
    }

    const QString fileName = QFileInfo(inFile).fileName();
    if (isMidThickness(fileName)) {
        if (!pointSet.meta.contains(META_ANATOMICAL_STRUCTURE_SECONDARY)) {
            pointSet.meta.insert(1, META_ANATOMICAL_STRUCTURE_SECONDARY, META_VALUE_MIDTHICKNESS);
        }
        if (!pointSet.meta.contains(META_GEOMETRIC_TYPE)) {
            pointSet.meta.insert(2, META_GEOMETRIC_TYPE, META_VALUE_ANATOMICAL);
        }
    }

    const QString outFile = normalizedFileName(inFile);
    mesh.write(outFile);

    logProgress(QString("Wrote %1").arg(outFile));
    return outFile;
}

//=============================================================================================================

QString SurfaceNormalizer::applyTransform(const QString& inFile, const QString& transformFile) const
{
    logProgress(QString("Applying %1 to %2").arg(transformFile, inFile));

    if (transformFile.isEmpty()) {
        qCritical() << "SurfaceNormalizer::applyTransform - No transform file given for" << inFile;
        throw FileAccessError(QString("No transform file given for %1").arg(inFile));
    }

    SurfaceMesh mesh = SurfaceMesh::read(inFile);
    AffineTransform transform = TransformLoader::read(transformFile);
    if (m_settings.invert()) {
        transform = AffineCompositor::invert(transform);
    }

    GiftiDataArray& pointSet = mesh.pointSet();
    const QStringList keys = m_settings.offsetKeys();

    Vector3d offset = Vector3d::Zero();
    if (m_settings.center()) {
        offset = readOffset(pointSet.meta, keys, true, inFile);
        logProgress(QString("Geometry center offset (%1, %2, %3)").arg(offset[0]).arg(offset[1]).arg(offset[2]));
    }

    MatrixX3d vertices = AffineCompositor::apply(mesh.vertices(), transform);
    if (m_settings.center()) {
        vertices.rowwise() += offset.transpose();
        for (const QString& key : keys) {
            pointSet.meta.replaceAll(key, META_ZERO_OFFSET);
        }
    }

    pointSet.setDataType(NIFTI_TYPE_FLOAT32);
    mesh.setVertices(vertices);
    pointSet.coordSystems = QVector<GiftiCoordSystem>()
                            << GiftiCoordSystem(NIFTI_XFORM_ALIGNED_ANAT, NIFTI_XFORM_ALIGNED_ANAT);

    GiftiDataArray& faceSet = mesh.faceSet();
    faceSet.setDataType(NIFTI_TYPE_FLOAT32);
    faceSet.meta.clear();
    faceSet.coordSystems.clear();

    const QString outFile = targetFileName(inFile, m_settings.outputDirectory());
    mesh.write(outFile);

    logProgress(QString("Wrote %1").arg(outFile));
    return outFile;
}

//=============================================================================================================

bool SurfaceNormalizer::isMidThickness(const QString& fileName)
{
    const QString name = QFileInfo(fileName).fileName().toLower();
    return name.contains(QLatin1String("midthickness")) || name.contains(QLatin1String("graymid"));
}

//=============================================================================================================

QString SurfaceNormalizer::normalizedFileName(const QString& inFile)
{
    return QDir::current().absoluteFilePath(QFileInfo(inFile).fileName());
}

//=============================================================================================================

QString SurfaceNormalizer::targetFileName(const QString& inFile, const QString& outputDirectory)
{
    const QDir dir = outputDirectory.isEmpty() ? QDir::current() : QDir(outputDirectory);
    return dir.absoluteFilePath(QFileInfo(inFile).completeBaseName() + TARGET_SURFACE_SUFFIX);
}

//=============================================================================================================

const SurfaceNormalizerSettings& SurfaceNormalizer::settings() const
{
    return m_settings;
}

//=============================================================================================================

Vector3d SurfaceNormalizer::readOffset(const GiftiMetaData& meta,
                                       const QStringList& keys,
                                       bool required,
                                       const QString& sourceName)
{
    Vector3d offset = Vector3d::Zero();
    for (int i = 0; i < 3; ++i) {
        if (!meta.contains(keys[i])) {
            if (required) {
                qCritical() << "SurfaceNormalizer::readOffset -" << sourceName << "point set metadata lacks" << keys[i];
                throw MeshStructureError(QString("%1: point set metadata lacks %2").arg(sourceName, keys[i]));
            }
            continue;
        }

        // Duplicated keys resolve to the last entry, as in dictionary-based readers
        const QString sValue = meta.lastValue(keys[i]);
        bool ok = false;
        offset[i] = sValue.trimmed().toDouble(&ok);
        if (!ok) {
            qCritical() << "SurfaceNormalizer::readOffset -" << sourceName << keys[i] << "is not a number:" << sValue;
            throw MeshStructureError(QString("%1: %2 is not a number: '%3'").arg(sourceName, keys[i], sValue));
        }
    }

    return offset;
}

//=============================================================================================================

void SurfaceNormalizer::logProgress(const QString& message) const
{
    if (m_settings.verbose()) {
        qInfo().noquote() << "SurfaceNormalizer -" << message;
    } else {
        qDebug().noquote() << "SurfaceNormalizer -" << message;
    }
}
