//=============================================================================================================
/**
 * @file     gifti_data_array.cpp
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
 * @brief    GiftiDataArray class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "gifti_data_array.h"

//=============================================================================================================
// STL INCLUDES
//=============================================================================================================

#include <cmath>
#include <limits>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;
using namespace Eigen;

//=============================================================================================================
// DEFINE GLOBAL METHODS
//=============================================================================================================

namespace {

template<typename T>
MatrixXd toIntegral(const MatrixXd& values)
{
    const double lo = static_cast<double>(std::numeric_limits<T>::lowest());
    const double hi = static_cast<double>(std::numeric_limits<T>::max());
    return values.unaryExpr([lo, hi](double v) {
        if (std::isnan(v)) {
            return 0.0;
        }
        double t = std::trunc(v);
        return t < lo ? lo : (t > hi ? hi : t);
    });
}

} // anonymous namespace

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

GiftiDataArray::GiftiDataArray()
: dataType(NIFTI_TYPE_FLOAT32)
, indexingOrder(RowMajorOrder)
, encoding(GZipBase64BinaryEncoding)
, endian(LittleEndian)
{
}

//=============================================================================================================

qint64 GiftiDataArray::valueCount() const
{
    if (dims.isEmpty()) {
        return 0;
    }
    qint64 count = 1;
    for (int d : dims) {
        if (d < 0) {
            return -1;
        }
        if (d > 0 && count > std::numeric_limits<qint64>::max() / d) {
            return -1;
        }
        count *= d;
    }
    return count;
}

//=============================================================================================================

void GiftiDataArray::setData(const MatrixXd& values)
{
    data = toDataType(values, dataType);

    if (dims.size() == 1 && values.cols() == 1) {
        dims[0] = static_cast<int>(values.rows());
    } else {
        dims = QVector<int>() << static_cast<int>(values.rows()) << static_cast<int>(values.cols());
    }
}

//=============================================================================================================

void GiftiDataArray::setDataType(int type)
{
    dataType = type;
    data = toDataType(data, type);
}

//=============================================================================================================

MatrixXd GiftiDataArray::toDataType(const MatrixXd& values, int type)
{
    switch (type) {
        case NIFTI_TYPE_FLOAT32:    return values.cast<float>().cast<double>();
        case NIFTI_TYPE_FLOAT64:    return values;
        case NIFTI_TYPE_UINT8:      return toIntegral<quint8>(values);
        case NIFTI_TYPE_INT8:       return toIntegral<qint8>(values);
        case NIFTI_TYPE_INT16:      return toIntegral<qint16>(values);
        case NIFTI_TYPE_UINT16:     return toIntegral<quint16>(values);
        case NIFTI_TYPE_INT32:      return toIntegral<qint32>(values);
        case NIFTI_TYPE_UINT32:     return toIntegral<quint32>(values);
        default:                    return values;
    }
}

//=============================================================================================================

int GiftiDataArray::bytesPerValue(int type)
{
    switch (type) {
        case NIFTI_TYPE_UINT8:
        case NIFTI_TYPE_INT8:       return 1;
        case NIFTI_TYPE_INT16:
        case NIFTI_TYPE_UINT16:     return 2;
        case NIFTI_TYPE_INT32:
        case NIFTI_TYPE_UINT32:
        case NIFTI_TYPE_FLOAT32:    return 4;
        case NIFTI_TYPE_FLOAT64:    return 8;
        default:                    return 0;
    }
}

//=============================================================================================================

int GiftiDataArray::dataTypeFromName(const QString& name, bool* ok)
{
    static const int types[] = {
        NIFTI_TYPE_UINT8, NIFTI_TYPE_INT8, NIFTI_TYPE_INT16, NIFTI_TYPE_UINT16,
        NIFTI_TYPE_INT32, NIFTI_TYPE_UINT32, NIFTI_TYPE_FLOAT32, NIFTI_TYPE_FLOAT64
    };

    QString sName = name.trimmed();
    for (int type : types) {
        if (dataTypeName(type) == sName) {
            if (ok) {
                *ok = true;
            }
            return type;
        }
    }
    if (ok) {
        *ok = false;
    }
    return 0;
}

//=============================================================================================================

QString GiftiDataArray::dataTypeName(int type)
{
    switch (type) {
        case NIFTI_TYPE_UINT8:      return QStringLiteral("NIFTI_TYPE_UINT8");
        case NIFTI_TYPE_INT8:       return QStringLiteral("NIFTI_TYPE_INT8");
        case NIFTI_TYPE_INT16:      return QStringLiteral("NIFTI_TYPE_INT16");
        case NIFTI_TYPE_UINT16:     return QStringLiteral("NIFTI_TYPE_UINT16");
        case NIFTI_TYPE_INT32:      return QStringLiteral("NIFTI_TYPE_INT32");
        case NIFTI_TYPE_UINT32:     return QStringLiteral("NIFTI_TYPE_UINT32");
        case NIFTI_TYPE_FLOAT32:    return QStringLiteral("NIFTI_TYPE_FLOAT32");
        case NIFTI_TYPE_FLOAT64:    return QStringLiteral("NIFTI_TYPE_FLOAT64");
        default:                    return QString();
    }
}

//=============================================================================================================

GiftiDataArray::Encoding GiftiDataArray::encodingFromName(const QString& name, bool* ok)
{
    QString sName = name.trimmed();
    bool found = true;
    Encoding encoding = GZipBase64BinaryEncoding;

    // GIFTI_ENCODING_* spellings are written by some older tools
    if (sName == "ASCII" || sName == "GIFTI_ENCODING_ASCII") {
        encoding = AsciiEncoding;
    } else if (sName == "Base64Binary" || sName == "GIFTI_ENCODING_B64BIN") {
        encoding = Base64BinaryEncoding;
    } else if (sName == "GZipBase64Binary" || sName == "GIFTI_ENCODING_B64GZ") {
        encoding = GZipBase64BinaryEncoding;
    } else {
        found = false;
    }

    if (ok) {
        *ok = found;
    }
    return encoding;
}

//=============================================================================================================

QString GiftiDataArray::encodingName(Encoding encoding)
{
    switch (encoding) {
        case AsciiEncoding:             return QStringLiteral("ASCII");
        case Base64BinaryEncoding:      return QStringLiteral("Base64Binary");
        case GZipBase64BinaryEncoding:  return QStringLiteral("GZipBase64Binary");
    }
    return QString();
}

//=============================================================================================================

GiftiDataArray::IndexingOrder GiftiDataArray::indexingOrderFromName(const QString& name, bool* ok)
{
    QString sName = name.trimmed();
    if (ok) {
        *ok = (sName == "RowMajorOrder" || sName == "ColumnMajorOrder");
    }
    return sName == "ColumnMajorOrder" ? ColumnMajorOrder : RowMajorOrder;
}

//=============================================================================================================

QString GiftiDataArray::indexingOrderName(IndexingOrder order)
{
    return order == ColumnMajorOrder ? QStringLiteral("ColumnMajorOrder") : QStringLiteral("RowMajorOrder");
}

//=============================================================================================================

GiftiDataArray::Endian GiftiDataArray::endianFromName(const QString& name, bool* ok)
{
    QString sName = name.trimmed();
    if (ok) {
        *ok = (sName == "LittleEndian" || sName == "BigEndian");
    }
    return sName == "BigEndian" ? BigEndian : LittleEndian;
}

//=============================================================================================================

QString GiftiDataArray::endianName(Endian endian)
{
    return endian == BigEndian ? QStringLiteral("BigEndian") : QStringLiteral("LittleEndian");
}
