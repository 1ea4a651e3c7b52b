//=============================================================================================================
/**
 * @file     gifti_data_array.h
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
 * @brief    GiftiDataArray class declaration.
 *
 *           One GIFTI <DataArray>: header attributes, metadata, coordinate systems and the decoded
 *           values. Values of every supported NIfTI type are held as doubles, which represents all of
 *           them exactly, and are converted back to the declared type on write.
 *
 */

#ifndef GIFTI_DATA_ARRAY_H
#define GIFTI_DATA_ARRAY_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"
#include "surfnorm_types.h"
#include "gifti_meta_data.h"
#include "gifti_coord_system.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>
#include <QVector>
#include <QPair>

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
 * GIFTI data array.
 *
 * data is always stored logically as Dim0 rows by (Dim1 * ... * DimN-1) columns, independent of the
 * ArrayIndexingOrder the array had on disk. The on-disk order is remembered and used again on write.
 *
 * @brief GIFTI <DataArray> element.
 */
class SURFNORMSHARED_EXPORT GiftiDataArray
{
public:
    /** ArrayIndexingOrder attribute. */
    enum IndexingOrder {
        RowMajorOrder,
        ColumnMajorOrder
    };

    /** Encoding attribute. ExternalFileBinary is not supported. */
    enum Encoding {
        AsciiEncoding,
        Base64BinaryEncoding,
        GZipBase64BinaryEncoding
    };

    /** Endian attribute. */
    enum Endian {
        LittleEndian,
        BigEndian
    };

    //=========================================================================================================
    /**
     * Constructs an empty FLOAT32 array, GZip base64 encoded, little endian, row major.
     */
    GiftiDataArray();

    //=========================================================================================================
    /**
     * @return Number of rows (Dim0).
     */
    inline Eigen::Index rows() const
    {
        return data.rows();
    }

    //=========================================================================================================
    /**
     * @return Number of columns (product of Dim1..DimN-1, 1 for a vector).
     */
    inline Eigen::Index cols() const
    {
        return data.cols();
    }

    //=========================================================================================================
    /**
     * @return Total number of values, the product of all dims. -1 if a dim is negative or the product
     *         overflows.
     */
    qint64 valueCount() const;

    //=========================================================================================================
    /**
     * Replaces the values and sets dims to [rows, cols]. A single column keeps a one dimensional
     * layout if the array was one dimensional before.
     *
     * @param[in] values  New values, converted to the declared data type.
     */
    void setData(const Eigen::MatrixXd& values);

    //=========================================================================================================
    /**
     * Changes the declared data type and converts the stored values to it (rounding for float32,
     * truncation toward zero and clamping for integer types).
     *
     * @param[in] type  NIFTI_TYPE_* code.
     */
    void setDataType(int type);

    //=========================================================================================================
    /**
     * Converts values to what the declared data type can hold. Called by setData and setDataType.
     *
     * @param[in] values  Values to convert.
     * @param[in] type    NIFTI_TYPE_* code.
     *
     * @return The representable values.
     */
    static Eigen::MatrixXd toDataType(const Eigen::MatrixXd& values, int type);

    //=========================================================================================================
    /**
     * @param[in] type  NIFTI_TYPE_* code.
     *
     * @return Size of one value in bytes, 0 for an unsupported type.
     */
    static int bytesPerValue(int type);

    //=========================================================================================================
    /**
     * @param[in]  name  e.g. "NIFTI_TYPE_FLOAT32".
     * @param[out] ok    False if the type is not supported.
     *
     * @return The NIFTI_TYPE_* code, 0 if unsupported.
     */
    static int dataTypeFromName(const QString& name, bool* ok = nullptr);

    //=========================================================================================================
    /**
     * @param[in] type  NIFTI_TYPE_* code.
     *
     * @return The attribute value, empty if unsupported.
     */
    static QString dataTypeName(int type);

    static Encoding encodingFromName(const QString& name, bool* ok = nullptr);
    static QString encodingName(Encoding encoding);

    static IndexingOrder indexingOrderFromName(const QString& name, bool* ok = nullptr);
    static QString indexingOrderName(IndexingOrder order);

    static Endian endianFromName(const QString& name, bool* ok = nullptr);
    static QString endianName(Endian endian);

    QString                             intent;             /**< Intent name, e.g. NIFTI_INTENT_POINTSET. */
    int                                 dataType;           /**< NIFTI_TYPE_* code. */
    IndexingOrder                       indexingOrder;      /**< On-disk value order. */
    Encoding                            encoding;           /**< On-disk data encoding. */
    Endian                              endian;             /**< Byte order of binary encodings. */
    QVector<int>                        dims;               /**< Dim0..DimN-1. */
    QVector<QPair<QString, QString> >   otherAttributes;    /**< Attributes this library does not interpret, kept verbatim. */
    GiftiMetaData                       meta;               /**< Array metadata. */
    QVector<GiftiCoordSystem>           coordSystems;       /**< Zero or more coordinate system records. */
    Eigen::MatrixXd                     data;               /**< Values, Dim0 x (remaining dims). */
};

} // namespace SURFNORMLIB

#endif // GIFTI_DATA_ARRAY_H
