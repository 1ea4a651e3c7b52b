//=============================================================================================================
/**
 * @file     gifti_io.h
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
 * @brief    GiftiIO class declaration.
 *
 *           Reader and writer for GIFTI surface files (.gii).
 *
 *           File format reference:
 *           https://www.nitrc.org/projects/gifti/ (GIFTI Surface Data Format, version 1.0)
 *
 *           Layout:
 *
 *           <GIFTI Version="1.0" NumberOfDataArrays="2">
 *             <MetaData> <MD><Name/><Value/></MD> ... </MetaData>
 *             <LabelTable> <Label Key="..">name</Label> ... </LabelTable>
 *             <DataArray Intent=".." DataType=".." ArrayIndexingOrder=".." Dimensionality="2"
 *                        Dim0="N" Dim1="3" Encoding=".." Endian=".." ExternalFileName="" ExternalFileOffset="">
 *               <MetaData> ... </MetaData>
 *               <CoordinateSystemTransformMatrix>
 *                 <DataSpace/> <TransformedSpace/> <MatrixData>16 values, row major</MatrixData>
 *               </CoordinateSystemTransformMatrix>
 *               <Data>values</Data>
 *             </DataArray>
 *             ...
 *           </GIFTI>
 *
 *           Data encodings: ASCII (whitespace separated), Base64Binary, GZipBase64Binary (zlib stream,
 *           then base64). ExternalFileBinary is not supported.
 *
 */

#ifndef GIFTI_IO_H
#define GIFTI_IO_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"
#include "gifti_image.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>
#include <QByteArray>

//=============================================================================================================
// EIGEN INCLUDES
//=============================================================================================================

#include <Eigen/Core>

//=============================================================================================================
// FORWARD DECLARATIONS
//=============================================================================================================

class QXmlStreamReader;
class QXmlStreamWriter;

//=============================================================================================================
// DEFINE NAMESPACE SURFNORMLIB
//=============================================================================================================

namespace SURFNORMLIB {

//=============================================================================================================
/**
 * Reads a GIFTI file into a GiftiImage and writes it back. Everything the library does not interpret
 * (unknown attributes, label table, metadata order, per array encoding) survives a read/write cycle.
 *
 * All methods throw: FileAccessError for I/O failures and MeshFormatError for content that cannot be decoded.
 *
 * @brief GIFTI surface file reader and writer.
 */
class SURFNORMSHARED_EXPORT GiftiIO
{
public:
    //=========================================================================================================
    /**
     * Reads a GIFTI file.
     *
     * @param[in] fileName  Path to the .gii file.
     *
     * @return The decoded image.
     */
    static GiftiImage read(const QString& fileName);

    //=========================================================================================================
    /**
     * Decodes GIFTI XML held in memory.
     *
     * @param[in] content     The XML document.
     * @param[in] sourceName  Name used in error messages.
     *
     * @return The decoded image.
     */
    static GiftiImage parse(const QByteArray& content, const QString& sourceName = QString());

    //=========================================================================================================
    /**
     * Writes a GIFTI file. The file is replaced atomically; if anything fails, the previous content (or
     * absence) of fileName is left untouched.
     *
     * @param[in] image     The image to write.
     * @param[in] fileName  Destination path.
     */
    static void write(const GiftiImage& image, const QString& fileName);

    //=========================================================================================================
    /**
     * Encodes an image as GIFTI XML.
     *
     * @param[in] image  The image to encode.
     *
     * @return The XML document.
     */
    static QByteArray serialize(const GiftiImage& image);

private:
    static void readMetaData(QXmlStreamReader& xml, GiftiMetaData& meta);

    static void readLabelTable(QXmlStreamReader& xml, GiftiImage& image);

    static GiftiDataArray readDataArray(QXmlStreamReader& xml, const QString& sourceName);

    static GiftiCoordSystem readCoordSystem(QXmlStreamReader& xml);

    //=========================================================================================================
    /**
     * Decodes the text of a <Data> element according to the array header.
     *
     * @param[in] text        Element text.
     * @param[in] darray      Array header (type, dims, encoding, endian, order).
     * @param[in] sourceName  Name used in error messages.
     *
     * @return Dim0 x (remaining dims) values.
     */
    static Eigen::MatrixXd decodeData(const QString& text, const GiftiDataArray& darray, const QString& sourceName);

    //=========================================================================================================
    /**
     * Encodes the values of an array for its <Data> element.
     *
     * @param[in] darray  The array.
     *
     * @return Element text.
     */
    static QString encodeData(const GiftiDataArray& darray);

    static void writeMetaData(QXmlStreamWriter& xml, const GiftiMetaData& meta);

    static void writeDataArray(QXmlStreamWriter& xml, const GiftiDataArray& darray);

    //=========================================================================================================
    /**
     * Inflates a zlib (or gzip) stream.
     *
     * @param[in] compressed  Compressed bytes.
     * @param[in] sourceName  Name used in error messages.
     *
     * @return The decompressed bytes.
     */
    static QByteArray inflateData(const QByteArray& compressed, const QString& sourceName);

    //=========================================================================================================
    /**
     * Deflates bytes into a zlib stream.
     *
     * @param[in] raw  Uncompressed bytes.
     *
     * @return The zlib stream.
     */
    static QByteArray deflateData(const QByteArray& raw);
};

} // namespace SURFNORMLIB

#endif // GIFTI_IO_H
