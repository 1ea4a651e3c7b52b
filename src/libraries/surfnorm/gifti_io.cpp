//=============================================================================================================
/**
 * @file     gifti_io.cpp
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
 * @brief    GiftiIO class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "gifti_io.h"
#include "surfnorm_exceptions.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QFile>
#include <QSaveFile>
#include <QDataStream>
#include <QDebug>
#include <QLocale>
#include <QMap>
#include <QRegularExpression>
#include <QStringList>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include <zlib.h>

//=============================================================================================================
// EIGEN INCLUDES
//=============================================================================================================

#include <Eigen/Core>

//=============================================================================================================
// STL INCLUDES
//=============================================================================================================

#include <cstring>
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

const QString GIFTI_DOCTYPE = QStringLiteral("<!DOCTYPE GIFTI SYSTEM \"http://www.nitrc.org/frs/download.php/115/gifti.dtd\">");

template<typename T>
void readValues(QDataStream& stream, VectorXd& values)
{
    for (Index i = 0; i < values.size(); ++i) {
        T v;
        stream >> v;
        values[i] = static_cast<double>(v);
    }
}

template<typename T>
void writeValues(QDataStream& stream, const VectorXd& values)
{
    for (Index i = 0; i < values.size(); ++i) {
        stream << static_cast<T>(values[i]);
    }
}

VectorXd flattenValues(const MatrixXd& data, GiftiDataArray::IndexingOrder order)
{
    if (order == GiftiDataArray::RowMajorOrder) {
        Matrix<double, Dynamic, Dynamic, RowMajor> rowMajor = data;
        return Map<const VectorXd>(rowMajor.data(), rowMajor.size());
    }
    return Map<const VectorXd>(data.data(), data.size());
}

MatrixXd unflattenValues(const VectorXd& values, Index rows, Index cols, GiftiDataArray::IndexingOrder order)
{
    if (order == GiftiDataArray::RowMajorOrder) {
        return Map<const Matrix<double, Dynamic, Dynamic, RowMajor> >(values.data(), rows, cols);
    }
    return Map<const MatrixXd>(values.data(), rows, cols);
}

QString formatValue(double value, int dataType)
{
    switch (dataType) {
        case NIFTI_TYPE_FLOAT32:    return QString::number(value, 'g', 9);
        case NIFTI_TYPE_FLOAT64:    return QString::number(value, 'g', 17);
        default:                    return QString::number(static_cast<qint64>(value));
    }
}

QVector<QPair<QString, QString> > collectAttributes(const QXmlStreamAttributes& attributes)
{
    QVector<QPair<QString, QString> > result;
    for (const QXmlStreamAttribute& attr : attributes) {
        result.append(qMakePair(attr.qualifiedName().toString(), attr.value().toString()));
    }
    return result;
}

} // anonymous namespace

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

GiftiImage GiftiIO::read(const QString& fileName)
{
    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical() << "GiftiIO::read - Could not open" << fileName;
        throw FileAccessError(QString("Could not open %1: %2").arg(fileName, file.errorString()));
    }
    QByteArray content = file.readAll();
    file.close();

    return parse(content, fileName);
}

//=============================================================================================================

GiftiImage GiftiIO::parse(const QByteArray& content, const QString& sourceName)
{
    GiftiImage image;
    int declaredArrays = -1;

    QXmlStreamReader xml(content);
    // Keep xmlns declarations as plain attributes so they are written back unchanged
    xml.setNamespaceProcessing(false);

    if (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("GIFTI")) {
            for (const QPair<QString, QString>& attr : collectAttributes(xml.attributes())) {
                if (attr.first == QLatin1String("Version")) {
                    image.version = attr.second;
                } else if (attr.first == QLatin1String("NumberOfDataArrays")) {
                    declaredArrays = attr.second.toInt();
                } else {
                    image.otherAttributes.append(attr);
                }
            }

            while (xml.readNextStartElement()) {
                if (xml.name() == QLatin1String("MetaData")) {
                    readMetaData(xml, image.meta);
                } else if (xml.name() == QLatin1String("LabelTable")) {
                    readLabelTable(xml, image);
                } else if (xml.name() == QLatin1String("DataArray")) {
                    image.darrays.append(readDataArray(xml, sourceName));
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else {
            xml.raiseError(QString("Root element is <%1>, expected <GIFTI>").arg(xml.name().toString()));
        }
    }

    if (xml.hasError()) {
        qCritical() << "GiftiIO::parse -" << sourceName << "line" << xml.lineNumber() << ":" << xml.errorString();
        throw MeshFormatError(QString("%1 (line %2): %3").arg(sourceName).arg(xml.lineNumber()).arg(xml.errorString()));
    }

    if (declaredArrays >= 0 && declaredArrays != image.darrays.size()) {
        qWarning() << "GiftiIO::parse -" << sourceName << "declares" << declaredArrays
                   << "data arrays but contains" << image.darrays.size();
    }

    return image;
}

//=============================================================================================================

void GiftiIO::write(const GiftiImage& image, const QString& fileName)
{
    QByteArray content = serialize(image);

    QSaveFile file(fileName);
    if (!file.open(QIODevice::WriteOnly)) {
        qCritical() << "GiftiIO::write - Could not open" << fileName << "for writing";
        throw FileAccessError(QString("Could not open %1 for writing: %2").arg(fileName, file.errorString()));
    }

    if (file.write(content) != content.size() || !file.commit()) {
        qCritical() << "GiftiIO::write - Could not write" << fileName;
        throw FileAccessError(QString("Could not write %1: %2").arg(fileName, file.errorString()));
    }
}

//=============================================================================================================

QByteArray GiftiIO::serialize(const GiftiImage& image)
{
    QByteArray content;
    QXmlStreamWriter xml(&content);
    xml.setAutoFormatting(true);

    xml.writeStartDocument();
    xml.writeDTD(GIFTI_DOCTYPE);

    xml.writeStartElement("GIFTI");
    for (const QPair<QString, QString>& attr : image.otherAttributes) {
        xml.writeAttribute(attr.first, attr.second);
    }
    xml.writeAttribute("Version", image.version);
    xml.writeAttribute("NumberOfDataArrays", QString::number(image.darrays.size()));

    writeMetaData(xml, image.meta);

    if (image.hasLabelTable) {
        xml.writeStartElement("LabelTable");
        for (const GiftiLabel& label : image.labelTable) {
            xml.writeStartElement("Label");
            for (const QPair<QString, QString>& attr : label.attributes) {
                xml.writeAttribute(attr.first, attr.second);
            }
            xml.writeCDATA(label.text);
            xml.writeEndElement();
        }
        xml.writeEndElement();
    }

    for (const GiftiDataArray& darray : image.darrays) {
        writeDataArray(xml, darray);
    }

    xml.writeEndElement();
    xml.writeEndDocument();

    return content;
}

//=============================================================================================================

void GiftiIO::readMetaData(QXmlStreamReader& xml, GiftiMetaData& meta)
{
    while (xml.readNextStartElement()) {
        if (xml.name() != QLatin1String("MD")) {
            xml.skipCurrentElement();
            continue;
        }

        QString name;
        QString value;
        while (xml.readNextStartElement()) {
            if (xml.name() == QLatin1String("Name")) {
                name = xml.readElementText().trimmed();
            } else if (xml.name() == QLatin1String("Value")) {
                value = xml.readElementText();
            } else {
                xml.skipCurrentElement();
            }
        }
        meta.append(name, value);
    }
}

//=============================================================================================================

void GiftiIO::readLabelTable(QXmlStreamReader& xml, GiftiImage& image)
{
    image.hasLabelTable = true;

    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("Label")) {
            GiftiLabel label;
            label.attributes = collectAttributes(xml.attributes());
            label.text = xml.readElementText();
            image.labelTable.append(label);
        } else {
            xml.skipCurrentElement();
        }
    }
}

//=============================================================================================================

GiftiDataArray GiftiIO::readDataArray(QXmlStreamReader& xml, const QString& sourceName)
{
    GiftiDataArray darray;
    int dimensionality = -1;
    QMap<int, int> dimMap;

    for (const QPair<QString, QString>& attr : collectAttributes(xml.attributes())) {
        const QString& name = attr.first;
        const QString& value = attr.second;
        bool ok = true;

        if (name == QLatin1String("Intent")) {
            darray.intent = value.trimmed();
        } else if (name == QLatin1String("DataType")) {
            darray.dataType = GiftiDataArray::dataTypeFromName(value, &ok);
        } else if (name == QLatin1String("ArrayIndexingOrder")) {
            darray.indexingOrder = GiftiDataArray::indexingOrderFromName(value, &ok);
        } else if (name == QLatin1String("Dimensionality")) {
            dimensionality = value.toInt(&ok);
        } else if (name.startsWith(QLatin1String("Dim"))) {
            int axis = name.mid(3).toInt(&ok);
            if (ok) {
                dimMap[axis] = value.toInt(&ok);
            }
        } else if (name == QLatin1String("Encoding")) {
            darray.encoding = GiftiDataArray::encodingFromName(value, &ok);
        } else if (name == QLatin1String("Endian")) {
            darray.endian = GiftiDataArray::endianFromName(value, &ok);
        } else if (name == QLatin1String("ExternalFileName") || name == QLatin1String("ExternalFileOffset")) {
            if (!value.trimmed().isEmpty()) {
                xml.raiseError("External data files are not supported");
                return darray;
            }
        } else {
            darray.otherAttributes.append(attr);
        }

        if (!ok) {
            xml.raiseError(QString("Unsupported value \"%1\" for DataArray attribute %2").arg(value, name));
            return darray;
        }
    }

    if (dimensionality < 1) {
        xml.raiseError("DataArray without valid Dimensionality");
        return darray;
    }
    for (int i = 0; i < dimensionality; ++i) {
        if (!dimMap.contains(i) || dimMap.value(i) < 0) {
            xml.raiseError(QString("DataArray without valid Dim%1").arg(i));
            return darray;
        }
        darray.dims.append(dimMap.value(i));
    }

    QString dataText;
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("MetaData")) {
            readMetaData(xml, darray.meta);
        } else if (xml.name() == QLatin1String("CoordinateSystemTransformMatrix")) {
            darray.coordSystems.append(readCoordSystem(xml));
        } else if (xml.name() == QLatin1String("Data")) {
            dataText = xml.readElementText();
        } else {
            xml.skipCurrentElement();
        }
    }

    if (!xml.hasError()) {
        darray.data = decodeData(dataText, darray, sourceName);
    }

    return darray;
}

//=============================================================================================================

GiftiCoordSystem GiftiIO::readCoordSystem(QXmlStreamReader& xml)
{
    GiftiCoordSystem coordSystem;

    while (xml.readNextStartElement()) {
        bool ok = true;
        if (xml.name() == QLatin1String("DataSpace")) {
            coordSystem.dataSpace = GiftiCoordSystem::spaceFromName(xml.readElementText(), &ok);
        } else if (xml.name() == QLatin1String("TransformedSpace")) {
            coordSystem.transformedSpace = GiftiCoordSystem::spaceFromName(xml.readElementText(), &ok);
        } else if (xml.name() == QLatin1String("MatrixData")) {
            QStringList values = xml.readElementText().split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
            ok = (values.size() == 16);
            for (int i = 0; i < values.size() && ok; ++i) {
                coordSystem.xform(i / 4, i % 4) = values[i].toDouble(&ok);
            }
        } else {
            xml.skipCurrentElement();
        }

        if (!ok) {
            xml.raiseError("Invalid CoordinateSystemTransformMatrix");
            break;
        }
    }

    return coordSystem;
}

//=============================================================================================================

MatrixXd GiftiIO::decodeData(const QString& text, const GiftiDataArray& darray, const QString& sourceName)
{
    const qint64 count = darray.valueCount();
    bool validDims = count >= 0;

    Index rows = darray.dims.isEmpty() ? 0 : darray.dims[0];
    Index cols = 1;
    for (int i = 1; validDims && i < darray.dims.size(); ++i) {
        if (darray.dims[i] > 0 && cols > std::numeric_limits<Index>::max() / darray.dims[i]) {
            validDims = false;
        } else {
            cols *= darray.dims[i];
        }
    }
    if (!validDims) {
        qCritical() << "GiftiIO::decodeData -" << sourceName << "invalid dimensions" << darray.dims;
        throw MeshFormatError(QString("%1: dimensions of %2 array are negative or too large")
                              .arg(sourceName, darray.intent));
    }
    if (count == 0) {
        return MatrixXd(rows, cols);
    }

    // The payload size is checked against the dimensions before any buffer is sized from them
    VectorXd values;

    if (darray.encoding == GiftiDataArray::AsciiEncoding) {
        QStringList tokens = text.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
        if (tokens.size() != count) {
            qCritical() << "GiftiIO::decodeData -" << sourceName << "expected" << count
                        << "values, found" << tokens.size();
            throw MeshFormatError(QString("%1: %2 array holds %3 ASCII values, %4 expected")
                                  .arg(sourceName, darray.intent).arg(tokens.size()).arg(count));
        }
        values.resize(count);
        for (qint64 i = 0; i < count; ++i) {
            bool ok;
            values[i] = tokens[i].toDouble(&ok);
            if (!ok) {
                qCritical() << "GiftiIO::decodeData -" << sourceName << "bad number" << tokens[i];
                throw MeshFormatError(QString("%1: bad number \"%2\" in %3 array")
                                      .arg(sourceName, tokens[i], darray.intent));
            }
        }
        // Text may carry more digits than the declared type holds
        values = GiftiDataArray::toDataType(values, darray.dataType);
    } else {
        QByteArray bytes = QByteArray::fromBase64(text.toLatin1());
        if (darray.encoding == GiftiDataArray::GZipBase64BinaryEncoding) {
            bytes = inflateData(bytes, sourceName);
        }

        const int bytesPerValue = GiftiDataArray::bytesPerValue(darray.dataType);
        if (bytes.size() % bytesPerValue != 0 || bytes.size() / bytesPerValue != count) {
            qCritical() << "GiftiIO::decodeData -" << sourceName << "expected" << count << "values of"
                        << bytesPerValue << "bytes, found" << bytes.size() << "bytes";
            throw MeshFormatError(QString("%1: %2 array holds %3 bytes, %4 values of %5 bytes expected")
                                  .arg(sourceName, darray.intent).arg(bytes.size()).arg(count).arg(bytesPerValue));
        }
        values.resize(count);

        QDataStream stream(bytes);
        stream.setByteOrder(darray.endian == GiftiDataArray::BigEndian ? QDataStream::BigEndian
                                                                       : QDataStream::LittleEndian);

        switch (darray.dataType) {
            case NIFTI_TYPE_UINT8:      readValues<quint8>(stream, values); break;
            case NIFTI_TYPE_INT8:       readValues<qint8>(stream, values); break;
            case NIFTI_TYPE_INT16:      readValues<qint16>(stream, values); break;
            case NIFTI_TYPE_UINT16:     readValues<quint16>(stream, values); break;
            case NIFTI_TYPE_INT32:      readValues<qint32>(stream, values); break;
            case NIFTI_TYPE_UINT32:     readValues<quint32>(stream, values); break;
            case NIFTI_TYPE_FLOAT32:
                stream.setFloatingPointPrecision(QDataStream::SinglePrecision);
                readValues<float>(stream, values);
                break;
            case NIFTI_TYPE_FLOAT64:
                stream.setFloatingPointPrecision(QDataStream::DoublePrecision);
                readValues<double>(stream, values);
                break;
        }
    }

    return unflattenValues(values, rows, cols, darray.indexingOrder);
}

//=============================================================================================================

QString GiftiIO::encodeData(const GiftiDataArray& darray)
{
    VectorXd values = flattenValues(darray.data, darray.indexingOrder);

    if (darray.encoding == GiftiDataArray::AsciiEncoding) {
        // One line per contiguous run: a row in row major order, a column in column major order
        Index run = darray.indexingOrder == GiftiDataArray::RowMajorOrder ? darray.cols() : darray.rows();
        if (run < 1) {
            run = 1;
        }

        QStringList lines;
        QStringList line;
        for (Index i = 0; i < values.size(); ++i) {
            line << formatValue(values[i], darray.dataType);
            if (line.size() == run) {
                lines << line.join(' ');
                line.clear();
            }
        }
        if (!line.isEmpty()) {
            lines << line.join(' ');
        }
        return lines.join('\n');
    }

    QByteArray bytes;
    {
        QDataStream stream(&bytes, QIODevice::WriteOnly);
        stream.setByteOrder(darray.endian == GiftiDataArray::BigEndian ? QDataStream::BigEndian
                                                                       : QDataStream::LittleEndian);

        switch (darray.dataType) {
            case NIFTI_TYPE_UINT8:      writeValues<quint8>(stream, values); break;
            case NIFTI_TYPE_INT8:       writeValues<qint8>(stream, values); break;
            case NIFTI_TYPE_INT16:      writeValues<qint16>(stream, values); break;
            case NIFTI_TYPE_UINT16:     writeValues<quint16>(stream, values); break;
            case NIFTI_TYPE_INT32:      writeValues<qint32>(stream, values); break;
            case NIFTI_TYPE_UINT32:     writeValues<quint32>(stream, values); break;
            case NIFTI_TYPE_FLOAT32:
                stream.setFloatingPointPrecision(QDataStream::SinglePrecision);
                writeValues<float>(stream, values);
                break;
            case NIFTI_TYPE_FLOAT64:
                stream.setFloatingPointPrecision(QDataStream::DoublePrecision);
                writeValues<double>(stream, values);
                break;
        }
    }

    if (darray.encoding == GiftiDataArray::GZipBase64BinaryEncoding) {
        bytes = deflateData(bytes);
    }

    return QString::fromLatin1(bytes.toBase64());
}

//=============================================================================================================

void GiftiIO::writeMetaData(QXmlStreamWriter& xml, const GiftiMetaData& meta)
{
    xml.writeStartElement("MetaData");
    for (const GiftiNVPair& pair : meta.entries()) {
        xml.writeStartElement("MD");
        xml.writeStartElement("Name");
        xml.writeCDATA(pair.name);
        xml.writeEndElement();
        xml.writeStartElement("Value");
        xml.writeCDATA(pair.value);
        xml.writeEndElement();
        xml.writeEndElement();
    }
    xml.writeEndElement();
}

//=============================================================================================================

void GiftiIO::writeDataArray(QXmlStreamWriter& xml, const GiftiDataArray& darray)
{
    if (GiftiDataArray::bytesPerValue(darray.dataType) == 0) {
        qCritical() << "GiftiIO::writeDataArray - Unsupported data type" << darray.dataType;
        throw MeshFormatError(QString("Cannot write %1 array with data type %2").arg(darray.intent).arg(darray.dataType));
    }
    if (darray.dims.isEmpty() || darray.data.size() != darray.valueCount()) {
        qCritical() << "GiftiIO::writeDataArray - Dimensions do not match data of" << darray.intent << "array";
        throw MeshFormatError(QString("Dimensions of %1 array do not match its %2 values")
                              .arg(darray.intent).arg(darray.data.size()));
    }

    xml.writeStartElement("DataArray");
    xml.writeAttribute("Intent", darray.intent);
    xml.writeAttribute("DataType", GiftiDataArray::dataTypeName(darray.dataType));
    xml.writeAttribute("ArrayIndexingOrder", GiftiDataArray::indexingOrderName(darray.indexingOrder));
    xml.writeAttribute("Dimensionality", QString::number(darray.dims.size()));
    for (int i = 0; i < darray.dims.size(); ++i) {
        xml.writeAttribute(QString("Dim%1").arg(i), QString::number(darray.dims[i]));
    }
    xml.writeAttribute("Encoding", GiftiDataArray::encodingName(darray.encoding));
    xml.writeAttribute("Endian", GiftiDataArray::endianName(darray.endian));
    xml.writeAttribute("ExternalFileName", QString());
    xml.writeAttribute("ExternalFileOffset", QString());
    for (const QPair<QString, QString>& attr : darray.otherAttributes) {
        xml.writeAttribute(attr.first, attr.second);
    }

    writeMetaData(xml, darray.meta);

    for (const GiftiCoordSystem& coordSystem : darray.coordSystems) {
        xml.writeStartElement("CoordinateSystemTransformMatrix");
        xml.writeStartElement("DataSpace");
        xml.writeCDATA(GiftiCoordSystem::spaceName(coordSystem.dataSpace));
        xml.writeEndElement();
        xml.writeStartElement("TransformedSpace");
        xml.writeCDATA(GiftiCoordSystem::spaceName(coordSystem.transformedSpace));
        xml.writeEndElement();

        QStringList rows;
        for (int r = 0; r < 4; ++r) {
            QStringList row;
            for (int c = 0; c < 4; ++c) {
                row << QString::number(coordSystem.xform(r, c), 'g', QLocale::FloatingPointShortest);
            }
            rows << row.join(' ');
        }
        xml.writeTextElement("MatrixData", rows.join('\n'));
        xml.writeEndElement();
    }

    xml.writeTextElement("Data", encodeData(darray));
    xml.writeEndElement();
}

//=============================================================================================================

QByteArray GiftiIO::inflateData(const QByteArray& compressed, const QString& sourceName)
{
    z_stream strm;
    memset(&strm, 0, sizeof(strm));

    // MAX_WBITS + 32 lets zlib detect a zlib or a gzip header
    int ret = inflateInit2(&strm, MAX_WBITS + 32);
    if (ret != Z_OK) {
        qCritical() << "GiftiIO::inflateData - inflateInit2 failed";
        throw MeshFormatError(QString("%1: could not initialize zlib").arg(sourceName));
    }

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.constData()));
    strm.avail_in = static_cast<uInt>(compressed.size());

    const int chunkSize = 256 * 1024;
    QByteArray rawData;

    do {
        rawData.resize(rawData.size() + chunkSize);
        strm.next_out = reinterpret_cast<Bytef*>(rawData.data() + rawData.size() - chunkSize);
        strm.avail_out = chunkSize;

        ret = ::inflate(&strm, Z_NO_FLUSH);
        // Z_BUF_ERROR with output space left means the input ended early
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR
            || ret == Z_STREAM_ERROR || ret == Z_BUF_ERROR) {
            qCritical() << "GiftiIO::inflateData - inflate failed for" << sourceName << "- zlib error:" << ret;
            inflateEnd(&strm);
            throw MeshFormatError(QString("%1: corrupt compressed data array (zlib error %2)").arg(sourceName).arg(ret));
        }
    } while (ret != Z_STREAM_END);

    rawData.resize(rawData.size() - static_cast<int>(strm.avail_out));
    inflateEnd(&strm);

    return rawData;
}

//=============================================================================================================

QByteArray GiftiIO::deflateData(const QByteArray& raw)
{
    z_stream strm;
    memset(&strm, 0, sizeof(strm));

    if (deflateInit(&strm, Z_DEFAULT_COMPRESSION) != Z_OK) {
        qCritical() << "GiftiIO::deflateData - deflateInit failed";
        throw MeshFormatError("Could not initialize zlib");
    }

    QByteArray compressed;
    compressed.resize(static_cast<int>(deflateBound(&strm, static_cast<uLong>(raw.size()))));

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(raw.constData()));
    strm.avail_in = static_cast<uInt>(raw.size());
    strm.next_out = reinterpret_cast<Bytef*>(compressed.data());
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = ::deflate(&strm, Z_FINISH);
    const int written = compressed.size() - static_cast<int>(strm.avail_out);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        qCritical() << "GiftiIO::deflateData - deflate failed, zlib error:" << ret;
        throw MeshFormatError(QString("Could not compress data array (zlib error %1)").arg(ret));
    }

    compressed.resize(written);
    return compressed;
}
