//=============================================================================================================
/**
 * @file     test_gifti_io.cpp
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
 * @brief    Tests for the GIFTI reader and writer.
 *
 *           Parses hand-written GIFTI documents in all three encodings, checks that metadata order,
 *           coordinate systems, label tables and unknown attributes survive a write, and that malformed
 *           documents are rejected with MeshFormatError.
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include <utils/generics/applicationlogger.h>

#include <surfnorm/gifti_io.h>
#include <surfnorm/gifti_image.h>
#include <surfnorm/surfnorm_types.h>
#include <surfnorm/surfnorm_exceptions.h>

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QtTest>
#include <QFile>
#include <QDataStream>
#include <QTemporaryDir>

//=============================================================================================================
// EIGEN INCLUDES
//=============================================================================================================

#include <Eigen/Core>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace SURFNORMLIB;
using namespace UTILSLIB;
using namespace Eigen;

//=============================================================================================================
/**
 * DECLARE CLASS TestGiftiIO
 *
 * @brief Unit tests for GiftiIO and the GIFTI data model.
 */
class TestGiftiIO : public QObject
{
    Q_OBJECT

public:
    TestGiftiIO();

private slots:
    void initTestCase();

    // Data model
    void testMetaDataOperations();
    void testToDataType();
    void testNames();

    // Parsing
    void testParseAscii();
    void testParseBase64LittleEndian();
    void testParseBase64BigEndianFloat64();
    void testParseGZip();
    void testParseColumnMajor();
    void testParseEmptyArray();

    // Writing
    void testWritePreservesDocument();
    void testWriteAllDataTypes_data();
    void testWriteAllDataTypes();
    void testWriteIsAtomic();

    // Errors
    void testMalformed_data();
    void testMalformed();
    void testMissingFile();

    void cleanupTestCase();

private:
    QByteArray gifti(const QString& body, const QString& rootAttributes = QString()) const;
    QByteArray dataArray(const QString& attributes, const QString& data, const QString& children = QString()) const;

    QTemporaryDir m_tempDir;    /**< Temporary directory for output files. */
    MatrixXd m_matVertices;     /**< 4 x 3 vertex coordinates used throughout. */
};

//=============================================================================================================

TestGiftiIO::TestGiftiIO()
{
    m_matVertices.resize(4, 3);
    m_matVertices << -12.5,  3.25,   40.0,
                      0.0,  -7.75,   1.5,
                      8.125, 16.0,  -2.0,
                    100.0,   0.5,  -64.0;
}

//=============================================================================================================

QByteArray TestGiftiIO::gifti(const QString& body, const QString& rootAttributes) const
{
    QString doc = QString("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                          "<!DOCTYPE GIFTI SYSTEM \"http://www.nitrc.org/frs/download.php/115/gifti.dtd\">\n"
                          "<GIFTI Version=\"1.0\" %1>\n%2\n</GIFTI>\n").arg(rootAttributes, body);
    return doc.toUtf8();
}

//=============================================================================================================

QByteArray TestGiftiIO::dataArray(const QString& attributes, const QString& data, const QString& children) const
{
    return QString("<DataArray %1>\n%2\n<Data>%3</Data>\n</DataArray>").arg(attributes, children, data).toUtf8();
}

//=============================================================================================================

void TestGiftiIO::initTestCase()
{
    qInstallMessageHandler(ApplicationLogger::customLogWriter);

    QVERIFY(m_tempDir.isValid());
}

//=============================================================================================================

void TestGiftiIO::testMetaDataOperations()
{
    GiftiMetaData meta;
    QVERIFY(meta.isEmpty());

    meta.append("A", "1");
    meta.append("B", "2");
    meta.append("C", "3");
    QCOMPARE(meta.size(), 3);
    QCOMPARE(meta.indexOf("B"), 1);
    QCOMPARE(meta.indexOf("Z"), -1);
    QCOMPARE(meta.value("Z", "default"), QString("default"));

    // Replace in place
    meta.setValue("B", "two");
    QCOMPARE(meta.size(), 3);
    QCOMPARE(meta.at(1).value, QString("two"));

    // Append when absent
    meta.setValue("D", "4");
    QCOMPARE(meta.at(3).name, QString("D"));

    // Insertion past the end appends
    meta.insert(1, "X", "x");
    meta.insert(100, "Y", "y");
    meta.insert(-3, "W", "w");
    QStringList names;
    for (const GiftiNVPair& pair : meta.entries()) {
        names << pair.name;
    }
    QCOMPARE(names, QStringList() << "W" << "A" << "X" << "B" << "C" << "D" << "Y");

    // Duplicated names
    meta.append("B", "again");
    QCOMPARE(meta.indexOf("B"), 3);
    QCOMPARE(meta.lastIndexOf("B"), 7);
    QCOMPARE(meta.lastIndexOf("Z"), -1);
    QCOMPARE(meta.value("B"), QString("two"));
    QCOMPARE(meta.lastValue("B"), QString("again"));
    QCOMPARE(meta.lastValue("Z", "default"), QString("default"));

    QCOMPARE(meta.replaceAll("B", "0"), 2);
    QCOMPARE(meta.size(), 8);
    QCOMPARE(meta.at(3).value, QString("0"));
    QCOMPARE(meta.at(7).value, QString("0"));
    QCOMPARE(meta.replaceAll("Z", "0"), 0);
    QCOMPARE(meta.size(), 8);
    QVERIFY(!meta.contains("Z"));

    meta.clear();
    QVERIFY(meta.isEmpty());
}

//=============================================================================================================

void TestGiftiIO::testToDataType()
{
    MatrixXd values(1, 4);
    values << 3.7, -3.7, 40000.0, -0.5;

    MatrixXd int16 = GiftiDataArray::toDataType(values, NIFTI_TYPE_INT16);
    QCOMPARE(int16(0,0), 3.0);
    QCOMPARE(int16(0,1), -3.0);
    QCOMPARE(int16(0,2), 32767.0);

    MatrixXd uint8 = GiftiDataArray::toDataType(values, NIFTI_TYPE_UINT8);
    QCOMPARE(uint8(0,1), 0.0);
    QCOMPARE(uint8(0,2), 255.0);

    MatrixXd float32 = GiftiDataArray::toDataType(values, NIFTI_TYPE_FLOAT32);
    QCOMPARE(float32(0,0), static_cast<double>(3.7f));
    QVERIFY(float32(0,0) != 3.7);

    QVERIFY(GiftiDataArray::toDataType(values, NIFTI_TYPE_FLOAT64) == values);
}

//=============================================================================================================

void TestGiftiIO::testNames()
{
    bool ok = false;
    QCOMPARE(GiftiDataArray::dataTypeFromName("NIFTI_TYPE_FLOAT32", &ok), NIFTI_TYPE_FLOAT32);
    QVERIFY(ok);
    QCOMPARE(GiftiDataArray::dataTypeFromName(" NIFTI_TYPE_UINT16 ", &ok), NIFTI_TYPE_UINT16);
    QVERIFY(ok);
    GiftiDataArray::dataTypeFromName("NIFTI_TYPE_COMPLEX64", &ok);
    QVERIFY(!ok);

    QVERIFY(GiftiDataArray::encodingFromName("GIFTI_ENCODING_B64GZ", &ok) == GiftiDataArray::GZipBase64BinaryEncoding);
    QVERIFY(ok);
    QVERIFY(GiftiDataArray::encodingFromName("ASCII", &ok) == GiftiDataArray::AsciiEncoding);
    QVERIFY(ok);
    GiftiDataArray::encodingFromName("ExternalFileBinary", &ok);
    QVERIFY(!ok);

    QCOMPARE(GiftiCoordSystem::spaceFromName("NIFTI_XFORM_TALAIRACH", &ok), NIFTI_XFORM_TALAIRACH);
    QVERIFY(ok);
    QCOMPARE(GiftiCoordSystem::spaceName(NIFTI_XFORM_ALIGNED_ANAT), QString("NIFTI_XFORM_ALIGNED_ANAT"));
    GiftiCoordSystem::spaceFromName("NIFTI_XFORM_SOMEWHERE", &ok);
    QVERIFY(!ok);
}

//=============================================================================================================

void TestGiftiIO::testParseAscii()
{
    QByteArray doc = gifti(
        "<MetaData>\n"
        "  <MD><Name><![CDATA[UserName]]></Name><Value><![CDATA[tester]]></Value></MD>\n"
        "</MetaData>\n"
        + dataArray("Intent=\"NIFTI_INTENT_POINTSET\" DataType=\"NIFTI_TYPE_FLOAT32\" "
                    "ArrayIndexingOrder=\"RowMajorOrder\" Dimensionality=\"2\" Dim0=\"4\" Dim1=\"3\" "
                    "Encoding=\"ASCII\" Endian=\"LittleEndian\" ExternalFileName=\"\" ExternalFileOffset=\"\"",
                    "-12.5 3.25 40\n0 -7.75 1.5\n8.125 16 -2\n100 0.5 -64",
                    "<MetaData>\n"
                    "  <MD><Name><![CDATA[VolGeomC_R]]></Name><Value><![CDATA[5.500000]]></Value></MD>\n"
                    "  <MD><Name><![CDATA[AnatomicalStructurePrimary]]></Name><Value><![CDATA[CortexLeft]]></Value></MD>\n"
                    "  <MD><Name><![CDATA[VolGeomC_A]]></Name><Value><![CDATA[-18.000000]]></Value></MD>\n"
                    "</MetaData>\n"
                    "<CoordinateSystemTransformMatrix>\n"
                    "  <DataSpace><![CDATA[NIFTI_XFORM_UNKNOWN]]></DataSpace>\n"
                    "  <TransformedSpace><![CDATA[NIFTI_XFORM_TALAIRACH]]></TransformedSpace>\n"
                    "  <MatrixData>1 0 0 10\n0 1 0 20\n0 0 1 30\n0 0 0 1</MatrixData>\n"
                    "</CoordinateSystemTransformMatrix>")
        + dataArray("Intent=\"NIFTI_INTENT_TRIANGLE\" DataType=\"NIFTI_TYPE_INT32\" "
                    "ArrayIndexingOrder=\"RowMajorOrder\" Dimensionality=\"2\" Dim0=\"2\" Dim1=\"3\" "
                    "Encoding=\"ASCII\" Endian=\"LittleEndian\" ExternalFileName=\"\" ExternalFileOffset=\"\"",
                    "0 1 2\n1 2 3"),
        "NumberOfDataArrays=\"2\"");

    GiftiImage image = GiftiIO::parse(doc, "ascii.gii");

    QCOMPARE(image.version, QString("1.0"));
    QCOMPARE(image.meta.value("UserName"), QString("tester"));
    QCOMPARE(image.darrays.size(), 2);
    QCOMPARE(image.indexOfIntent(GIFTI_INTENT_POINTSET), 0);
    QCOMPARE(image.indexOfIntent(GIFTI_INTENT_TRIANGLE), 1);

    const GiftiDataArray& points = image.darrays[0];
    QCOMPARE(points.dataType, NIFTI_TYPE_FLOAT32);
    QVERIFY(points.encoding == GiftiDataArray::AsciiEncoding);
    QCOMPARE(points.dims, QVector<int>() << 4 << 3);
    QVERIFY(points.data.isApprox(m_matVertices));

    QCOMPARE(points.meta.size(), 3);
    QCOMPARE(points.meta.at(0).name, QString("VolGeomC_R"));
    QCOMPARE(points.meta.at(1).name, QString("AnatomicalStructurePrimary"));
    QCOMPARE(points.meta.at(2).value, QString("-18.000000"));

    QCOMPARE(points.coordSystems.size(), 1);
    QCOMPARE(points.coordSystems[0].dataSpace, NIFTI_XFORM_UNKNOWN);
    QCOMPARE(points.coordSystems[0].transformedSpace, NIFTI_XFORM_TALAIRACH);
    QCOMPARE(points.coordSystems[0].xform(0,3), 10.0);
    QCOMPARE(points.coordSystems[0].xform(2,3), 30.0);
    QCOMPARE(points.coordSystems[0].xform(3,3), 1.0);

    const GiftiDataArray& faces = image.darrays[1];
    QCOMPARE(faces.dataType, NIFTI_TYPE_INT32);
    QCOMPARE(faces.data(1,2), 3.0);
    QVERIFY(faces.coordSystems.isEmpty());
}

//=============================================================================================================

void TestGiftiIO::testParseBase64LittleEndian()
{
    QByteArray bytes;
    {
        QDataStream stream(&bytes, QIODevice::WriteOnly);
        stream.setByteOrder(QDataStream::LittleEndian);
        stream.setFloatingPointPrecision(QDataStream::SinglePrecision);
        for (int r = 0; r < m_matVertices.rows(); ++r) {
            for (int c = 0; c < 3; ++c) {
                stream << static_cast<float>(m_matVertices(r,c));
            }
        }
    }

    QByteArray doc = gifti(dataArray("Intent=\"NIFTI_INTENT_POINTSET\" DataType=\"NIFTI_TYPE_FLOAT32\" "
                                     "ArrayIndexingOrder=\"RowMajorOrder\" Dimensionality=\"2\" Dim0=\"4\" Dim1=\"3\" "
                                     "Encoding=\"Base64Binary\" Endian=\"LittleEndian\" ExternalFileName=\"\" ExternalFileOffset=\"\"",
                                     QString::fromLatin1(bytes.toBase64())));

    GiftiImage image = GiftiIO::parse(doc);
    QCOMPARE(image.darrays.size(), 1);
    QVERIFY(image.darrays[0].encoding == GiftiDataArray::Base64BinaryEncoding);
    QVERIFY(image.darrays[0].data.isApprox(m_matVertices));
}

//=============================================================================================================

void TestGiftiIO::testParseBase64BigEndianFloat64()
{
    QByteArray bytes;
    {
        QDataStream stream(&bytes, QIODevice::WriteOnly);
        stream.setByteOrder(QDataStream::BigEndian);
        stream.setFloatingPointPrecision(QDataStream::DoublePrecision);
        for (int r = 0; r < m_matVertices.rows(); ++r) {
            for (int c = 0; c < 3; ++c) {
                stream << m_matVertices(r,c) + 0.1;
            }
        }
    }

    QByteArray doc = gifti(dataArray("Intent=\"NIFTI_INTENT_POINTSET\" DataType=\"NIFTI_TYPE_FLOAT64\" "
                                     "ArrayIndexingOrder=\"RowMajorOrder\" Dimensionality=\"2\" Dim0=\"4\" Dim1=\"3\" "
                                     "Encoding=\"Base64Binary\" Endian=\"BigEndian\"",
                                     QString::fromLatin1(bytes.toBase64())));

    GiftiImage image = GiftiIO::parse(doc);
    const GiftiDataArray& points = image.darrays[0];
    QVERIFY(points.endian == GiftiDataArray::BigEndian);
    QCOMPARE(points.dataType, NIFTI_TYPE_FLOAT64);

    MatrixXd expected = (m_matVertices.array() + 0.1).matrix();
    QVERIFY(points.data == expected);
}

//=============================================================================================================

void TestGiftiIO::testParseGZip()
{
    QByteArray bytes;
    {
        QDataStream stream(&bytes, QIODevice::WriteOnly);
        stream.setByteOrder(QDataStream::LittleEndian);
        for (qint32 i : {0, 1, 2, 1, 3, 2}) {
            stream << i;
        }
    }
    // qCompress prefixes the zlib stream with the 4 byte uncompressed size
    QByteArray compressed = qCompress(bytes).mid(4);

    QByteArray doc = gifti(dataArray("Intent=\"NIFTI_INTENT_TRIANGLE\" DataType=\"NIFTI_TYPE_INT32\" "
                                     "ArrayIndexingOrder=\"RowMajorOrder\" Dimensionality=\"2\" Dim0=\"2\" Dim1=\"3\" "
                                     "Encoding=\"GZipBase64Binary\" Endian=\"LittleEndian\"",
                                     QString::fromLatin1(compressed.toBase64())));

    GiftiImage image = GiftiIO::parse(doc);
    const GiftiDataArray& faces = image.darrays[0];
    QCOMPARE(faces.rows(), static_cast<Index>(2));
    QCOMPARE(faces.data(0,2), 2.0);
    QCOMPARE(faces.data(1,0), 1.0);
    QCOMPARE(faces.data(1,1), 3.0);
}

//=============================================================================================================

void TestGiftiIO::testParseColumnMajor()
{
    // Columns first: x of all vertices, then y, then z
    QByteArray doc = gifti(dataArray("Intent=\"NIFTI_INTENT_POINTSET\" DataType=\"NIFTI_TYPE_FLOAT64\" "
                                     "ArrayIndexingOrder=\"ColumnMajorOrder\" Dimensionality=\"2\" Dim0=\"2\" Dim1=\"3\" "
                                     "Encoding=\"ASCII\" Endian=\"LittleEndian\"",
                                     "1 4\n2 5\n3 6"));

    GiftiImage image = GiftiIO::parse(doc);
    const GiftiDataArray& points = image.darrays[0];
    QVERIFY(points.indexingOrder == GiftiDataArray::ColumnMajorOrder);

    MatrixXd expected(2,3);
    expected << 1, 2, 3,
                4, 5, 6;
    QVERIFY(points.data == expected);

    // Written back in column major order as well
    GiftiImage reread = GiftiIO::parse(GiftiIO::serialize(image));
    QVERIFY(reread.darrays[0].indexingOrder == GiftiDataArray::ColumnMajorOrder);
    QVERIFY(reread.darrays[0].data == expected);
}

//=============================================================================================================

void TestGiftiIO::testParseEmptyArray()
{
    QByteArray doc = gifti(dataArray("Intent=\"NIFTI_INTENT_TRIANGLE\" DataType=\"NIFTI_TYPE_INT32\" "
                                     "ArrayIndexingOrder=\"RowMajorOrder\" Dimensionality=\"2\" Dim0=\"0\" Dim1=\"3\" "
                                     "Encoding=\"GZipBase64Binary\" Endian=\"LittleEndian\"",
                                     QString()));

    GiftiImage image = GiftiIO::parse(doc);
    QCOMPARE(image.darrays[0].rows(), static_cast<Index>(0));
    QCOMPARE(image.darrays[0].cols(), static_cast<Index>(3));
}

//=============================================================================================================

void TestGiftiIO::testWritePreservesDocument()
{
    QByteArray doc = gifti(
        "<MetaData>\n"
        "  <MD><Name>Date</Name><Value>Thu Jan  1 00:00:00 2026</Value></MD>\n"
        "</MetaData>\n"
        "<LabelTable>\n"
        "  <Label Key=\"0\" Red=\"1\" Green=\"1\" Blue=\"1\" Alpha=\"0\"><![CDATA[???]]></Label>\n"
        "  <Label Key=\"1\" Red=\"0.5\" Green=\"0\" Blue=\"0\" Alpha=\"1\"><![CDATA[cortex]]></Label>\n"
        "</LabelTable>\n"
        + dataArray("Intent=\"NIFTI_INTENT_POINTSET\" DataType=\"NIFTI_TYPE_FLOAT32\" "
                    "ArrayIndexingOrder=\"RowMajorOrder\" Dimensionality=\"2\" Dim0=\"4\" Dim1=\"3\" "
                    "Encoding=\"ASCII\" Endian=\"LittleEndian\" ExternalFileName=\"\" ExternalFileOffset=\"\" "
                    "Producer=\"mris_convert\"",
                    "-12.5 3.25 40\n0 -7.75 1.5\n8.125 16 -2\n100 0.5 -64",
                    "<MetaData>\n"
                    "  <MD><Name>VolGeomC_S</Name><Value>12.000000</Value></MD>\n"
                    "  <MD><Name>AnatomicalStructurePrimary</Name><Value>CortexLeft</Value></MD>\n"
                    "</MetaData>\n"
                    "<CoordinateSystemTransformMatrix>\n"
                    "  <DataSpace>NIFTI_XFORM_SCANNER_ANAT</DataSpace>\n"
                    "  <TransformedSpace>NIFTI_XFORM_SCANNER_ANAT</TransformedSpace>\n"
                    "  <MatrixData>0.5 0 0 1.25\n0 0.5 0 -2\n0 0 0.5 3\n0 0 0 1</MatrixData>\n"
                    "</CoordinateSystemTransformMatrix>")
        + dataArray("Intent=\"NIFTI_INTENT_TRIANGLE\" DataType=\"NIFTI_TYPE_INT32\" "
                    "ArrayIndexingOrder=\"RowMajorOrder\" Dimensionality=\"2\" Dim0=\"2\" Dim1=\"3\" "
                    "Encoding=\"ASCII\" Endian=\"BigEndian\"",
                    "0 1 2\n1 2 3"),
        "xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\" NumberOfDataArrays=\"2\"");

    GiftiImage original = GiftiIO::parse(doc, "original.gii");

    QString path = m_tempDir.filePath("written.gii");
    GiftiIO::write(original, path);
    QVERIFY(QFile::exists(path));

    GiftiImage reread = GiftiIO::read(path);

    QCOMPARE(reread.version, original.version);
    QCOMPARE(reread.otherAttributes, original.otherAttributes);
    QCOMPARE(reread.otherAttributes.size(), 1);
    QVERIFY(reread.meta == original.meta);

    QVERIFY(reread.hasLabelTable);
    QCOMPARE(reread.labelTable.size(), 2);
    QCOMPARE(reread.labelTable[1].text, QString("cortex"));
    QCOMPARE(reread.labelTable[1].attributes, original.labelTable[1].attributes);

    QCOMPARE(reread.darrays.size(), 2);
    for (int i = 0; i < 2; ++i) {
        const GiftiDataArray& a = original.darrays[i];
        const GiftiDataArray& b = reread.darrays[i];
        QCOMPARE(b.intent, a.intent);
        QCOMPARE(b.dataType, a.dataType);
        QVERIFY(b.encoding == a.encoding);
        QVERIFY(b.endian == a.endian);
        QVERIFY(b.indexingOrder == a.indexingOrder);
        QCOMPARE(b.dims, a.dims);
        QCOMPARE(b.otherAttributes, a.otherAttributes);
        QVERIFY(b.meta == a.meta);
        QCOMPARE(b.coordSystems.size(), a.coordSystems.size());
        QVERIFY(b.data == a.data);
    }
    QVERIFY(reread.darrays[0].coordSystems[0] == original.darrays[0].coordSystems[0]);
    QCOMPARE(reread.darrays[0].otherAttributes.at(0).first, QString("Producer"));
}

//=============================================================================================================

void TestGiftiIO::testWriteAllDataTypes_data()
{
    QTest::addColumn<int>("dataType");
    QTest::addColumn<int>("encoding");

    QTest::newRow("uint8 gzip")     << NIFTI_TYPE_UINT8   << static_cast<int>(GiftiDataArray::GZipBase64BinaryEncoding);
    QTest::newRow("int8 base64")    << NIFTI_TYPE_INT8    << static_cast<int>(GiftiDataArray::Base64BinaryEncoding);
    QTest::newRow("int16 ascii")    << NIFTI_TYPE_INT16   << static_cast<int>(GiftiDataArray::AsciiEncoding);
    QTest::newRow("uint16 gzip")    << NIFTI_TYPE_UINT16  << static_cast<int>(GiftiDataArray::GZipBase64BinaryEncoding);
    QTest::newRow("int32 base64")   << NIFTI_TYPE_INT32   << static_cast<int>(GiftiDataArray::Base64BinaryEncoding);
    QTest::newRow("uint32 gzip")    << NIFTI_TYPE_UINT32  << static_cast<int>(GiftiDataArray::GZipBase64BinaryEncoding);
    QTest::newRow("float32 ascii")  << NIFTI_TYPE_FLOAT32 << static_cast<int>(GiftiDataArray::AsciiEncoding);
    QTest::newRow("float64 ascii")  << NIFTI_TYPE_FLOAT64 << static_cast<int>(GiftiDataArray::AsciiEncoding);
}

//=============================================================================================================

void TestGiftiIO::testWriteAllDataTypes()
{
    QFETCH(int, dataType);
    QFETCH(int, encoding);

    MatrixXd values(3, 2);
    values << 0.0, 1.0,
              17.25, 100.5,
              -1.0 / 3.0, 127.0;

    GiftiDataArray darray;
    darray.intent = "NIFTI_INTENT_SHAPE";
    darray.dataType = dataType;
    darray.encoding = static_cast<GiftiDataArray::Encoding>(encoding);
    darray.setData(values);

    GiftiImage image;
    image.darrays.append(darray);

    GiftiImage reread = GiftiIO::parse(GiftiIO::serialize(image));
    QCOMPARE(reread.darrays.size(), 1);
    QCOMPARE(reread.darrays[0].dataType, dataType);
    QVERIFY(reread.darrays[0].encoding == darray.encoding);

    // Exactly the stored (type converted) values come back
    QVERIFY(reread.darrays[0].data == darray.data);
}

//=============================================================================================================

void TestGiftiIO::testWriteIsAtomic()
{
    GiftiImage image;
    GiftiDataArray darray;
    darray.intent = "NIFTI_INTENT_SHAPE";
    darray.setData(MatrixXd::Ones(3, 1));
    image.darrays.append(darray);

    QString path = m_tempDir.filePath("no_such_dir/out.gii");
    QVERIFY_EXCEPTION_THROWN(GiftiIO::write(image, path), FileAccessError);
    QVERIFY(!QFile::exists(path));

    // Inconsistent dimensions are rejected before anything is written
    image.darrays[0].dims = QVector<int>() << 5;
    QString badPath = m_tempDir.filePath("bad_dims.gii");
    QVERIFY_EXCEPTION_THROWN(GiftiIO::write(image, badPath), MeshFormatError);
    QVERIFY(!QFile::exists(badPath));
}

//=============================================================================================================

void TestGiftiIO::testMalformed_data()
{
    QTest::addColumn<QByteArray>("document");

    const QString points = "Intent=\"NIFTI_INTENT_POINTSET\" ArrayIndexingOrder=\"RowMajorOrder\" "
                           "Dimensionality=\"2\" Dim0=\"2\" Dim1=\"3\" Endian=\"LittleEndian\" ";

    QTest::newRow("not xml") << QByteArray("this is not a surface");
    QTest::newRow("wrong root") << QByteArray("<?xml version=\"1.0\"?><NIFTI></NIFTI>");
    QTest::newRow("unclosed") << QByteArray("<?xml version=\"1.0\"?><GIFTI Version=\"1.0\"><DataArray>");
    QTest::newRow("unknown data type")
        << gifti(dataArray(points + "DataType=\"NIFTI_TYPE_COMPLEX64\" Encoding=\"ASCII\"", "1 2 3 4 5 6"));
    QTest::newRow("unknown encoding")
        << gifti(dataArray(points + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"Hex\"", "1 2 3 4 5 6"));
    QTest::newRow("external file")
        << gifti(dataArray(points + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"ExternalFileBinary\" "
                           "ExternalFileName=\"lh.white.dat\" ExternalFileOffset=\"0\"", QString()));
    QTest::newRow("missing dim")
        << gifti(dataArray("Intent=\"NIFTI_INTENT_POINTSET\" DataType=\"NIFTI_TYPE_FLOAT32\" "
                           "Dimensionality=\"2\" Dim0=\"2\" Encoding=\"ASCII\"", "1 2 3 4 5 6"));
    QTest::newRow("too few values")
        << gifti(dataArray(points + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"ASCII\"", "1 2 3 4 5"));
    QTest::newRow("not a number")
        << gifti(dataArray(points + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"ASCII\"", "1 2 3 4 5 x"));
    QTest::newRow("short binary")
        << gifti(dataArray(points + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"Base64Binary\"",
                           QString::fromLatin1(QByteArray(20, '\0').toBase64())));
    const QString hugePoints = "Intent=\"NIFTI_INTENT_POINTSET\" ArrayIndexingOrder=\"RowMajorOrder\" "
                               "Dimensionality=\"2\" Dim0=\"2000000000\" Dim1=\"3\" Endian=\"LittleEndian\" ";
    QTest::newRow("huge dims ascii")
        << gifti(dataArray(hugePoints + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"ASCII\"", QString()));
    QTest::newRow("huge dims binary")
        << gifti(dataArray(hugePoints + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"Base64Binary\"",
                           QString::fromLatin1(QByteArray(24, '\0').toBase64())));
    QTest::newRow("huge dims gzip")
        << gifti(dataArray(hugePoints + "DataType=\"NIFTI_TYPE_FLOAT64\" Encoding=\"GZipBase64Binary\"",
                           QString::fromLatin1(qCompress(QByteArray(48, '\0')).mid(4).toBase64())));
    QTest::newRow("overflowing dims")
        << gifti(dataArray("Intent=\"NIFTI_INTENT_POINTSET\" DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"ASCII\" "
                           "Dimensionality=\"4\" Dim0=\"2000000000\" Dim1=\"2000000000\" "
                           "Dim2=\"2000000000\" Dim3=\"2000000000\"", "1 2 3"));
    QTest::newRow("corrupt gzip")
        << gifti(dataArray(points + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"GZipBase64Binary\"",
                           QString::fromLatin1(QByteArray("definitely not zlib").toBase64())));
    QTest::newRow("bad coordinate system")
        << gifti(dataArray(points + "DataType=\"NIFTI_TYPE_FLOAT32\" Encoding=\"ASCII\"", "1 2 3 4 5 6",
                           "<CoordinateSystemTransformMatrix>"
                           "<DataSpace>NIFTI_XFORM_UNKNOWN</DataSpace>"
                           "<TransformedSpace>NIFTI_XFORM_UNKNOWN</TransformedSpace>"
                           "<MatrixData>1 0 0 0 1 0</MatrixData>"
                           "</CoordinateSystemTransformMatrix>"));
}

//=============================================================================================================

void TestGiftiIO::testMalformed()
{
    QFETCH(QByteArray, document);

    QVERIFY_EXCEPTION_THROWN(GiftiIO::parse(document, "malformed.gii"), MeshFormatError);
}

//=============================================================================================================

void TestGiftiIO::testMissingFile()
{
    QVERIFY_EXCEPTION_THROWN(GiftiIO::read(m_tempDir.filePath("missing.surf.gii")), FileAccessError);
}

//=============================================================================================================

void TestGiftiIO::cleanupTestCase()
{
}

//=============================================================================================================
// MAIN
//=============================================================================================================

QTEST_GUILESS_MAIN(TestGiftiIO)
#include "test_gifti_io.moc"
