//=============================================================================================================
/**
 * @file     test_transform_loader.cpp
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
 * @brief    Tests for TransformLoader.
 *
 *           Covers the plain 4x4 matrix format (.mat), the FreeSurfer LTA format (.lta), the identity default
 *           for an empty path, and the errors raised for malformed or unsupported files.
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include <utils/generics/applicationlogger.h>

#include <surfnorm/transform_loader.h>
#include <surfnorm/surfnorm_exceptions.h>

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QtTest>
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

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
 * DECLARE CLASS TestTransformLoader
 *
 * @brief Unit tests for TransformLoader.
 */
class TestTransformLoader : public QObject
{
    Q_OBJECT

public:
    TestTransformLoader();

private slots:
    void initTestCase();

    void testEmptyPathIsIdentity();
    void testFormatOf();
    void testUnsupportedExtension();
    void testMissingFile();

    // Plain matrix
    void testPlainMatrix();
    void testPlainMatrixCommentsAndBlankLines();
    void testPlainMatrixTooFewRows();
    void testPlainMatrixTooManyRows();
    void testPlainMatrixBadRow();

    // LTA
    void testLta();
    void testLtaUpperCaseExtension();
    void testLtaMissingMarker();
    void testLtaTruncatedBlock();
    void testLtaBadRow();

    void cleanupTestCase();

private:
    QString writeFile(const QString& name, const QString& content);

    QTemporaryDir m_tempDir;    /**< Temporary directory for transform files. */
    Matrix4d m_matExample;      /**< Matrix used in the example files. */
};

//=============================================================================================================

TestTransformLoader::TestTransformLoader()
{
    m_matExample << 0.9, -0.1, 0.0, 12.5,
                    0.1,  0.9, 0.0, -3.0,
                    0.0,  0.0, 1.1,  7.25,
                    0.0,  0.0, 0.0,  1.0;
}

//=============================================================================================================

QString TestTransformLoader::writeFile(const QString& name, const QString& content)
{
    QString path = m_tempDir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        return QString();
    }
    QTextStream out(&file);
    out << content;
    return path;
}

//=============================================================================================================

void TestTransformLoader::initTestCase()
{
    qInstallMessageHandler(ApplicationLogger::customLogWriter);

    QVERIFY(m_tempDir.isValid());
}

//=============================================================================================================

void TestTransformLoader::testEmptyPathIsIdentity()
{
    QVERIFY(TransformLoader::read().isIdentity());
    QVERIFY(TransformLoader::read(QString()).isIdentity());
}

//=============================================================================================================

void TestTransformLoader::testFormatOf()
{
    QVERIFY(TransformLoader::formatOf("reg.mat") == TransformLoader::PlainMatrix);
    QVERIFY(TransformLoader::formatOf("/data/sub-01/reg.lta") == TransformLoader::Lta);
    QVERIFY(TransformLoader::formatOf("REG.MAT") == TransformLoader::PlainMatrix);
}

//=============================================================================================================

void TestTransformLoader::testUnsupportedExtension()
{
    QString path = writeFile("reg.txt", "1 0 0 0\n0 1 0 0\n0 0 1 0\n0 0 0 1\n");
    QVERIFY(!path.isEmpty());

    QVERIFY_EXCEPTION_THROWN(TransformLoader::read(path), UnsupportedFormatError);
    QVERIFY_EXCEPTION_THROWN(TransformLoader::read(m_tempDir.filePath("reg.xfm")), UnsupportedFormatError);
}

//=============================================================================================================

void TestTransformLoader::testMissingFile()
{
    QVERIFY_EXCEPTION_THROWN(TransformLoader::read(m_tempDir.filePath("does_not_exist.mat")), FileAccessError);
}

//=============================================================================================================

void TestTransformLoader::testPlainMatrix()
{
    QString path = writeFile("example.mat",
                             "0.9 -0.1 0.0 12.5\n"
                             "0.1  0.9 0.0 -3.0\n"
                             "0.0  0.0 1.1  7.25\n"
                             "0.0  0.0 0.0  1.0\n");
    QVERIFY(!path.isEmpty());

    Matrix4d m = TransformLoader::read(path);
    QVERIFY(m.isApprox(m_matExample));
}

//=============================================================================================================

void TestTransformLoader::testPlainMatrixCommentsAndBlankLines()
{
    QString path = writeFile("commented.mat",
                             "# written by flirt\n"
                             "\n"
                             "  0.9\t-0.1 0.0 12.5  \n"
                             "0.1 0.9 0.0 -3.0\n"
                             "\n"
                             "0.0 0.0 1.1 7.25\n"
                             "0.0 0.0 0.0 1.0\n"
                             "\n");
    QVERIFY(!path.isEmpty());

    Matrix4d m = TransformLoader::read(path);
    QVERIFY(m.isApprox(m_matExample));
}

//=============================================================================================================

void TestTransformLoader::testPlainMatrixTooFewRows()
{
    QString path = writeFile("short.mat", "1 0 0 0\n0 1 0 0\n0 0 1 0\n");
    QVERIFY(!path.isEmpty());

    QVERIFY_EXCEPTION_THROWN(TransformLoader::read(path), FormatError);
}

//=============================================================================================================

void TestTransformLoader::testPlainMatrixTooManyRows()
{
    QString path = writeFile("long.mat", "1 0 0 0\n0 1 0 0\n0 0 1 0\n0 0 0 1\n0 0 0 1\n");
    QVERIFY(!path.isEmpty());

    QVERIFY_EXCEPTION_THROWN(TransformLoader::read(path), FormatError);
}

//=============================================================================================================

void TestTransformLoader::testPlainMatrixBadRow()
{
    QStringList threeColumns = QStringList() << "1 0 0" << "0 1 0 0" << "0 0 1 0" << "0 0 0 1";
    QVERIFY_EXCEPTION_THROWN(TransformLoader::parsePlainMatrix(threeColumns), FormatError);

    QStringList notNumbers = QStringList() << "1 0 0 0" << "0 one 0 0" << "0 0 1 0" << "0 0 0 1";
    QVERIFY_EXCEPTION_THROWN(TransformLoader::parsePlainMatrix(notNumbers), FormatError);
}

//=============================================================================================================

void TestTransformLoader::testLta()
{
    QString path = writeFile("example.lta",
                             "# transform file example.lta\n"
                             "type      = 1 # LINEAR_RAS_TO_RAS\n"
                             "nxforms   = 1\n"
                             "mean      = 0.0000 0.0000 0.0000\n"
                             "sigma     = 1.0000\n"
                             "1 4 4\n"
                             "9.000000000000000e-01 -1.000000000000000e-01 0.000000000000000e+00 1.250000000000000e+01\n"
                             "1.000000000000000e-01 9.000000000000000e-01 0.000000000000000e+00 -3.000000000000000e+00\n"
                             "0.000000000000000e+00 0.000000000000000e+00 1.100000000000000e+00 7.250000000000000e+00\n"
                             "0.000000000000000e+00 0.000000000000000e+00 0.000000000000000e+00 1.000000000000000e+00\n"
                             "src volume info\n"
                             "valid = 1  # volume info valid\n"
                             "filename = T1.mgz\n");
    QVERIFY(!path.isEmpty());

    Matrix4d m = TransformLoader::read(path);
    QVERIFY(m.isApprox(m_matExample));
}

//=============================================================================================================

void TestTransformLoader::testLtaUpperCaseExtension()
{
    QString path = writeFile("identity.LTA", "1 4 4\n1 0 0 0\n0 1 0 0\n0 0 1 0\n0 0 0 1\n");
    QVERIFY(!path.isEmpty());

    QVERIFY(TransformLoader::read(path).isIdentity());
}

//=============================================================================================================

void TestTransformLoader::testLtaMissingMarker()
{
    QString path = writeFile("nomarker.lta",
                             "type = 1\n"
                             "nxforms = 1\n"
                             "1 0 0 0\n0 1 0 0\n0 0 1 0\n0 0 0 1\n");
    QVERIFY(!path.isEmpty());

    QVERIFY_EXCEPTION_THROWN(TransformLoader::read(path), FormatError);
}

//=============================================================================================================

void TestTransformLoader::testLtaTruncatedBlock()
{
    QString path = writeFile("truncated.lta", "1 4 4\n1 0 0 0\n0 1 0 0\n0 0 1 0\n");
    QVERIFY(!path.isEmpty());

    QVERIFY_EXCEPTION_THROWN(TransformLoader::read(path), FormatError);
}

//=============================================================================================================

void TestTransformLoader::testLtaBadRow()
{
    QStringList lines = QStringList() << "1 4 4" << "1 0 0 0" << "" << "0 0 1 0" << "0 0 0 1";
    QVERIFY_EXCEPTION_THROWN(TransformLoader::parseLta(lines), FormatError);
}

//=============================================================================================================

void TestTransformLoader::cleanupTestCase()
{
}

//=============================================================================================================
// MAIN
//=============================================================================================================

QTEST_GUILESS_MAIN(TestTransformLoader)
#include "test_transform_loader.moc"
