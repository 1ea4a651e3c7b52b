//=============================================================================================================
/**
 * @file     applicationlogger.cpp
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
 * @brief    ApplicationLogger class definition.
 *
 */

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "applicationlogger.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QDateTime>
#include <QMutexLocker>

//=============================================================================================================
// STL INCLUDES
//=============================================================================================================

#include <cstdio>
#include <cstdlib>

//=============================================================================================================
// USED NAMESPACES
//=============================================================================================================

using namespace UTILSLIB;

//=============================================================================================================
// DEFINE STATIC MEMBERS
//=============================================================================================================

QMutex ApplicationLogger::m_mutex;

//=============================================================================================================
// DEFINE MEMBER METHODS
//=============================================================================================================

void ApplicationLogger::customLogWriter(QtMsgType type,
                                        const QMessageLogContext &context,
                                        const QString &msg)
{
    Q_UNUSED(context);

    QMutexLocker locker(&m_mutex);

    QString sTime = QDateTime::currentDateTime().toString("dd.MM.yyyy hh:mm:ss.zzz");
    FILE* out = stdout;
    QString sTag;

    switch (type) {
        case QtDebugMsg:
            sTag = "Debug";
            break;
        case QtInfoMsg:
            sTag = "Info";
            break;
        case QtWarningMsg:
            sTag = "Warning";
            out = stderr;
            break;
        case QtCriticalMsg:
            sTag = "Critical";
            out = stderr;
            break;
        case QtFatalMsg:
            sTag = "Fatal";
            out = stderr;
            break;
    }

    fprintf(out, "[%s] %-8s %s\n", qPrintable(sTime), qPrintable(sTag), qPrintable(msg));
    fflush(out);

    if (type == QtFatalMsg) {
        abort();
    }
}
