//=============================================================================================================
/**
 * @file     applicationlogger.h
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
 * @brief    ApplicationLogger class declaration.
 *
 */

#ifndef APPLICATIONLOGGER_H
#define APPLICATIONLOGGER_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "../utils_global.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>
#include <QMutex>

//=============================================================================================================
// DEFINE NAMESPACE UTILSLIB
//=============================================================================================================

namespace UTILSLIB
{

//=============================================================================================================
/**
 * Message handler for the Qt logging macros. Install it with
 * qInstallMessageHandler(ApplicationLogger::customLogWriter).
 *
 * Each message is written on one line with a timestamp and a severity tag. Debug and info messages go to
 * stdout, warnings and errors to stderr. A fatal message aborts after it has been written.
 *
 * @brief Timestamped writer for qDebug/qInfo/qWarning/qCritical/qFatal.
 */
class UTILSSHARED_EXPORT ApplicationLogger
{
public:
    //=========================================================================================================
    /**
     * Writes a log message. Signature matches QtMessageHandler.
     *
     * @param[in] type       The message severity.
     * @param[in] context    Source location of the message.
     * @param[in] msg        The message text.
     */
    static void customLogWriter(QtMsgType type,
                                const QMessageLogContext &context,
                                const QString &msg);

private:
    static QMutex m_mutex;      /**< Serializes concurrent writers. */
};

} // NAMESPACE UTILSLIB

#endif // APPLICATIONLOGGER_H
