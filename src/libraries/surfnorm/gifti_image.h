//=============================================================================================================
/**
 * @file     gifti_image.h
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
 * @brief    GiftiImage class declaration.
 *
 */

#ifndef GIFTI_IMAGE_H
#define GIFTI_IMAGE_H

//=============================================================================================================
// INCLUDES
//=============================================================================================================

#include "surfnorm_global.h"
#include "gifti_meta_data.h"
#include "gifti_data_array.h"

//=============================================================================================================
// QT INCLUDES
//=============================================================================================================

#include <QString>
#include <QVector>
#include <QPair>

//=============================================================================================================
// DEFINE NAMESPACE SURFNORMLIB
//=============================================================================================================

namespace SURFNORMLIB {

//=============================================================================================================
/**
 * @brief One <Label> of a GIFTI <LabelTable>, carried through unchanged.
 */
struct SURFNORMSHARED_EXPORT GiftiLabel
{
    QVector<QPair<QString, QString> > attributes;   /**< Key, Red, Green, Blue, Alpha, ... in file order. */
    QString                           text;         /**< Label name. */
};

//=============================================================================================================
/**
 * In-memory GIFTI file. Data arrays keep their file order.
 *
 * @brief GIFTI <GIFTI> root element.
 */
class SURFNORMSHARED_EXPORT GiftiImage
{
public:
    //=========================================================================================================
    /**
     * Constructs an empty version 1.0 image.
     */
    GiftiImage();

    //=========================================================================================================
    /**
     * Returns the position of the first data array with the given intent.
     *
     * @param[in] intent  e.g. GIFTI_INTENT_POINTSET.
     *
     * @return The position in darrays, -1 if there is none.
     */
    int indexOfIntent(const QString& intent) const;

    QString                             version;            /**< Version attribute. */
    QVector<QPair<QString, QString> >   otherAttributes;    /**< Root attributes other than Version/NumberOfDataArrays. */
    GiftiMetaData                       meta;               /**< File level metadata. */
    bool                                hasLabelTable;      /**< Whether a <LabelTable> element was present. */
    QVector<GiftiLabel>                 labelTable;         /**< Label table entries. */
    QVector<GiftiDataArray>             darrays;            /**< Data arrays in file order. */
};

} // namespace SURFNORMLIB

#endif // GIFTI_IMAGE_H
