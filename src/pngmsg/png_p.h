/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

/*
 * Format specifications:
 * - https://www.w3.org/TR/png/#5PNG-file-signature
 */

#ifndef KPNGMSG_PNG_P_H
#define KPNGMSG_PNG_P_H

#include "chunks_p.h"
#include "pngerror_p.h"

#include <QByteArray>
#include <QDebug>
#include <QIODevice>
#include <QString>

#define PNG_SIGNATURE_SIZE 8

/*!
 * \brief The PngFile class
 * The ordered list of chunks of a PNG stream. The signature is not stored as a chunk.
 */
class PngFile
{
public:
    PngFile();

    explicit PngFile(const PngChunkList &chunks);

    PngFile(const PngFile &other) = default;
    PngFile &operator=(const PngFile &other) = default;

    /*!
     * \brief signature
     * \return The 8 bytes every PNG stream starts with.
     */
    static QByteArray signature();

    /*!
     * \brief header
     * \return The signature written in front of the chunks by toBytes().
     */
    QByteArray header() const;

    const PngChunkList &chunks() const;

    /*!
     * \brief appendChunk
     * Adds \a chunk at the end of the list. Chunks of the same type are allowed.
     */
    void appendChunk(const PngChunk &chunk);

    /*!
     * \brief chunkByType
     * \param type The type code, e.g. "tEXt".
     * \return The first chunk of the given type or nullptr if there is none.
     * \warning The pointer is invalidated by any change to the chunk list.
     */
    const PngChunk *chunkByType(const QString &type) const;

    /*!
     * \brief removeChunk
     * Removes the first chunk of the given type.
     * \param type The type code.
     * \param error Set to PngError::ChunkNotFound if there is no chunk of that type.
     * \return The removed chunk or a null chunk on error.
     */
    PngChunk removeChunk(const QString &type, PngError *error = nullptr);

    /*!
     * \brief toBytes
     * \return The signature followed by all chunks in order.
     */
    QByteArray toBytes() const;

    /*!
     * \brief fromDevice
     * Checks the signature and reads chunks until the end of the device.
     * Parsing stops at the first error: no partial result is returned.
     * \param d The device.
     * \param error Set to InvalidSignature, DeviceError or to the error of the first bad chunk.
     * \return The PNG or an empty PNG on error.
     */
    static PngFile fromDevice(QIODevice *d, PngError *error = nullptr);

    static PngFile fromBytes(const QByteArray &bytes, PngError *error = nullptr);

private:
    PngChunkList _chunks;
};

QDebug operator<<(QDebug dbg, const PngFile &png);

#endif // KPNGMSG_PNG_P_H
