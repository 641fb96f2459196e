/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

/*
 * Format specifications:
 * - https://www.w3.org/TR/png/#5Chunk-layout
 */

#ifndef KPNGMSG_CHUNKS_P_H
#define KPNGMSG_CHUNKS_P_H

#include "chunktype_p.h"
#include "pngerror_p.h"

#include <QByteArray>
#include <QDebug>
#include <QIODevice>
#include <QList>

// length + type + crc
#define CHUNK_FRAME_SIZE 12

/*!
 * \brief The PngChunk class
 * A PNG chunk: length, type, data and the CRC of type and data.
 */
class PngChunk
{
public:
    /*!
     * \brief PngChunk
     * Creates a null chunk.
     * \sa isNull
     */
    PngChunk();

    /*!
     * \brief PngChunk
     * Creates a chunk and computes its CRC.
     * \param type The chunk type.
     * \param data The chunk payload.
     */
    PngChunk(const PngChunkType &type, const QByteArray &data);

    PngChunk(const PngChunk &other) = default;
    PngChunk &operator=(const PngChunk &other) = default;

    bool operator==(const PngChunk &other) const;
    bool operator!=(const PngChunk &other) const;

    bool isNull() const;

    /*!
     * \brief length
     * \return The size (in bytes) of the chunk data (the chunk frame is not included).
     */
    quint32 length() const;

    const PngChunkType &chunkType() const;

    const QByteArray &data() const;

    quint32 crc() const;

    /*!
     * \brief dataAsString
     * \param error Set to PngError::TextDecodeError if the data is not valid UTF-8.
     * \return The data as text or an empty string on error.
     */
    QString dataAsString(PngError *error = nullptr) const;

    /*!
     * \brief toBytes
     * \return The serialized chunk (always 12 + length() bytes).
     */
    QByteArray toBytes() const;

    /*!
     * \brief fromDevice
     * Reads one chunk starting at the current device position and verifies its CRC.
     * \param d The device.
     * \param error Set to UnexpectedEof, ChecksumMismatch or DeviceError on error.
     * \return The chunk or a null chunk on error.
     */
    static PngChunk fromDevice(QIODevice *d, PngError *error = nullptr);

    /*!
     * \brief fromBytes
     * Parses the first chunk of \a bytes. Any trailing data is ignored.
     */
    static PngChunk fromBytes(const QByteArray &bytes, PngError *error = nullptr);

private:
    quint32 _length;

    PngChunkType _type;

    QByteArray _data;

    quint32 _crc;
};

using PngChunkList = QList<PngChunk>;

QDebug operator<<(QDebug dbg, const PngChunk &chunk);

#endif // KPNGMSG_CHUNKS_P_H
