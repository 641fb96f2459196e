/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KPNGMSG_UTIL_P_H
#define KPNGMSG_UTIL_P_H

#include <QByteArray>
#include <QtGlobal>

#include <zlib.h>

#include <algorithm>

// All multi-byte integers of a PNG stream are big endian (network byte order)
inline quint32 ui32BE(quint8 c1, quint8 c2, quint8 c3, quint8 c4)
{
    return (quint32(c1) << 24) | (quint32(c2) << 16) | (quint32(c3) << 8) | quint32(c4);
}

inline quint32 ui32BE(const QByteArray &ba)
{
    if (ba.size() < 4) {
        return 0;
    }
    return ui32BE(quint8(ba.at(0)), quint8(ba.at(1)), quint8(ba.at(2)), quint8(ba.at(3)));
}

inline QByteArray ui32ToBE(quint32 value)
{
    QByteArray ba(4, char(0));
    ba[0] = char((value >> 24) & 0xFF);
    ba[1] = char((value >> 16) & 0xFF);
    ba[2] = char((value >> 8) & 0xFF);
    ba[3] = char(value & 0xFF);
    return ba;
}

/*!
 * \brief chunkCrc
 * CRC-32 (ISO-HDLC, the one used by zlib and PNG) of the type bytes followed by data.
 * \note The checksum is accumulated, no temporary concatenated buffer is built.
 */
inline quint32 chunkCrc(const char *type, const QByteArray &data)
{
    auto crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef *>(type), 4);
    // zlib takes an uInt length: feed large payloads in slices
    auto ptr = reinterpret_cast<const Bytef *>(data.constData());
    auto left = qint64(data.size());
    while (left > 0) {
        auto len = uInt(std::min(left, qint64(1024 * 1024 * 1024)));
        crc = crc32(crc, ptr, len);
        ptr += len;
        left -= len;
    }
    return quint32(crc);
}

#endif // KPNGMSG_UTIL_P_H
