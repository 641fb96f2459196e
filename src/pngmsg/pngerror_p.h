/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KPNGMSG_PNGERROR_P_H
#define KPNGMSG_PNGERROR_P_H

#include <QDebug>
#include <QString>

/*!
 * \brief The PngError enum
 * Every failure the chunk model can report.
 */
enum class PngError {
    NoError = 0,

    // PngChunkType
    InvalidAscii,
    InvalidLength,
    InvalidReservedChar,

    // PngChunk
    UnexpectedEof,
    ChecksumMismatch,
    TextDecodeError,

    // PngFile
    InvalidSignature,
    ChunkNotFound,

    // Null or unreadable device
    DeviceError
};

/*!
 * \brief pngErrorString
 * \return A human readable description of \a error.
 */
QString pngErrorString(PngError error);

/*!
 * \brief isStructuralError
 * \return True if \a error means that the data is malformed or corrupted.
 * A missing chunk is an expected outcome and is not structural.
 */
bool isStructuralError(PngError error);

/*!
 * \brief setPngError
 * Writes \a value to \a error when the caller asked for it.
 */
inline void setPngError(PngError *error, PngError value)
{
    if (error) {
        *error = value;
    }
}

QDebug operator<<(QDebug dbg, PngError error);

#endif // KPNGMSG_PNGERROR_P_H
