/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "pngerror_p.h"

#include <QDebugStateSaver>

QString pngErrorString(PngError error)
{
    switch (error) {
    case PngError::NoError:
        return QStringLiteral("No error");
    case PngError::InvalidAscii:
        return QStringLiteral("Invalid ASCII code detected in chunk type");
    case PngError::InvalidLength:
        return QStringLiteral("Chunk types must be exactly 4 ASCII characters");
    case PngError::InvalidReservedChar:
        return QStringLiteral("Digit found in the third character of the chunk type");
    case PngError::UnexpectedEof:
        return QStringLiteral("Unexpected end of data while reading a chunk");
    case PngError::ChecksumMismatch:
        return QStringLiteral("The chunk CRC does not match its content, the data may be corrupted");
    case PngError::TextDecodeError:
        return QStringLiteral("The chunk data is not valid UTF-8 text");
    case PngError::InvalidSignature:
        return QStringLiteral("The data does not start with the PNG signature");
    case PngError::ChunkNotFound:
        return QStringLiteral("No chunk of the requested type was found");
    case PngError::DeviceError:
        return QStringLiteral("The device is not available");
    }
    return QStringLiteral("Unknown error");
}

bool isStructuralError(PngError error)
{
    switch (error) {
    case PngError::UnexpectedEof:
    case PngError::ChecksumMismatch:
    case PngError::InvalidSignature:
        return true;
    default:
        break;
    }
    return false;
}

QDebug operator<<(QDebug dbg, PngError error)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "PngError(" << pngErrorString(error) << ")";
    return dbg;
}
