/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "messages_p.h"
#include "png_p.h"

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LOG_PNGMSG)

QByteArray pngEncode(const QByteArray &png, const QString &type, const QString &message, PngError *error)
{
    auto err = PngError::NoError;
    auto chunkType = PngChunkType::fromString(type, &err);
    if (err != PngError::NoError) {
        qCWarning(LOG_PNGMSG) << "pngEncode() invalid chunk type" << type << err;
        setPngError(error, err);
        return {};
    }

    auto file = PngFile::fromBytes(png, &err);
    if (err != PngError::NoError) {
        setPngError(error, err);
        return {};
    }

    file.appendChunk(PngChunk(chunkType, message.toUtf8()));
    setPngError(error, PngError::NoError);
    return file.toBytes();
}

QString pngDecode(const QByteArray &png, const QString &type, PngError *error)
{
    auto err = PngError::NoError;
    auto file = PngFile::fromBytes(png, &err);
    if (err != PngError::NoError) {
        setPngError(error, err);
        return {};
    }

    auto chunk = file.chunkByType(type);
    if (chunk == nullptr) {
        setPngError(error, PngError::ChunkNotFound);
        return {};
    }
    return chunk->dataAsString(error);
}

QByteArray pngRemove(const QByteArray &png, const QString &type, PngError *error)
{
    auto err = PngError::NoError;
    auto file = PngFile::fromBytes(png, &err);
    if (err != PngError::NoError) {
        setPngError(error, err);
        return {};
    }

    file.removeChunk(type, &err);
    if (err != PngError::NoError) {
        setPngError(error, err);
        return {};
    }
    setPngError(error, PngError::NoError);
    return file.toBytes();
}
