/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "png_p.h"

#include <QBuffer>
#include <QDebugStateSaver>
#include <QLoggingCategory>

#ifdef QT_DEBUG
Q_LOGGING_CATEGORY(LOG_PNGMSG, "kf.pngmsg", QtInfoMsg)
#else
Q_LOGGING_CATEGORY(LOG_PNGMSG, "kf.pngmsg", QtWarningMsg)
#endif

static constexpr char s_signature[PNG_SIGNATURE_SIZE] = {char(137), 80, 78, 71, 13, 10, 26, 10};

PngFile::PngFile()
{
}

PngFile::PngFile(const PngChunkList &chunks)
    : _chunks(chunks)
{
}

QByteArray PngFile::signature()
{
    return QByteArray(s_signature, PNG_SIGNATURE_SIZE);
}

QByteArray PngFile::header() const
{
    return signature();
}

const PngChunkList &PngFile::chunks() const
{
    return _chunks;
}

void PngFile::appendChunk(const PngChunk &chunk)
{
    _chunks << chunk;
}

static qsizetype indexOfType(const PngChunkList &chunks, const QString &type)
{
    for (qsizetype i = 0, n = chunks.size(); i < n; ++i) {
        auto ok = false;
        auto s = chunks.at(i).chunkType().toString(&ok);
        if (ok && s == type) {
            return i;
        }
    }
    return -1;
}

const PngChunk *PngFile::chunkByType(const QString &type) const
{
    auto idx = indexOfType(_chunks, type);
    if (idx < 0) {
        return nullptr;
    }
    return &_chunks.at(idx);
}

PngChunk PngFile::removeChunk(const QString &type, PngError *error)
{
    auto idx = indexOfType(_chunks, type);
    if (idx < 0) {
        qCDebug(LOG_PNGMSG) << "PngFile::removeChunk() no chunk of type" << type;
        setPngError(error, PngError::ChunkNotFound);
        return {};
    }
    setPngError(error, PngError::NoError);
    return _chunks.takeAt(idx);
}

QByteArray PngFile::toBytes() const
{
    auto size = qsizetype(PNG_SIGNATURE_SIZE);
    for (auto &&chunk : _chunks) {
        size += CHUNK_FRAME_SIZE + qsizetype(chunk.length());
    }

    QByteArray ba;
    ba.reserve(size);
    ba.append(header());
    for (auto &&chunk : _chunks) {
        ba.append(chunk.toBytes());
    }
    return ba;
}

PngFile PngFile::fromDevice(QIODevice *d, PngError *error)
{
    if (d == nullptr || !d->isReadable()) {
        qCWarning(LOG_PNGMSG) << "PngFile::fromDevice() called with no readable device";
        setPngError(error, PngError::DeviceError);
        return {};
    }

    auto sig = d->read(PNG_SIGNATURE_SIZE);
    if (sig != signature()) {
        qCWarning(LOG_PNGMSG) << "PngFile::fromDevice() invalid PNG signature";
        setPngError(error, PngError::InvalidSignature);
        return {};
    }

    PngChunkList chunks;
    while (!d->atEnd()) {
        auto err = PngError::NoError;
        auto chunk = PngChunk::fromDevice(d, &err);
        if (err != PngError::NoError) {
            qCWarning(LOG_PNGMSG) << "PngFile::fromDevice() error while reading chunk" << chunks.size() << err;
            setPngError(error, err);
            return {};
        }
        qCDebug(LOG_PNGMSG) << "PngFile::fromDevice() read" << chunk;
        chunks << chunk;
    }

    setPngError(error, PngError::NoError);
    return PngFile(chunks);
}

PngFile PngFile::fromBytes(const QByteArray &bytes, PngError *error)
{
    QBuffer buffer;
    buffer.setData(bytes);
    if (!buffer.open(QIODevice::ReadOnly)) {
        setPngError(error, PngError::DeviceError);
        return {};
    }
    return fromDevice(&buffer, error);
}

QDebug operator<<(QDebug dbg, const PngFile &png)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "PngFile(" << png.chunks().size() << " chunks";
    for (auto &&chunk : png.chunks()) {
        dbg << ", " << chunk;
    }
    dbg << ")";
    return dbg;
}
