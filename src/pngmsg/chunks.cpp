/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "chunks_p.h"
#include "util_p.h"

#include <QBuffer>
#include <QDebugStateSaver>
#include <QLoggingCategory>
#include <QStringDecoder>

Q_DECLARE_LOGGING_CATEGORY(LOG_PNGMSG)

PngChunk::PngChunk()
    : _length{0}
    , _crc{0}
{
}

PngChunk::PngChunk(const PngChunkType &type, const QByteArray &data)
    : _length{quint32(data.size())}
    , _type{type}
    , _data{data}
    , _crc{0}
{
    auto cid = type.rawBytes();
    _crc = chunkCrc(reinterpret_cast<const char *>(cid.data()), _data);
}

bool PngChunk::operator==(const PngChunk &other) const
{
    if (_type != other._type) {
        return false;
    }
    return _length == other._length && _crc == other._crc && _data == other._data;
}

bool PngChunk::operator!=(const PngChunk &other) const
{
    return !(*this == other);
}

bool PngChunk::isNull() const
{
    return _type.isNull();
}

quint32 PngChunk::length() const
{
    return _length;
}

const PngChunkType &PngChunk::chunkType() const
{
    return _type;
}

const QByteArray &PngChunk::data() const
{
    return _data;
}

quint32 PngChunk::crc() const
{
    return _crc;
}

QString PngChunk::dataAsString(PngError *error) const
{
    QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless | QStringDecoder::Flag::ConvertInitialBom);
    QString s = decoder.decode(_data);
    if (decoder.hasError()) {
        setPngError(error, PngError::TextDecodeError);
        return {};
    }
    setPngError(error, PngError::NoError);
    return s;
}

QByteArray PngChunk::toBytes() const
{
    QByteArray ba;
    ba.reserve(CHUNK_FRAME_SIZE + qsizetype(_length));
    ba.append(ui32ToBE(_length));
    ba.append(_type.bytes());
    ba.append(_data);
    ba.append(ui32ToBE(_crc));
    return ba;
}

PngChunk PngChunk::fromDevice(QIODevice *d, PngError *error)
{
    if (d == nullptr || !d->isReadable()) {
        qCWarning(LOG_PNGMSG) << "PngChunk::fromDevice() called with no readable device";
        setPngError(error, PngError::DeviceError);
        return {};
    }

    auto sz = d->read(4);
    if (sz.size() != 4) {
        qCDebug(LOG_PNGMSG) << "PngChunk::fromDevice() unable to read the chunk length";
        setPngError(error, PngError::UnexpectedEof);
        return {};
    }
    auto length = ui32BE(sz);

    auto cid = d->read(4);
    if (cid.size() != 4) {
        qCDebug(LOG_PNGMSG) << "PngChunk::fromDevice() unable to read the chunk type";
        setPngError(error, PngError::UnexpectedEof);
        return {};
    }

    // do not try to allocate more than what the device holds
    if (!d->isSequential() && d->bytesAvailable() < qint64(length)) {
        qCDebug(LOG_PNGMSG) << "PngChunk::fromDevice() chunk" << cid << "declares" << length << "bytes but only" << d->bytesAvailable() << "are available";
        setPngError(error, PngError::UnexpectedEof);
        return {};
    }
    auto data = d->read(qint64(length));
    if (data.size() != qsizetype(length)) {
        setPngError(error, PngError::UnexpectedEof);
        return {};
    }

    auto crcBytes = d->read(4);
    if (crcBytes.size() != 4) {
        qCDebug(LOG_PNGMSG) << "PngChunk::fromDevice() unable to read the CRC of chunk" << cid;
        setPngError(error, PngError::UnexpectedEof);
        return {};
    }
    auto crc = ui32BE(crcBytes);

    PngChunkType::Bytes raw;
    std::copy(cid.cbegin(), cid.cend(), raw.begin());
    auto chunk = PngChunk(PngChunkType(raw), data);
    if (chunk.crc() != crc) {
        qCWarning(LOG_PNGMSG) << "PngChunk::fromDevice() CRC mismatch on chunk" << cid << ": found" << Qt::hex << crc << "while expected" << chunk.crc();
        setPngError(error, PngError::ChecksumMismatch);
        return {};
    }

    setPngError(error, PngError::NoError);
    return chunk;
}

PngChunk PngChunk::fromBytes(const QByteArray &bytes, PngError *error)
{
    QBuffer buffer;
    buffer.setData(bytes);
    if (!buffer.open(QIODevice::ReadOnly)) {
        setPngError(error, PngError::DeviceError);
        return {};
    }
    return fromDevice(&buffer, error);
}

QDebug operator<<(QDebug dbg, const PngChunk &chunk)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "PngChunk(" << chunk.chunkType().bytes()
                  << ", length=" << chunk.length()
                  << ", crc=0x" << Qt::hex << chunk.crc() << ")";
    return dbg;
}
