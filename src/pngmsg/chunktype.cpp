/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "chunktype_p.h"

#include <QDebugStateSaver>
#include <QStringDecoder>

#include <algorithm>

static inline bool isAscii(quint8 c)
{
    return c < 0x80;
}

static inline bool isUppercase(quint8 c)
{
    return c >= 'A' && c <= 'Z';
}

static inline bool isLowercase(quint8 c)
{
    return c >= 'a' && c <= 'z';
}

PngChunkType::PngChunkType()
    : _bytes{0, 0, 0, 0}
{
}

PngChunkType::PngChunkType(const Bytes &bytes)
    : _bytes(bytes)
{
}

bool PngChunkType::operator==(const PngChunkType &other) const
{
    return _bytes == other._bytes;
}

bool PngChunkType::operator!=(const PngChunkType &other) const
{
    return !(*this == other);
}

PngChunkType PngChunkType::fromAsciiBytes(const Bytes &bytes, PngError *error)
{
    if (!std::all_of(bytes.begin(), bytes.end(), isAscii)) {
        setPngError(error, PngError::InvalidAscii);
        return {};
    }
    setPngError(error, PngError::NoError);
    return PngChunkType(bytes);
}

PngChunkType PngChunkType::fromString(const QString &s, PngError *error)
{
    for (auto &&c : s) {
        if (c.unicode() > 0x7F) {
            setPngError(error, PngError::InvalidAscii);
            return {};
        }
    }
    if (s.size() != 4) {
        setPngError(error, PngError::InvalidLength);
        return {};
    }
    // a digit is never an uppercase letter
    auto third = s.at(2).unicode();
    if (third >= '0' && third <= '9') {
        setPngError(error, PngError::InvalidReservedChar);
        return {};
    }

    Bytes bytes;
    for (qsizetype i = 0; i < 4; ++i) {
        bytes[i] = quint8(s.at(i).unicode());
    }
    setPngError(error, PngError::NoError);
    return PngChunkType(bytes);
}

QByteArray PngChunkType::bytes() const
{
    return QByteArray(reinterpret_cast<const char *>(_bytes.data()), qsizetype(_bytes.size()));
}

PngChunkType::Bytes PngChunkType::rawBytes() const
{
    return _bytes;
}

QString PngChunkType::toString(bool *ok) const
{
    QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless | QStringDecoder::Flag::ConvertInitialBom);
    QString s = decoder.decode(bytes());
    if (decoder.hasError()) {
        if (ok) {
            *ok = false;
        }
        return {};
    }
    if (ok) {
        *ok = true;
    }
    return s;
}

bool PngChunkType::isNull() const
{
    return _bytes == Bytes{0, 0, 0, 0};
}

bool PngChunkType::isValid() const
{
    if (!std::all_of(_bytes.begin(), _bytes.end(), isAscii)) {
        return false;
    }
    return isReservedBitValid();
}

bool PngChunkType::isCritical() const
{
    return isUppercase(_bytes[0]);
}

bool PngChunkType::isPublic() const
{
    return isUppercase(_bytes[1]);
}

bool PngChunkType::isReservedBitValid() const
{
    return isUppercase(_bytes[2]);
}

bool PngChunkType::isSafeToCopy() const
{
    return isLowercase(_bytes[3]);
}

QDebug operator<<(QDebug dbg, const PngChunkType &type)
{
    QDebugStateSaver saver(dbg);
    auto ok = false;
    auto s = type.toString(&ok);
    if (ok) {
        dbg.nospace() << "PngChunkType(" << s << ")";
    } else {
        dbg.nospace() << "PngChunkType(" << type.bytes().toHex(' ') << ")";
    }
    return dbg;
}
