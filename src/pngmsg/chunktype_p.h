/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

/*
 * Format specifications:
 * - https://www.w3.org/TR/png/#5Chunk-naming-conventions
 */

#ifndef KPNGMSG_CHUNKTYPE_P_H
#define KPNGMSG_CHUNKTYPE_P_H

#include "pngerror_p.h"

#include <QByteArray>
#include <QDebug>
#include <QString>

#include <array>

/*!
 * \brief The PngChunkType class
 * The 4 bytes chunk type code. The case of each letter carries a property flag.
 */
class PngChunkType
{
public:
    using Bytes = std::array<quint8, 4>;

    /*!
     * \brief PngChunkType
     * Creates a null chunk type (all bytes zero).
     * \sa isNull
     */
    PngChunkType();

    /*!
     * \brief PngChunkType
     * Creates a chunk type from raw bytes. No validation is done: use isValid() to check the result.
     */
    explicit PngChunkType(const Bytes &bytes);

    PngChunkType(const PngChunkType &other) = default;
    PngChunkType &operator=(const PngChunkType &other) = default;

    bool operator==(const PngChunkType &other) const;
    bool operator!=(const PngChunkType &other) const;

    /*!
     * \brief fromAsciiBytes
     * \param bytes The type code.
     * \param error Set to PngError::InvalidAscii if a byte is not ASCII.
     * \return The chunk type or a null type on error.
     */
    static PngChunkType fromAsciiBytes(const Bytes &bytes, PngError *error = nullptr);

    /*!
     * \brief fromString
     * Checks, in order: ASCII characters only, exactly 4 characters, no digit in the third position.
     * \param s The type code, e.g. "ruSt".
     * \param error Set to InvalidAscii, InvalidLength or InvalidReservedChar on error.
     * \return The chunk type or a null type on error.
     * \note The PNG standard only looks at bit 5 of the third byte. Digits are rejected to keep
     * compatibility with files written by earlier versions of the tool.
     */
    static PngChunkType fromString(const QString &s, PngError *error = nullptr);

    /*!
     * \brief bytes
     * \return The 4 bytes of the type code.
     */
    QByteArray bytes() const;

    Bytes rawBytes() const;

    /*!
     * \brief toString
     * \param ok Set to false if the bytes are not a valid UTF-8 sequence.
     * \return The type code as text or an empty string on error.
     */
    QString toString(bool *ok = nullptr) const;

    bool isNull() const;

    /*!
     * \brief isValid
     * \return True if all bytes are ASCII and the reserved bit is valid.
     */
    bool isValid() const;

    /*!
     * \brief isCritical
     * \return True if the first letter is uppercase (the chunk is needed to display the image).
     */
    bool isCritical() const;

    /*!
     * \brief isPublic
     * \return True if the second letter is uppercase.
     */
    bool isPublic() const;

    /*!
     * \brief isReservedBitValid
     * \return True if the third letter is uppercase.
     */
    bool isReservedBitValid() const;

    /*!
     * \brief isSafeToCopy
     * \return True if the fourth letter is lowercase.
     */
    bool isSafeToCopy() const;

private:
    Bytes _bytes;
};

QDebug operator<<(QDebug dbg, const PngChunkType &type);

#endif // KPNGMSG_CHUNKTYPE_P_H
