/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KPNGMSG_MESSAGES_P_H
#define KPNGMSG_MESSAGES_P_H

#include "pngerror_p.h"

#include <QByteArray>
#include <QString>

/*!
 * \brief pngEncode
 * Appends a chunk of the given type holding \a message (UTF-8) to the PNG.
 * \param png The PNG stream.
 * \param type The chunk type code.
 * \param message The text to store.
 * \param error Set to the chunk type error or to the parse error on failure.
 * \return The new PNG stream or an empty array on error.
 */
QByteArray pngEncode(const QByteArray &png, const QString &type, const QString &message, PngError *error = nullptr);

/*!
 * \brief pngDecode
 * \return The text stored in the first chunk of the given type or an empty string on error.
 * \note PngError::ChunkNotFound is reported when no chunk of that type exists.
 */
QString pngDecode(const QByteArray &png, const QString &type, PngError *error = nullptr);

/*!
 * \brief pngRemove
 * Removes the first chunk of the given type.
 * \return The new PNG stream or an empty array on error.
 */
QByteArray pngRemove(const QByteArray &png, const QString &type, PngError *error = nullptr);

#endif // KPNGMSG_MESSAGES_P_H
