/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include <QFile>
#include <QTest>

#include "messages_p.h"
#include "png_p.h"

Q_DECLARE_METATYPE(PngError)

static QByteArray readTestFile(const QString &name)
{
    QFile file(QFINDTESTDATA(name));
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

class MessagesTests : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testEncodeDecodeEmptyPng()
    {
        auto err = PngError::ChunkNotFound;
        auto encoded = pngEncode(PngFile::signature(), QStringLiteral("ruSt"), QStringLiteral("hello"), &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(encoded.size(), qsizetype(8 + 12 + 5));

        QCOMPARE(pngDecode(encoded, QStringLiteral("ruSt"), &err), QStringLiteral("hello"));
        QCOMPARE(err, PngError::NoError);

        QVERIFY(pngDecode(encoded, QStringLiteral("XYZa"), &err).isEmpty());
        QCOMPARE(err, PngError::ChunkNotFound);
    }

    void testEncodeInvalidType_data()
    {
        QTest::addColumn<QByteArray>("png");

        QTest::newRow("valid png") << readTestFile(QStringLiteral("data/2x2.png"));
        QTest::newRow("not a png") << QByteArray("not a png at all");
    }

    void testEncodeInvalidType()
    {
        QFETCH(QByteArray, png);

        // the type is rejected before the data is parsed
        auto err = PngError::NoError;
        auto encoded = pngEncode(png, QStringLiteral("Ru1t"), QStringLiteral("hello"), &err);
        QCOMPARE(err, PngError::InvalidReservedChar);
        QVERIFY(encoded.isEmpty());
    }

    void testEncodeBadPng()
    {
        auto err = PngError::NoError;
        auto encoded = pngEncode(QByteArray("not a png at all"), QStringLiteral("ruSt"), QStringLiteral("hello"), &err);
        QCOMPARE(err, PngError::InvalidSignature);
        QVERIFY(encoded.isEmpty());
    }

    void testEncodeKeepsImage()
    {
        auto original = readTestFile(QStringLiteral("data/2x2.png"));
        auto err = PngError::NoError;
        auto encoded = pngEncode(original, QStringLiteral("ruSt"), QStringLiteral("hello"), &err);
        QCOMPARE(err, PngError::NoError);
        QVERIFY(encoded.startsWith(original));

        auto png = PngFile::fromBytes(encoded, &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(png.chunks().last().chunkType().toString(), QStringLiteral("ruSt"));
    }

    void testUnicodeMessage()
    {
        const auto message = QString::fromUtf8("h\xc3\xa9llo \xe2\x9c\x93");
        auto err = PngError::NoError;
        auto encoded = pngEncode(PngFile::signature(), QStringLiteral("ruSt"), message, &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(pngDecode(encoded, QStringLiteral("ruSt"), &err), message);

        // a leading byte order mark is part of the message
        const auto bomMessage = QString(QChar(0xFEFF)) + QStringLiteral("hi");
        encoded = pngEncode(PngFile::signature(), QStringLiteral("ruSt"), bomMessage, &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(pngDecode(encoded, QStringLiteral("ruSt"), &err), bomMessage);
        QCOMPARE(err, PngError::NoError);
    }

    void testDecodeFile()
    {
        auto err = PngError::NoError;
        auto message = pngDecode(readTestFile(QStringLiteral("data/2x2-message.png")), QStringLiteral("ruSt"), &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(message, QStringLiteral("hidden message"));
    }

    void testDecodeInvalidText()
    {
        PngFile png;
        png.appendChunk(PngChunk(PngChunkType::fromString(QStringLiteral("ruSt")), QByteArray("\xff\xfe")));

        auto err = PngError::NoError;
        auto message = pngDecode(png.toBytes(), QStringLiteral("ruSt"), &err);
        QCOMPARE(err, PngError::TextDecodeError);
        QVERIFY(message.isEmpty());
    }

    void testRemove()
    {
        auto original = readTestFile(QStringLiteral("data/2x2.png"));
        auto encoded = pngEncode(original, QStringLiteral("ruSt"), QStringLiteral("hello"));

        auto err = PngError::NoError;
        auto removed = pngRemove(encoded, QStringLiteral("ruSt"), &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(removed, original);
    }

    void testRemoveErrors_data()
    {
        QTest::addColumn<QByteArray>("png");
        QTest::addColumn<PngError>("error");

        auto original = readTestFile(QStringLiteral("data/2x2.png"));
        QTest::newRow("not found") << original << PngError::ChunkNotFound;
        QTest::newRow("truncated") << original.left(original.size() - 1) << PngError::UnexpectedEof;
        QTest::newRow("bad signature") << original.mid(1) << PngError::InvalidSignature;
    }

    void testRemoveErrors()
    {
        QFETCH(QByteArray, png);
        QFETCH(PngError, error);

        auto err = PngError::NoError;
        auto removed = pngRemove(png, QStringLiteral("ruSt"), &err);
        QCOMPARE(err, error);
        QVERIFY(removed.isEmpty());
    }
};

QTEST_GUILESS_MAIN(MessagesTests)

#include "messagestest.moc"
