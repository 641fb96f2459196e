/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include <QFile>
#include <QTest>

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

static QStringList chunkTypes(const PngFile &png)
{
    QStringList list;
    for (auto &&chunk : png.chunks()) {
        list << chunk.chunkType().toString();
    }
    return list;
}

static PngChunk textChunk(const QString &type, const QByteArray &data)
{
    return PngChunk(PngChunkType::fromString(type), data);
}

class PngTests : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testFromDevice()
    {
        QFile file(QFINDTESTDATA("data/2x2.png"));
        QVERIFY(file.open(QIODevice::ReadOnly));

        auto err = PngError::ChunkNotFound;
        auto png = PngFile::fromDevice(&file, &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(chunkTypes(png), QStringList({QStringLiteral("IHDR"), QStringLiteral("IDAT"), QStringLiteral("IEND")}));
        QCOMPARE(png.chunks().first().length(), quint32(13));
    }

    void testRoundTrip_data()
    {
        QTest::addColumn<QString>("fileName");

        QTest::newRow("plain") << QStringLiteral("data/2x2.png");
        QTest::newRow("with message") << QStringLiteral("data/2x2-message.png");
    }

    void testRoundTrip()
    {
        QFETCH(QString, fileName);

        auto bytes = readTestFile(fileName);
        QVERIFY(!bytes.isEmpty());

        auto err = PngError::NoError;
        auto png = PngFile::fromBytes(bytes, &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(png.toBytes(), bytes);

        auto again = PngFile::fromBytes(png.toBytes(), &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(again.chunks(), png.chunks());
    }

    void testSignatureOnly()
    {
        auto err = PngError::ChunkNotFound;
        auto png = PngFile::fromBytes(PngFile::signature(), &err);
        QCOMPARE(err, PngError::NoError);
        QVERIFY(png.chunks().isEmpty());
        QCOMPARE(png.toBytes(), QByteArray::fromHex("89504e470d0a1a0a"));
        QCOMPARE(png.header(), PngFile::signature());
    }

    void testInvalidSignature_data()
    {
        QTest::addColumn<QByteArray>("data");

        auto sig = PngFile::signature();
        auto wrongFirst = sig;
        wrongFirst[0] = 'x';

        QTest::newRow("empty") << QByteArray();
        QTest::newRow("short") << sig.left(7);
        QTest::newRow("wrong first byte") << wrongFirst;
        QTest::newRow("not a png") << QByteArray("GIF89a\x01\x00\x01\x00");
    }

    void testInvalidSignature()
    {
        QFETCH(QByteArray, data);

        auto err = PngError::NoError;
        auto png = PngFile::fromBytes(data, &err);
        QCOMPARE(err, PngError::InvalidSignature);
        QVERIFY(png.chunks().isEmpty());
    }

    void testChunkErrorsAbortParsing_data()
    {
        QTest::addColumn<QByteArray>("data");
        QTest::addColumn<PngError>("error");

        auto bytes = readTestFile(QStringLiteral("data/2x2-message.png"));
        auto flipped = bytes;
        // a byte of the IHDR data
        flipped[20] = char(flipped.at(20) ^ 0x01);
        auto lastCrc = bytes;
        lastCrc[lastCrc.size() - 1] = char(lastCrc.at(lastCrc.size() - 1) ^ 0x80);

        QTest::newRow("corrupted data") << flipped << PngError::ChecksumMismatch;
        QTest::newRow("corrupted last crc") << lastCrc << PngError::ChecksumMismatch;
        QTest::newRow("truncated") << bytes.left(bytes.size() - 2) << PngError::UnexpectedEof;
        QTest::newRow("trailing garbage") << bytes + QByteArray("xy") << PngError::UnexpectedEof;
    }

    void testChunkErrorsAbortParsing()
    {
        QFETCH(QByteArray, data);
        QFETCH(PngError, error);

        auto err = PngError::NoError;
        auto png = PngFile::fromBytes(data, &err);
        QCOMPARE(err, error);
        QVERIFY(isStructuralError(err));
        QVERIFY(png.chunks().isEmpty());
    }

    void testAppendChunk()
    {
        auto png = PngFile::fromBytes(readTestFile(QStringLiteral("data/2x2.png")));
        auto chunk = textChunk(QStringLiteral("ruSt"), QByteArray("hello"));
        png.appendChunk(chunk);

        QCOMPARE(png.chunks().size(), qsizetype(4));
        QCOMPARE(png.chunks().last(), chunk);
    }

    void testChunkByType()
    {
        auto png = PngFile::fromBytes(readTestFile(QStringLiteral("data/2x2-message.png")));

        auto chunk = png.chunkByType(QStringLiteral("ruSt"));
        QVERIFY(chunk != nullptr);
        QCOMPARE(chunk->dataAsString(), QStringLiteral("hidden message"));

        chunk = png.chunkByType(QStringLiteral("tEXt"));
        QVERIFY(chunk != nullptr);
        QCOMPARE(chunk->data(), QByteArray("Comment\0kpngmsg", 15));

        QVERIFY(png.chunkByType(QStringLiteral("XYZa")) == nullptr);
        // the match is case sensitive
        QVERIFY(png.chunkByType(QStringLiteral("rust")) == nullptr);
    }

    void testAppendRemoveInverse()
    {
        auto png = PngFile::fromBytes(readTestFile(QStringLiteral("data/2x2.png")));
        const auto original = png.chunks();
        auto chunk = textChunk(QStringLiteral("ruSt"), QByteArray("hello"));

        png.appendChunk(chunk);
        auto err = PngError::ChunkNotFound;
        auto removed = png.removeChunk(QStringLiteral("ruSt"), &err);

        QCOMPARE(err, PngError::NoError);
        QCOMPARE(removed, chunk);
        QCOMPARE(png.chunks(), original);
    }

    void testDuplicates()
    {
        PngFile png;
        auto first = textChunk(QStringLiteral("ruSt"), QByteArray("first"));
        auto second = textChunk(QStringLiteral("ruSt"), QByteArray("second"));
        png.appendChunk(first);
        png.appendChunk(textChunk(QStringLiteral("teSt"), QByteArray("other")));
        png.appendChunk(second);

        QCOMPARE(*png.chunkByType(QStringLiteral("ruSt")), first);

        auto removed = png.removeChunk(QStringLiteral("ruSt"));
        QCOMPARE(removed, first);
        QCOMPARE(png.chunks().size(), qsizetype(2));
        QCOMPARE(*png.chunkByType(QStringLiteral("ruSt")), second);
        QCOMPARE(chunkTypes(png), QStringList({QStringLiteral("teSt"), QStringLiteral("ruSt")}));
    }

    void testRemoveNotFound()
    {
        auto png = PngFile::fromBytes(readTestFile(QStringLiteral("data/2x2.png")));
        const auto original = png.chunks();

        auto err = PngError::NoError;
        auto removed = png.removeChunk(QStringLiteral("ruSt"), &err);
        QCOMPARE(err, PngError::ChunkNotFound);
        QVERIFY(!isStructuralError(err));
        QVERIFY(removed.isNull());
        QCOMPARE(png.chunks(), original);
    }

    void testChunksConstructor()
    {
        auto chunk = textChunk(QStringLiteral("ruSt"), QByteArray("hello"));
        PngFile png(PngChunkList() << chunk);
        QCOMPARE(png.toBytes(), PngFile::signature() + chunk.toBytes());
    }

    void testNullDevice()
    {
        auto err = PngError::NoError;
        PngFile::fromDevice(nullptr, &err);
        QCOMPARE(err, PngError::DeviceError);
    }
};

QTEST_GUILESS_MAIN(PngTests)

#include "pngtest.moc"
