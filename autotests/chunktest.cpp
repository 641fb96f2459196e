/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include <QTest>

#include "chunks_p.h"
#include "util_p.h"

Q_DECLARE_METATYPE(PngError)

static const QByteArray s_message("This is where your secret message will be!");
static constexpr quint32 s_crc = 2882656334;

static QByteArray testingChunkBytes(quint32 crc = s_crc)
{
    QByteArray ba;
    ba.append(ui32ToBE(quint32(s_message.size())));
    ba.append("RuSt");
    ba.append(s_message);
    ba.append(ui32ToBE(crc));
    return ba;
}

class ChunkTests : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testNewChunk()
    {
        auto chunk = PngChunk(PngChunkType::fromString(QStringLiteral("RuSt")), s_message);
        QCOMPARE(chunk.length(), quint32(42));
        QCOMPARE(chunk.crc(), s_crc);
        QVERIFY(!chunk.isNull());
    }

    void testChecksumIsDeterministic()
    {
        auto type = PngChunkType::fromString(QStringLiteral("ruSt"));
        auto c1 = PngChunk(type, QByteArray("hello"));
        auto c2 = PngChunk(type, QByteArray("hello"));
        QCOMPARE(c1.crc(), c2.crc());
        QVERIFY(c1 == c2);

        auto c3 = PngChunk(type, QByteArray("hellO"));
        QVERIFY(c1.crc() != c3.crc());
        QVERIFY(c1 != c3);
    }

    void testEmptyData()
    {
        auto chunk = PngChunk(PngChunkType::fromString(QStringLiteral("IEND")), QByteArray());
        QCOMPARE(chunk.length(), quint32(0));
        QCOMPARE(chunk.crc(), quint32(0xAE426082));
        QCOMPARE(chunk.toBytes(), QByteArray::fromHex("0000000049454e44ae426082"));
    }

    void testFromBytes()
    {
        auto err = PngError::ChunkNotFound;
        auto chunk = PngChunk::fromBytes(testingChunkBytes(), &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(chunk.length(), quint32(42));
        QCOMPARE(chunk.chunkType().toString(), QStringLiteral("RuSt"));
        QCOMPARE(chunk.data(), s_message);
        QCOMPARE(chunk.crc(), s_crc);
        QCOMPARE(chunk.dataAsString(), QString::fromLatin1(s_message));
    }

    void testTrailingDataIsIgnored()
    {
        auto err = PngError::NoError;
        auto chunk = PngChunk::fromBytes(testingChunkBytes() + QByteArray("garbage"), &err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(chunk.data(), s_message);
    }

    void testInvalidCrc()
    {
        auto err = PngError::NoError;
        auto chunk = PngChunk::fromBytes(testingChunkBytes(s_crc - 1), &err);
        QCOMPARE(err, PngError::ChecksumMismatch);
        QVERIFY(chunk.isNull());
    }

    void testSingleBitFlip()
    {
        const auto bytes = testingChunkBytes();
        // type, data and crc regions
        for (qsizetype i = 4; i < bytes.size(); ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                auto corrupted = bytes;
                corrupted[i] = char(quint8(corrupted.at(i)) ^ quint8(1 << bit));
                auto err = PngError::NoError;
                PngChunk::fromBytes(corrupted, &err);
                if (err != PngError::ChecksumMismatch) {
                    QFAIL(qPrintable(QStringLiteral("no checksum error flipping bit %1 of byte %2").arg(bit).arg(i)));
                }
            }
        }
    }

    void testUnexpectedEof_data()
    {
        QTest::addColumn<int>("size");

        QTest::newRow("empty") << 0;
        QTest::newRow("partial length") << 3;
        QTest::newRow("partial type") << 7;
        QTest::newRow("partial data") << 20;
        QTest::newRow("no crc") << 50;
        QTest::newRow("partial crc") << 53;
    }

    void testUnexpectedEof()
    {
        QFETCH(int, size);

        auto err = PngError::NoError;
        auto chunk = PngChunk::fromBytes(testingChunkBytes().left(size), &err);
        QCOMPARE(err, PngError::UnexpectedEof);
        QVERIFY(chunk.isNull());
    }

    void testHugeDeclaredLength()
    {
        auto bytes = ui32ToBE(0xFFFFFFF0) + QByteArray("ruSt") + QByteArray("abcd");
        auto err = PngError::NoError;
        PngChunk::fromBytes(bytes, &err);
        QCOMPARE(err, PngError::UnexpectedEof);
    }

    void testToBytes()
    {
        auto chunk = PngChunk::fromBytes(testingChunkBytes());
        auto bytes = chunk.toBytes();
        QCOMPARE(bytes.size(), qsizetype(12 + chunk.length()));
        QCOMPARE(bytes, testingChunkBytes());
    }

    void testDataAsString_data()
    {
        QTest::addColumn<QByteArray>("data");
        QTest::addColumn<PngError>("error");

        QTest::newRow("ascii") << QByteArray("hello") << PngError::NoError;
        QTest::newRow("utf-8") << QByteArray("h\xc3\xa9llo") << PngError::NoError;
        QTest::newRow("empty") << QByteArray() << PngError::NoError;
        QTest::newRow("leading bom") << QByteArray("\xef\xbb\xbfhi") << PngError::NoError;
        QTest::newRow("invalid sequence") << QByteArray("\xc3\x28") << PngError::TextDecodeError;
        QTest::newRow("truncated sequence") << QByteArray("ab\xc3") << PngError::TextDecodeError;
        QTest::newRow("invalid byte") << QByteArray("\xff") << PngError::TextDecodeError;
    }

    void testDataAsString()
    {
        QFETCH(QByteArray, data);
        QFETCH(PngError, error);

        auto chunk = PngChunk(PngChunkType::fromString(QStringLiteral("ruSt")), data);
        auto err = PngError::ChunkNotFound;
        auto text = chunk.dataAsString(&err);
        QCOMPARE(err, error);
        if (error == PngError::NoError) {
            QCOMPARE(text, QString::fromUtf8(data));
        } else {
            QVERIFY(text.isEmpty());
        }
    }

    void testLeadingBomIsKept()
    {
        auto chunk = PngChunk(PngChunkType::fromString(QStringLiteral("ruSt")), QByteArray("\xef\xbb\xbfhi"));
        auto err = PngError::ChunkNotFound;
        auto text = chunk.dataAsString(&err);
        QCOMPARE(err, PngError::NoError);
        QCOMPARE(text, QString(QChar(0xFEFF)) + QStringLiteral("hi"));
        QCOMPARE(text.toUtf8(), chunk.data());
    }

    void testNullDevice()
    {
        auto err = PngError::NoError;
        auto chunk = PngChunk::fromDevice(nullptr, &err);
        QCOMPARE(err, PngError::DeviceError);
        QVERIFY(chunk.isNull());
    }
};

QTEST_GUILESS_MAIN(ChunkTests)

#include "chunktest.moc"
