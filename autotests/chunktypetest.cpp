/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include <QTest>

#include "chunktype_p.h"

Q_DECLARE_METATYPE(PngError)

class ChunkTypeTests : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testFromAsciiBytes()
    {
        const PngChunkType::Bytes expected{82, 117, 83, 116};
        auto err = PngError::ChunkNotFound;
        auto type = PngChunkType::fromAsciiBytes(expected, &err);

        QCOMPARE(err, PngError::NoError);
        QVERIFY(!type.isNull());
        QVERIFY(type.rawBytes() == expected);
        QCOMPARE(type.bytes(), QByteArray("RuSt"));
    }

    void testFromString()
    {
        auto expected = PngChunkType::fromAsciiBytes({82, 117, 83, 116});
        auto err = PngError::ChunkNotFound;
        auto actual = PngChunkType::fromString(QStringLiteral("RuSt"), &err);

        QCOMPARE(err, PngError::NoError);
        QVERIFY(actual == expected);
        QVERIFY(!(actual != expected));
    }

    void testFlags_data()
    {
        QTest::addColumn<QString>("type");
        QTest::addColumn<bool>("critical");
        QTest::addColumn<bool>("isPublic");
        QTest::addColumn<bool>("reserved");
        QTest::addColumn<bool>("safeToCopy");

        QTest::newRow("RuSt") << QStringLiteral("RuSt") << true << false << true << true;
        QTest::newRow("ruSt") << QStringLiteral("ruSt") << false << false << true << true;
        QTest::newRow("RUSt") << QStringLiteral("RUSt") << true << true << true << true;
        QTest::newRow("Rust") << QStringLiteral("Rust") << true << false << false << true;
        QTest::newRow("RuST") << QStringLiteral("RuST") << true << false << true << false;
        QTest::newRow("IHDR") << QStringLiteral("IHDR") << true << true << true << false;
        QTest::newRow("tEXt") << QStringLiteral("tEXt") << false << true << true << true;
    }

    void testFlags()
    {
        QFETCH(QString, type);
        QFETCH(bool, critical);
        QFETCH(bool, isPublic);
        QFETCH(bool, reserved);
        QFETCH(bool, safeToCopy);

        auto ct = PngChunkType::fromString(type);
        QCOMPARE(ct.isCritical(), critical);
        QCOMPARE(ct.isPublic(), isPublic);
        QCOMPARE(ct.isReservedBitValid(), reserved);
        QCOMPARE(ct.isSafeToCopy(), safeToCopy);
        QCOMPARE(ct.isValid(), reserved);
    }

    void testFromStringErrors_data()
    {
        QTest::addColumn<QString>("type");
        QTest::addColumn<PngError>("error");

        QTest::newRow("digit in third position") << QStringLiteral("Ru1t") << PngError::InvalidReservedChar;
        QTest::newRow("too short") << QStringLiteral("RuS") << PngError::InvalidLength;
        QTest::newRow("too long") << QStringLiteral("RuStX") << PngError::InvalidLength;
        QTest::newRow("empty") << QString() << PngError::InvalidLength;
        QTest::newRow("non ascii") << QString::fromUtf8("R\xc3\xbcSt") << PngError::InvalidAscii;
        // ASCII is checked before length
        QTest::newRow("non ascii and too long") << QString::fromUtf8("R\xc3\xbcStXX") << PngError::InvalidAscii;
    }

    void testFromStringErrors()
    {
        QFETCH(QString, type);
        QFETCH(PngError, error);

        auto err = PngError::NoError;
        auto ct = PngChunkType::fromString(type, &err);
        QCOMPARE(err, error);
        QVERIFY(ct.isNull());
        QVERIFY(!ct.isValid());
    }

    void testFromAsciiBytesError()
    {
        auto err = PngError::NoError;
        auto ct = PngChunkType::fromAsciiBytes({0x80, 'u', 'S', 't'}, &err);
        QCOMPARE(err, PngError::InvalidAscii);
        QVERIFY(ct.isNull());
    }

    void testRawConstructorDoesNotValidate()
    {
        auto digits = PngChunkType({'1', '2', '3', '4'});
        QVERIFY(!digits.isNull());
        QVERIFY(!digits.isValid());
        QCOMPARE(digits.toString(), QStringLiteral("1234"));

        auto high = PngChunkType({'R', 'u', 'S', 0xE9});
        QVERIFY(!high.isValid());
        QVERIFY(!high.isSafeToCopy());
    }

    void testToString()
    {
        auto ok = false;
        QCOMPARE(PngChunkType::fromString(QStringLiteral("RuSt")).toString(&ok), QStringLiteral("RuSt"));
        QVERIFY(ok);

        auto invalid = PngChunkType({0xFF, 0xFE, 'S', 't'});
        QVERIFY(invalid.toString(&ok).isEmpty());
        QVERIFY(!ok);

        // a leading byte order mark is not stripped
        auto bom = PngChunkType({0xEF, 0xBB, 0xBF, 'a'});
        QCOMPARE(bom.toString(&ok), QString(QChar(0xFEFF)) + QStringLiteral("a"));
        QVERIFY(ok);
    }

    void testValidity()
    {
        QVERIFY(PngChunkType::fromString(QStringLiteral("RuSt")).isValid());
        QVERIFY(!PngChunkType::fromString(QStringLiteral("Rust")).isValid());
        QVERIFY(!PngChunkType().isValid());
        QVERIFY(PngChunkType().isNull());
    }
};

QTEST_GUILESS_MAIN(ChunkTypeTests)

#include "chunktypetest.moc"
