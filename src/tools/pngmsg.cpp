/*
    This file is part of the KPngMsg project
    SPDX-FileCopyrightText: 2026 KPngMsg contributors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include <stdio.h>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QTextStream>

#include "messages_p.h"
#include "png_p.h"

enum ExitCode {
    Success = 0,
    UsageError = 1,
    ReadError = 2,
    PngFormatError = 3,
    NotFoundError = 4,
    WriteError = 5
};

static int exitCode(PngError error)
{
    if (error == PngError::NoError) {
        return Success;
    }
    if (error == PngError::ChunkNotFound) {
        return NotFoundError;
    }
    return PngFormatError;
}

static bool readFile(const QString &fileName, QByteArray *data)
{
    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly)) {
        QTextStream(stderr) << "Could not open " << fileName << " for reading: " << file.errorString() << '\n';
        return false;
    }
    *data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        QTextStream(stderr) << "Could not read " << fileName << ": " << file.errorString() << '\n';
        return false;
    }
    return true;
}

// The destination is replaced on commit() only: on any error the temporary file is discarded.
static bool writeFile(const QString &fileName, const QByteArray &data)
{
    QSaveFile file(fileName);
    if (!file.open(QIODevice::WriteOnly)) {
        QTextStream(stderr) << "Could not open " << fileName << " for writing: " << file.errorString() << '\n';
        return false;
    }
    if (file.write(data) != data.size()) {
        QTextStream(stderr) << "Could not write " << fileName << ": " << file.errorString() << '\n';
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        QTextStream(stderr) << "Could not replace " << fileName << ": " << file.errorString() << '\n';
        return false;
    }
    return true;
}

static void printChunks(const PngFile &png)
{
    QTextStream out(stdout);
    out << "Chunks: " << png.chunks().size() << '\n';
    for (auto &&chunk : png.chunks()) {
        const auto &type = chunk.chunkType();
        auto ok = false;
        auto name = type.toString(&ok);
        if (!ok) {
            name = QString::fromLatin1(type.bytes().toHex());
        }
        out << "  " << name
            << "  length: " << chunk.length()
            << "  crc: 0x" << QString::number(chunk.crc(), 16).rightJustified(8, QLatin1Char('0'))
            << "  " << (type.isCritical() ? "critical" : "ancillary")
            << ", " << (type.isPublic() ? "public" : "private")
            << ", " << (type.isSafeToCopy() ? "safe to copy" : "unsafe to copy")
            << (type.isValid() ? "" : ", invalid")
            << '\n';
    }
}

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pngmsg"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Hides messages in PNG files"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("encode, decode, remove or print"));
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("PNG file"));
    parser.addPositionalArgument(QStringLiteral("type"), QStringLiteral("chunk type (e.g. ruSt)"), QStringLiteral("[type]"));
    parser.addPositionalArgument(QStringLiteral("message"), QStringLiteral("message to encode"), QStringLiteral("[message]"));
    QCommandLineOption output(
        QStringList() << QStringLiteral("o") << QStringLiteral("output"),
        QStringLiteral("Write the result to this file instead of replacing the input file"),
        QStringLiteral("file"));
    parser.addOption(output);
    QCommandLineOption verbose(
        QStringList() << QStringLiteral("v") << QStringLiteral("verbose"),
        QStringLiteral("Print debug messages"));
    parser.addOption(verbose);

    parser.process(app);

    if (parser.isSet(verbose)) {
        QLoggingCategory::setFilterRules(QStringLiteral("kf.pngmsg.debug=true"));
    }

    const QStringList args = parser.positionalArguments();
    if (args.count() < 2) {
        QTextStream(stderr) << "Must provide a command and a file\n";
        parser.showHelp(UsageError);
    }

    const QString command = args.at(0);
    const QString fileName = args.at(1);
    const QString outFileName = parser.isSet(output) ? parser.value(output) : fileName;

    int expectedArgs = 0;
    if (command == QStringLiteral("encode")) {
        expectedArgs = 4;
    } else if (command == QStringLiteral("decode") || command == QStringLiteral("remove")) {
        expectedArgs = 3;
    } else if (command == QStringLiteral("print")) {
        expectedArgs = 2;
    } else {
        QTextStream(stderr) << "Unknown command " << command << '\n';
        parser.showHelp(UsageError);
    }
    if (args.count() != expectedArgs) {
        QTextStream(stderr) << "Wrong number of arguments for " << command << '\n';
        parser.showHelp(UsageError);
    }

    QByteArray data;
    if (!readFile(fileName, &data)) {
        return ReadError;
    }

    auto err = PngError::NoError;
    if (command == QStringLiteral("print")) {
        auto png = PngFile::fromBytes(data, &err);
        if (err != PngError::NoError) {
            QTextStream(stderr) << "A bad PNG file has been given: " << pngErrorString(err) << '\n';
            return exitCode(err);
        }
        printChunks(png);
        return Success;
    }

    const QString type = args.at(2);
    if (command == QStringLiteral("decode")) {
        auto message = pngDecode(data, type, &err);
        if (err != PngError::NoError) {
            QTextStream(stderr) << "Could not decode chunk " << type << ": " << pngErrorString(err) << '\n';
            return exitCode(err);
        }
        QTextStream(stdout) << message << '\n';
        return Success;
    }

    QByteArray result;
    if (command == QStringLiteral("encode")) {
        result = pngEncode(data, type, args.at(3), &err);
    } else {
        result = pngRemove(data, type, &err);
    }
    if (err != PngError::NoError) {
        QTextStream(stderr) << "Could not " << command << " chunk " << type << ": " << pngErrorString(err) << '\n';
        return exitCode(err);
    }

    if (!writeFile(outFileName, result)) {
        return WriteError;
    }
    QTextStream(stdout) << "Written " << outFileName << '\n';

    return Success;
}
