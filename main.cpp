#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QVersionNumber>

#include <cstdio>

#include "book/AstVersion.h"
#include "book/BookJson.h"
#include "book/BookSettings.h"
#include "markup/SongbookCompiler.h"

namespace {

static bool readTextFile(const QString& path, QString& out) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning().noquote() << QString("Could not open %1: %2").arg(path, file.errorString());
        return false;
    }
    out = QString::fromUtf8(file.readAll());
    return true;
}

static bool loadSettings(const QString& path, book::BookSettings& out) {
    QString text;
    if (!readTextFile(path, text)) return false;

    QJsonParseError pe;
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning().noquote() << QString("Invalid settings JSON in %1: %2").arg(path, pe.errorString());
        return false;
    }

    QStringList warnings;
    out = book::BookSettings::fromJson(doc.object(), &warnings);
    for (const auto& w : warnings) qWarning().noquote() << QString("%1: %2").arg(path, w);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("chordbook");
    QCoreApplication::setApplicationVersion(book::currentAstVersion().toString());

    QCommandLineParser cli;
    cli.setApplicationDescription("Compiles chord-annotated song files into a songbook tree (JSON).");
    cli.addHelpOption();
    cli.addVersionOption();

    const QCommandLineOption settingsOpt(QStringList{"s", "settings"}, "Book settings JSON file.", "file");
    const QCommandLineOption outputOpt(QStringList{"o", "output"}, "Write the tree to <file> instead of stdout.", "file");
    const QCommandLineOption sequentialOpt("sequential", "Parse songs one after another on the main thread.");
    const QCommandLineOption strictOpt("strict", "Exit with status 2 when any diagnostic was recorded.");
    const QCommandLineOption templateOpt("template-version", "Check a renderer template's AST version against ours.", "version");
    cli.addOption(settingsOpt);
    cli.addOption(outputOpt);
    cli.addOption(sequentialOpt);
    cli.addOption(strictOpt);
    cli.addOption(templateOpt);
    cli.addPositionalArgument("files", "Song files, in book order.", "files...");
    cli.process(app);

    const QStringList files = cli.positionalArguments();
    if (files.isEmpty()) {
        qWarning().noquote() << "No song files given.";
        cli.showHelp(1);
    }

    if (cli.isSet(templateOpt)) {
        const QString raw = cli.value(templateOpt);
        const QVersionNumber v = QVersionNumber::fromString(raw);
        if (v.isNull()) {
            qWarning().noquote() << QString("Invalid template version '%1'").arg(raw);
            return 1;
        }
        book::checkTemplateVersion(raw, v);
    }

    book::BookSettings settings;
    if (cli.isSet(settingsOpt) && !loadSettings(cli.value(settingsOpt), settings)) return 1;

    QVector<markup::SourceText> sources;
    for (const auto& path : files) {
        markup::SourceText src;
        src.name = QFileInfo(path).fileName();
        if (!readTextFile(path, src.text)) return 1;
        sources.push_back(src);
    }

    markup::SongbookCompiler compiler(settings);
    compiler.setParallel(!cli.isSet(sequentialOpt));
    const book::BuildResult result = compiler.compile(sources);

    for (const auto& d : result.diagnostics) qWarning().noquote() << d.toString();

    const QString json = book::documentToJsonString(result.book, result.diagnostics);
    if (cli.isSet(outputOpt)) {
        QFile out(cli.value(outputOpt));
        if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
            qWarning().noquote() << QString("Could not write %1: %2").arg(out.fileName(), out.errorString());
            return 1;
        }
        out.write(json.toUtf8());
        qInfo().noquote() << QString("Wrote %1").arg(out.fileName());
    } else {
        std::fputs(json.toUtf8().constData(), stdout);
    }

    if (cli.isSet(strictOpt) && !result.ok()) return 2;
    return 0;
}
