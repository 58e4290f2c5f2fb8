#include "markup/SongbookCompiler.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFuture>
#include <QtConcurrent>

#include <utility>

#include "markup/SongParser.h"

namespace markup {

SongbookCompiler::SongbookCompiler(const book::BookSettings& settings)
    : m_settings(settings) {
}

book::BuildResult SongbookCompiler::compile(const QVector<SourceText>& sources) const {
    QElapsedTimer timer;
    timer.start();

    book::DocumentAssembler assembler(m_settings.metadata());

    QVector<SongSource> songs;
    for (const auto& src : sources) {
        book::Diagnostics preamble;
        QVector<SongSource> split = splitSongs(src.text, preamble);
        for (auto& d : preamble) {
            d.source = src.name;
            assembler.addDiagnostic(d);
        }
        if (split.isEmpty()) {
            qWarning().noquote() << QString("SongbookCompiler: no songs in '%1'").arg(src.name);
        }
        for (auto& s : split) {
            s.name = src.name;
            songs.push_back(s);
        }
    }

    const SongParser parser(m_settings);
    QVector<book::ParsedSong> parsed;
    parsed.reserve(songs.size());

    if (m_parallel && songs.size() > 1) {
        QVector<QFuture<book::ParsedSong>> futures;
        futures.reserve(songs.size());
        for (const auto& s : songs) {
            futures.append(QtConcurrent::run([&parser, s]() {
                return parser.parse(s);
            }));
        }
        // Collect in input order
        for (auto& f : futures) parsed.append(f.result());
    } else {
        for (const auto& s : songs) parsed.append(parser.parse(s));
    }

    int blockCount = 0;
    for (auto& p : parsed) {
        blockCount += p.song.blocks.size();
        assembler.addSong(std::move(p));
    }

    book::BuildResult result = assembler.finish();
    qInfo().noquote() << QString("SongbookCompiler: %1 song(s), %2 block(s), %3 diagnostic(s) in %4ms%5")
        .arg(result.book.songs.size())
        .arg(blockCount)
        .arg(result.diagnostics.size())
        .arg(timer.elapsed())
        .arg(m_parallel ? " (parallel)" : "");
    return result;
}

book::BuildResult SongbookCompiler::compileText(const QString& text) const {
    return compile({SourceText{QString(), text}});
}

} // namespace markup
