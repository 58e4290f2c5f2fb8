#include "markup/SongParser.h"

#include <QRegularExpression>

#include "markup/BlockParser.h"
#include "markup/DirectiveState.h"

namespace markup {
namespace {

static const QRegularExpression& reTitle() {
    static const QRegularExpression re(R"(^#[ \t]+(\S.*)$)");
    return re;
}

static const QRegularExpression& reSubtitle() {
    static const QRegularExpression re(R"(^##[ \t]+(\S.*)$)");
    return re;
}

} // namespace

QVector<SongSource> splitSongs(const QString& text, book::Diagnostics& diagnostics) {
    QStringList lines = text.split('\n');
    for (auto& l : lines) {
        if (l.endsWith('\r')) l.chop(1);
    }
    // split() yields one empty trailing entry for text ending in a newline
    if (!lines.isEmpty() && lines.last().isEmpty()) lines.removeLast();

    QVector<SongSource> songs;
    bool reportedPreamble = false;
    QChar fenceMarker;
    int fence = 0;

    for (int i = 0; i < lines.size(); ++i) {
        const QString& line = lines[i];

        if (fence > 0) {
            if (BlockParser::closesFence(line, fenceMarker, fence)) fence = 0;
        } else if (reTitle().match(line).hasMatch()) {
            SongSource s;
            s.firstLine = i + 1;
            songs.push_back(s);
        } else {
            fence = BlockParser::fenceRun(line, fenceMarker);
        }

        if (songs.isEmpty()) {
            if (!reportedPreamble && !line.trimmed().isEmpty()) {
                diagnostics.push_back(book::Diagnostic::syntax({i + 1, 1}, "song title ('# Title')",
                                                               "text before the first song title"));
                reportedPreamble = true;
            }
            continue;
        }
        songs.last().lines.push_back(line);
    }
    return songs;
}

SongParser::SongParser(const book::BookSettings& settings)
    : m_settings(settings) {
}

book::ParsedSong SongParser::parse(const SongSource& source) const {
    book::ParsedSong out;
    out.source = source.name;
    if (source.lines.isEmpty()) return out;

    out.song.title = reTitle().match(source.lines[0]).captured(1).trimmed();

    int i = 1;
    while (i < source.lines.size()) {
        const QString& line = source.lines[i];
        if (line.trimmed().isEmpty()) {
            ++i;
            continue;
        }
        const QRegularExpressionMatch m = reSubtitle().match(line);
        if (!m.hasMatch()) break;
        out.song.subtitles.push_back(m.captured(1).trimmed());
        ++i;
    }

    DirectiveState directives(m_settings.notation, m_settings.keyPc);
    BlockParser blocks(directives);
    out.song.blocks = blocks.parse(source.lines.mid(i), source.firstLine + i, out.diagnostics);

    for (auto& d : out.diagnostics) d.source = source.name;
    return out;
}

} // namespace markup
