#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "book/BookSettings.h"
#include "book/Diagnostic.h"
#include "book/DocumentAssembler.h"

namespace markup {

// The source lines of one song; lines[0] is its "# Title" line.
struct SongSource {
    QString name;      // input the song came from, for diagnostics
    QStringList lines;
    int firstLine = 1; // source line number of lines[0]
};

// Splits a book text into songs at "# Title" lines (titles inside fenced regions don't count).
// Non-blank text before the first title is reported as a SyntaxError and skipped.
QVector<SongSource> splitSongs(const QString& text, book::Diagnostics& diagnostics);

// Parses one song: title, "## " subtitles, then the body blocks under a fresh directive state.
// Stateless between calls, so songs can be parsed on different threads.
class SongParser {
public:
    explicit SongParser(const book::BookSettings& settings);

    book::ParsedSong parse(const SongSource& source) const;

private:
    book::BookSettings m_settings;
};

} // namespace markup
