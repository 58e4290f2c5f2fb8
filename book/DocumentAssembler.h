#pragma once

#include <QString>
#include <QVector>

#include "book/BookModel.h"
#include "book/Diagnostic.h"

namespace book {

// Output of parsing one song: the best-effort tree plus what went wrong while building it.
struct ParsedSong {
    QString source; // input the song came from
    Song song;
    Diagnostics diagnostics;
};

struct BuildResult {
    Book book;
    Diagnostics diagnostics; // all songs, in book order

    bool ok() const { return diagnostics.isEmpty(); }
};

// Combines book metadata with parsed songs and runs the whole-song checks:
// - every chorus reference must point at a chorus declared earlier in the same song
//   (unknown references are removed from the tree and reported)
// - chorus numbers are unique per song (repeated declarations lose their label and are reported)
// Diagnostics from all songs are collected; a failing song never stops the others.
class DocumentAssembler {
public:
    explicit DocumentAssembler(const BookMetadata& meta);

    // Songs are appended in book order.
    void addSong(ParsedSong parsed);
    // Problems outside any song (e.g. text before the first title).
    void addDiagnostic(const Diagnostic& d);
    BuildResult finish();

    // Validates and repairs one song in place, appending findings to `out`.
    static void validateSong(Song& song, Diagnostics& out);

private:
    BuildResult m_result;
};

} // namespace book
