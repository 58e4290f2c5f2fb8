#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

namespace book {

enum class DiagnosticKind {
    SyntaxError,
    UnsupportedNotation,
    UnknownChorusReference,
    NestedChordError,
    InvalidTransposition,
    DuplicateChorusLabel,
};

struct SourceLocation {
    int line = 0;   // 1-based within the input text, 0 = unknown
    int column = 0; // 1-based, 0 = whole line
};

// One recorded problem. Parsing never stops at the first one: blocks that fail are
// dropped and the rest of the song (and book) keeps going.
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::SyntaxError;

    QString source;     // input name (file), empty for in-memory text
    int songIndex = -1; // -1 for problems outside any song
    QString songTitle;
    SourceLocation location;

    QString message;

    // Kind-specific detail
    QString expected;     // SyntaxError
    QString notation;     // UnsupportedNotation
    int chorusNumber = 0; // UnknownChorusReference, DuplicateChorusLabel

    static Diagnostic syntax(SourceLocation loc, const QString& expected, const QString& message);
    static Diagnostic unsupportedNotation(SourceLocation loc, const QString& name);
    static Diagnostic unknownChorusReference(SourceLocation loc, int number);
    static Diagnostic nestedChord(SourceLocation loc);
    static Diagnostic invalidTransposition(SourceLocation loc, const QString& message);
    static Diagnostic duplicateChorusLabel(SourceLocation loc, int number);

    // "song 2 'Title' line 14:3: SyntaxError: ..."
    QString toString() const;
    QJsonObject toJson() const;
};

QString diagnosticKindName(DiagnosticKind kind);

using Diagnostics = QVector<Diagnostic>;

} // namespace book
