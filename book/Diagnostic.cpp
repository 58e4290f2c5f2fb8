#include "book/Diagnostic.h"

namespace book {

Diagnostic Diagnostic::syntax(SourceLocation loc, const QString& expected, const QString& message) {
    Diagnostic d;
    d.kind = DiagnosticKind::SyntaxError;
    d.location = loc;
    d.expected = expected;
    d.message = message;
    return d;
}

Diagnostic Diagnostic::unsupportedNotation(SourceLocation loc, const QString& name) {
    Diagnostic d;
    d.kind = DiagnosticKind::UnsupportedNotation;
    d.location = loc;
    d.notation = name;
    d.message = QString("unknown notation system '%1'").arg(name);
    return d;
}

Diagnostic Diagnostic::unknownChorusReference(SourceLocation loc, int number) {
    Diagnostic d;
    d.kind = DiagnosticKind::UnknownChorusReference;
    d.location = loc;
    d.chorusNumber = number;
    d.message = QString("reference to chorus %1, which is not declared earlier in the song").arg(number);
    return d;
}

Diagnostic Diagnostic::nestedChord(SourceLocation loc) {
    Diagnostic d;
    d.kind = DiagnosticKind::NestedChordError;
    d.location = loc;
    d.message = "chord inside the lyrics of another chord";
    return d;
}

Diagnostic Diagnostic::invalidTransposition(SourceLocation loc, const QString& message) {
    Diagnostic d;
    d.kind = DiagnosticKind::InvalidTransposition;
    d.location = loc;
    d.message = message;
    return d;
}

Diagnostic Diagnostic::duplicateChorusLabel(SourceLocation loc, int number) {
    Diagnostic d;
    d.kind = DiagnosticKind::DuplicateChorusLabel;
    d.location = loc;
    d.chorusNumber = number;
    d.message = QString("chorus %1 is declared more than once").arg(number);
    return d;
}

QString Diagnostic::toString() const {
    QString where;
    if (!source.isEmpty()) where = source + ": ";
    if (songIndex >= 0) {
        where += QString("song %1").arg(songIndex + 1);
        if (!songTitle.isEmpty()) where += QString(" '%1'").arg(songTitle);
        where += ' ';
    }
    where += QString("line %1").arg(location.line);
    if (location.column > 0) where += QString(":%1").arg(location.column);

    QString s = QString("%1: %2: %3").arg(where, diagnosticKindName(kind), message);
    if (kind == DiagnosticKind::SyntaxError && !expected.isEmpty()) s += QString(" (expected %1)").arg(expected);
    return s;
}

QJsonObject Diagnostic::toJson() const {
    QJsonObject o;
    o.insert("kind", diagnosticKindName(kind));
    o.insert("message", message);
    if (!source.isEmpty()) o.insert("source", source);
    o.insert("line", location.line);
    if (location.column > 0) o.insert("column", location.column);
    if (songIndex >= 0) {
        o.insert("song", songIndex);
        o.insert("song_title", songTitle);
    }
    if (!expected.isEmpty()) o.insert("expected", expected);
    if (!notation.isEmpty()) o.insert("notation", notation);
    if (chorusNumber > 0) o.insert("chorus", chorusNumber);
    return o;
}

QString diagnosticKindName(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::SyntaxError:            return "SyntaxError";
    case DiagnosticKind::UnsupportedNotation:    return "UnsupportedNotation";
    case DiagnosticKind::UnknownChorusReference: return "UnknownChorusReference";
    case DiagnosticKind::NestedChordError:       return "NestedChordError";
    case DiagnosticKind::InvalidTransposition:   return "InvalidTransposition";
    case DiagnosticKind::DuplicateChorusLabel:   return "DuplicateChorusLabel";
    }
    return {};
}

} // namespace book
