#pragma once

#include <QString>

#include "book/Diagnostic.h"
#include "music/ChordSymbol.h"

namespace markup {

// How chords are re-spelled for one output row.
struct TransformTarget {
    int offset = 0; // semitones, normalized to 0..11
    music::Notation notation = music::Notation::English;
    int keyPc = 0;  // tonic for Nashville/Roman
};

// Per-song transposition/notation state, driven by directive lines in document order:
//   !+N !-N !0          primary offset
//   !name[:key]         primary notation
//   !!+N !!-N !!0       enable second row, set its offset
//   !!name[:key]        enable second row, set its notation
// A fresh instance is created for every song; nothing leaks between songs.
class DirectiveState {
public:
    // Chords in the source are written in `sourceNotation` (tonic sourceKeyPc).
    DirectiveState(music::Notation sourceNotation, int sourceKeyPc);

    // True for lines shaped like a directive: one token starting with '!' (images "![" excluded).
    static bool isDirectiveLine(const QString& line);

    // Applies a directive line. On failure the state is unchanged and `error` says why
    // (SyntaxError for malformed syntax, UnsupportedNotation for unknown names).
    bool apply(const QString& line, int lineNumber, book::Diagnostic& error);

    // Parses a raw chord token from the source and renders it for the primary row and,
    // when enabled, the secondary row. The secondary row is derived from the source chord.
    bool resolveChord(const QString& raw, QString& primary, QString& alt, bool& hasAlt, music::ChordError& error) const;

    const TransformTarget& primary() const { return m_primary; }
    const TransformTarget& secondary() const { return m_secondary; }
    bool secondaryEnabled() const { return m_secondaryEnabled; }

private:
    bool renderChord(const music::ChordSymbol& source, const TransformTarget& target, QString& out, music::ChordError& error) const;

    music::Notation m_sourceNotation = music::Notation::English;
    int m_sourceKeyPc = 0;

    TransformTarget m_primary;
    bool m_secondaryEnabled = false;
    TransformTarget m_secondary;
};

} // namespace markup
