#pragma once

#include <QString>

#include "music/Notation.h"

namespace music {

struct ChordSymbol {
    QString originalText;

    // Notation and tonic the chord is currently spelled in.
    Notation notation = Notation::English;
    int keyPc = 0;

    bool placeholder = false; // "x"
    bool noChord = false;     // "N.C."

    NoteSpelling root;
    // Quality/extension text after the root ("m7", "sus4", "dim7", "6/9").
    // Never interpreted; every transformation passes it through unchanged.
    QString suffix;

    bool hasBass = false;
    NoteSpelling bass;
};

enum class ChordErrorKind {
    None = 0,
    Syntax,
    UnsupportedNotation,
    InvalidTransposition,
};

struct ChordError {
    ChordErrorKind kind = ChordErrorKind::None;
    QString message;
    QString expected; // Syntax: what the grammar wanted at `position`
    int position = 0; // 0-based offset into the chord text
};

// Largest transposition accepted directly; directive offsets are normalized into this range.
constexpr int kMaxTransposeSemitones = 11;

// Parses a chord token written in notation `n` (tonic keyPc for Nashville/Roman):
// root, opaque suffix, optional "/bass". Accepts the special tokens "x" and "N.C.".
bool parseChordSymbol(const QString& chordText, Notation n, int keyPc, ChordSymbol& out, ChordError* error = nullptr);

// Shifts root and bass by `semitones` (-11..11) and re-spells in the chord's current notation.
bool transposeChord(const ChordSymbol& in, int semitones, ChordSymbol& out, ChordError* error = nullptr);

// Re-spells the same pitches in another notation (tonic keyPc for Nashville/Roman).
bool convertChordNotation(const ChordSymbol& in, Notation target, int keyPc, ChordSymbol& out, ChordError* error = nullptr);
bool convertChordNotation(const ChordSymbol& in, const QString& targetName, int keyPc, ChordSymbol& out, ChordError* error = nullptr);

// Surface text of the chord in its current notation.
QString chordText(const ChordSymbol& chord);

} // namespace music
