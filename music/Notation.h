#pragma once

#include <QString>

#include "music/Pitch.h"

namespace music {

// Surface spelling conventions for chord roots.
// English and German are absolute; Nashville and Roman spell scale degrees relative to a tonic.
enum class Notation {
    English = 0,
    German,
    Nashville,
    Roman,
};

bool isKnownNotation(Notation n);
bool isRelativeNotation(Notation n);

// Case-insensitive lookup of "english", "german", "nashville", "roman".
bool notationFromName(const QString& name, Notation& out);
QString notationName(Notation n);

// A root or bass note.
// Besides the pitch class it remembers how it was originally written, so that re-spelling the
// unchanged pitch in the original notation reproduces the author's text exactly.
struct NoteSpelling {
    int pc = -1; // 0..11

    Accidental accidental = Accidental::Natural; // direction used when re-spelling other pitches
    bool lowercase = false;                      // German/Roman lowercase roots

    QString sourceText;
    int sourcePc = -1;
    Notation sourceNotation = Notation::English;
    int sourceKeyPc = 0;
};

// Reads a note starting at s[pos] in notation `n`; relative notations resolve against keyPc.
// On success fills `out` (including its source fields) and the number of characters consumed.
bool readNote(const QString& s, int pos, Notation n, int keyPc, NoteSpelling& out, int& lengthOut);

// Spells note.pc in notation `n`.
// Canonical tables (natural source notes), flats/sharps follow the note's accidental direction:
//   English   C  C#  D  Eb  E  F  F#  G  Ab  A  Bb  B
//   German    C  Cis D  Es  E  F  Fis G  As  A  B   H
//   Nashville 1  b2  2  b3  3  4  #4  5  b6  6  b7  7
//   Roman     I  bII II bIII III IV #IV V bVI VI bVII VII
QString spellNote(const NoteSpelling& note, Notation n, int keyPc);

} // namespace music
