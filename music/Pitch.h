#pragma once

#include <QChar>
#include <QString>

namespace music {

// Folds any semitone count into 0..11 (0 = C).
inline int normalizePc(int pc) {
    pc %= 12;
    if (pc < 0) pc += 12;
    return pc;
}

// Direction of the accidentals a note was written with.
enum class Accidental {
    Natural = 0,
    Flat,
    Sharp,
};

// Pitch class of an English note letter (C D E F G A B), -1 otherwise.
int letterToPc(QChar letter);

// Accidental mark value: -1 for b/♭, +1 for #/♯, 0 for anything else.
int accidentalDelta(QChar c);

// Key names in directives and book settings: one English letter plus any number of
// accidentals ("G", "Eb", "F##", "B♭"). Surrounding whitespace is ignored.
bool parsePitchClass(QString token, int& pcOut);

// English key name for a pitch class; black keys take a flat or a sharp from their
// neighbouring letter ("Bb" / "A#").
QString spellPitchClass(int pc, bool preferFlats);

} // namespace music
