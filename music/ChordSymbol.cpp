#include "music/ChordSymbol.h"

namespace music {
namespace {

static void setError(ChordError* error,
                     ChordErrorKind kind,
                     const QString& message,
                     const QString& expected = QString(),
                     int position = 0) {
    if (!error) return;
    error->kind = kind;
    error->message = message;
    error->expected = expected;
    error->position = position;
}

static QString rootExpectation(Notation n) {
    switch (n) {
    case Notation::English:   return "note letter A-G";
    case Notation::German:    return "note letter A-H";
    case Notation::Nashville: return "scale degree 1-7";
    case Notation::Roman:     return "roman numeral I-VII";
    }
    return "chord root";
}

static bool parseSpecialToken(const QString& s, ChordSymbol& out) {
    if (s.compare("x", Qt::CaseInsensitive) == 0) { out.placeholder = true; return true; }
    if (s.compare("NC", Qt::CaseInsensitive) == 0 || s.compare("N.C.", Qt::CaseInsensitive) == 0 || s.compare("N.C", Qt::CaseInsensitive) == 0) {
        out.noChord = true;
        return true;
    }
    return false;
}

// Lowercase German/Roman roots mean minor; English and Nashville spell that with "m".
static bool needsMinorMark(const ChordSymbol& chord) {
    if (!chord.root.lowercase) return false;
    if (chord.notation != Notation::English && chord.notation != Notation::Nashville) return false;

    const QString& q = chord.suffix;
    if (q.startsWith("m") && !q.startsWith("maj")) return false;
    static const char* kQualities[] = {"dim", "aug", "+", "o", "\u00b0", "\u00f8"};
    for (const char* prefix : kQualities) {
        if (q.startsWith(QString::fromUtf8(prefix))) return false;
    }
    return true;
}

} // namespace

bool parseChordSymbol(const QString& chordText, Notation n, int keyPc, ChordSymbol& out, ChordError* error) {
    out = ChordSymbol{};
    out.originalText = chordText;

    if (!isKnownNotation(n)) {
        setError(error, ChordErrorKind::UnsupportedNotation, "unknown notation system");
        return false;
    }
    out.notation = n;
    out.keyPc = normalizePc(keyPc);

    const QString s = chordText.trimmed();
    if (s.isEmpty()) {
        setError(error, ChordErrorKind::Syntax, "empty chord", rootExpectation(n), 0);
        return false;
    }
    for (int i = 0; i < s.size(); ++i) {
        if (s[i].isSpace()) {
            setError(error, ChordErrorKind::Syntax, QString("whitespace inside chord '%1'").arg(s), "end of chord", i);
            return false;
        }
    }

    if (parseSpecialToken(s, out)) return true;

    int rootLen = 0;
    if (!readNote(s, 0, n, out.keyPc, out.root, rootLen)) {
        setError(error, ChordErrorKind::Syntax,
                 QString("'%1' is not a %2 chord").arg(s, notationName(n)),
                 rootExpectation(n), 0);
        return false;
    }

    QString tail = s.mid(rootLen);

    // Only treat '/' as a slash-bass delimiter if the RHS is a complete note.
    // This keeps spellings like "C6/9" intact.
    const int slashIdx = tail.lastIndexOf('/');
    if (slashIdx >= 0) {
        const QString rhs = tail.mid(slashIdx + 1);
        if (rhs.isEmpty()) {
            setError(error, ChordErrorKind::Syntax,
                     QString("missing bass note after '/' in '%1'").arg(s),
                     rootExpectation(n), s.size());
            return false;
        }
        NoteSpelling bass;
        int bassLen = 0;
        if (readNote(rhs, 0, n, out.keyPc, bass, bassLen) && bassLen == rhs.size()) {
            out.hasBass = true;
            out.bass = bass;
            tail = tail.left(slashIdx);
        }
    }

    out.suffix = tail;
    return true;
}

bool transposeChord(const ChordSymbol& in, int semitones, ChordSymbol& out, ChordError* error) {
    if (semitones < -kMaxTransposeSemitones || semitones > kMaxTransposeSemitones) {
        setError(error, ChordErrorKind::InvalidTransposition,
                 QString("transposition by %1 semitones is out of range").arg(semitones));
        return false;
    }

    out = in;
    if (in.placeholder || in.noChord) return true;

    out.root.pc = normalizePc(in.root.pc + semitones);
    if (in.hasBass) out.bass.pc = normalizePc(in.bass.pc + semitones);
    return true;
}

bool convertChordNotation(const ChordSymbol& in, Notation target, int keyPc, ChordSymbol& out, ChordError* error) {
    if (!isKnownNotation(target)) {
        setError(error, ChordErrorKind::UnsupportedNotation,
                 QString("unknown notation system #%1").arg(int(target)));
        return false;
    }
    out = in;
    out.notation = target;
    out.keyPc = normalizePc(keyPc);
    return true;
}

bool convertChordNotation(const ChordSymbol& in, const QString& targetName, int keyPc, ChordSymbol& out, ChordError* error) {
    Notation target = Notation::English;
    if (!notationFromName(targetName, target)) {
        setError(error, ChordErrorKind::UnsupportedNotation,
                 QString("unknown notation system '%1'").arg(targetName));
        return false;
    }
    return convertChordNotation(in, target, keyPc, out, error);
}

QString chordText(const ChordSymbol& chord) {
    if (chord.placeholder || chord.noChord) return chord.originalText.trimmed();

    QString s = spellNote(chord.root, chord.notation, chord.keyPc);
    if (needsMinorMark(chord)) s += 'm';
    s += chord.suffix;
    if (chord.hasBass) {
        s += '/';
        s += spellNote(chord.bass, chord.notation, chord.keyPc);
    }
    return s;
}

} // namespace music
