#include "music/Notation.h"

#include <QStringView>

namespace music {
namespace {

// [table][pc]: 0 = canonical, 1 = flats, 2 = sharps
static const char* kEnglish[3][12] = {
    {"C","C#","D","Eb","E","F","F#","G","Ab","A","Bb","B"},
    {"C","Db","D","Eb","E","F","Gb","G","Ab","A","Bb","B"},
    {"C","C#","D","D#","E","F","F#","G","G#","A","A#","B"},
};

static const char* kGerman[3][12] = {
    {"C","Cis","D","Es","E","F","Fis","G","As","A","B","H"},
    {"C","Des","D","Es","E","F","Ges","G","As","A","B","H"},
    {"C","Cis","D","Dis","E","F","Fis","G","Gis","A","Ais","H"},
};

// Indexed by semitones above the tonic.
static const char* kNashville[3][12] = {
    {"1","b2","2","b3","3","4","#4","5","b6","6","b7","7"},
    {"1","b2","2","b3","3","4","b5","5","b6","6","b7","7"},
    {"1","#1","2","#2","3","4","#4","5","#5","6","#6","7"},
};

static const char* kRoman[3][12] = {
    {"I","bII","II","bIII","III","IV","#IV","V","bVI","VI","bVII","VII"},
    {"I","bII","II","bIII","III","IV","bV","V","bVI","VI","bVII","VII"},
    {"I","#I","II","#II","III","IV","#IV","V","#V","VI","#VI","VII"},
};

// Major-scale semitone offsets of degrees 1..7.
static const int kDegreeSemitones[7] = {0, 2, 4, 5, 7, 9, 11};

static int tableIndex(Accidental a) {
    switch (a) {
    case Accidental::Flat:  return 1;
    case Accidental::Sharp: return 2;
    case Accidental::Natural: break;
    }
    return 0;
}

static Accidental directionOf(int acc) {
    if (acc < 0) return Accidental::Flat;
    if (acc > 0) return Accidental::Sharp;
    return Accidental::Natural;
}

static bool restStartsWith(const QString& s, int i, const char* lit) {
    return QStringView(s).mid(i).startsWith(QLatin1String(lit));
}

static int readPrefixAccidentals(const QString& s, int& i) {
    int acc = 0;
    while (i < s.size()) {
        const int d = accidentalDelta(s[i]);
        if (d == 0) break;
        acc += d;
        ++i;
    }
    return acc;
}

static bool readEnglish(const QString& s, int pos, int& pcOut, int& accOut, int& end) {
    const int base = letterToPc(s[pos]);
    if (base < 0) return false;
    int i = pos + 1;
    int acc = 0;
    while (i < s.size()) {
        const int d = accidentalDelta(s[i]);
        if (d == 0) break;
        acc += d;
        ++i;
    }
    pcOut = base + acc;
    accOut = acc;
    end = i;
    return true;
}

static bool readGerman(const QString& s, int pos, int& pcOut, int& accOut, bool& lowerOut, int& end) {
    const QChar c = s[pos];
    const QChar up = c.toUpper();
    int base = -1;
    if (up == 'H') base = 11;
    else if (up == 'B') base = 10;
    else base = letterToPc(up);
    if (base < 0) return false;

    int i = pos + 1;
    int acc = 0;
    while (i < s.size()) {
        // "sus" always belongs to the suffix: Esus4 is E + sus4, not Es + us4.
        if (restStartsWith(s, i, "sus")) break;
        if (acc >= 0 && restStartsWith(s, i, "is")) { acc += 1; i += 2; continue; }
        if (acc <= 0 && restStartsWith(s, i, "es")) { acc -= 1; i += 2; continue; }
        if (acc == 0 && i == pos + 1 && (up == 'E' || up == 'A') && s[i] == 's') { acc -= 1; i += 1; continue; }
        break;
    }
    pcOut = base + acc;
    accOut = acc;
    lowerOut = c.isLower();
    end = i;
    return true;
}

static bool readNashville(const QString& s, int pos, int keyPc, int& pcOut, int& accOut, int& end) {
    int i = pos;
    const int acc = readPrefixAccidentals(s, i);
    if (i >= s.size()) return false;
    const QChar d = s[i];
    if (d < '1' || d > '7') return false;
    pcOut = keyPc + kDegreeSemitones[d.unicode() - '1'] + acc;
    accOut = acc;
    end = i + 1;
    return true;
}

static bool readRoman(const QString& s, int pos, int keyPc, int& pcOut, int& accOut, bool& lowerOut, int& end) {
    int i = pos;
    const int acc = readPrefixAccidentals(s, i);
    if (i >= s.size()) return false;

    // Longest numerals first so that VII is not read as V + "II".
    static const char* kNumerals[7] = {"VII", "III", "VI", "IV", "II", "V", "I"};
    static const int kDegrees[7]    = {7, 3, 6, 4, 2, 5, 1};

    const bool lower = s[i].isLower();
    for (int k = 0; k < 7; ++k) {
        QString numeral = QString::fromLatin1(kNumerals[k]);
        if (lower) numeral = numeral.toLower();
        if (QStringView(s).mid(i).startsWith(numeral)) {
            pcOut = keyPc + kDegreeSemitones[kDegrees[k] - 1] + acc;
            accOut = acc;
            lowerOut = lower;
            end = i + numeral.size();
            return true;
        }
    }
    return false;
}

} // namespace

bool isKnownNotation(Notation n) {
    switch (n) {
    case Notation::English:
    case Notation::German:
    case Notation::Nashville:
    case Notation::Roman:
        return true;
    }
    return false;
}

bool isRelativeNotation(Notation n) {
    return n == Notation::Nashville || n == Notation::Roman;
}

bool notationFromName(const QString& name, Notation& out) {
    const QString key = name.trimmed().toLower();
    if (key == "english") { out = Notation::English; return true; }
    if (key == "german") { out = Notation::German; return true; }
    if (key == "nashville") { out = Notation::Nashville; return true; }
    if (key == "roman") { out = Notation::Roman; return true; }
    return false;
}

QString notationName(Notation n) {
    switch (n) {
    case Notation::English:   return "english";
    case Notation::German:    return "german";
    case Notation::Nashville: return "nashville";
    case Notation::Roman:     return "roman";
    }
    return {};
}

bool readNote(const QString& s, int pos, Notation n, int keyPc, NoteSpelling& out, int& lengthOut) {
    if (pos < 0 || pos >= s.size()) return false;
    keyPc = normalizePc(keyPc);

    int pc = 0;
    int acc = 0;
    int end = pos;
    bool lower = false;
    bool ok = false;
    switch (n) {
    case Notation::English:   ok = readEnglish(s, pos, pc, acc, end); break;
    case Notation::German:    ok = readGerman(s, pos, pc, acc, lower, end); break;
    case Notation::Nashville: ok = readNashville(s, pos, keyPc, pc, acc, end); break;
    case Notation::Roman:     ok = readRoman(s, pos, keyPc, pc, acc, lower, end); break;
    }
    if (!ok) return false;

    out = NoteSpelling{};
    out.pc = normalizePc(pc);
    out.accidental = directionOf(acc);
    out.lowercase = lower;
    out.sourceText = s.mid(pos, end - pos);
    out.sourcePc = out.pc;
    out.sourceNotation = n;
    out.sourceKeyPc = keyPc;
    lengthOut = end - pos;
    return true;
}

QString spellNote(const NoteSpelling& note, Notation n, int keyPc) {
    if (note.pc < 0) return {};
    keyPc = normalizePc(keyPc);

    if (!note.sourceText.isEmpty() && note.pc == note.sourcePc && n == note.sourceNotation
        && (!isRelativeNotation(n) || keyPc == note.sourceKeyPc)) {
        return note.sourceText;
    }

    const int t = tableIndex(note.accidental);
    switch (n) {
    case Notation::English:
        return QString::fromLatin1(kEnglish[t][note.pc]);
    case Notation::German: {
        const QString g = QString::fromLatin1(kGerman[t][note.pc]);
        return note.lowercase ? g.toLower() : g;
    }
    case Notation::Nashville:
        return QString::fromLatin1(kNashville[t][normalizePc(note.pc - keyPc)]);
    case Notation::Roman: {
        const QString r = QString::fromLatin1(kRoman[t][normalizePc(note.pc - keyPc)]);
        return note.lowercase ? r.toLower() : r;
    }
    }
    return {};
}

} // namespace music
