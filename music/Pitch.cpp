#include "music/Pitch.h"

namespace music {

int letterToPc(QChar letter) {
    switch (letter.unicode()) {
    case 'C': return 0;
    case 'D': return 2;
    case 'E': return 4;
    case 'F': return 5;
    case 'G': return 7;
    case 'A': return 9;
    case 'B': return 11;
    default:  return -1;
    }
}

int accidentalDelta(QChar c) {
    if (c == 'b' || c == QChar(0x266D)) return -1; // ♭
    if (c == '#' || c == QChar(0x266F)) return 1;  // ♯
    return 0;
}

bool parsePitchClass(QString token, int& pcOut) {
    token = token.trimmed();
    if (token.isEmpty()) return false;

    const int base = letterToPc(token[0].toUpper());
    if (base < 0) return false;

    int acc = 0;
    for (int i = 1; i < token.size(); ++i) {
        const int d = accidentalDelta(token[i]);
        if (d == 0) return false;
        acc += d;
    }

    pcOut = normalizePc(base + acc);
    return true;
}

QString spellPitchClass(int pc, bool preferFlats) {
    pc = normalizePc(pc);
    const QString letters = QStringLiteral("CDEFGAB");
    for (const QChar letter : letters) {
        if (letterToPc(letter) == pc) return QString(letter);
    }
    const int neighbour = normalizePc(preferFlats ? pc + 1 : pc - 1);
    for (const QChar letter : letters) {
        if (letterToPc(letter) == neighbour) return QString(letter) + (preferFlats ? 'b' : '#');
    }
    return {};
}

} // namespace music
