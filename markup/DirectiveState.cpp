#include "markup/DirectiveState.h"

#include "music/Pitch.h"

namespace markup {
namespace {

static bool isOffsetBody(const QString& body) {
    return !body.isEmpty() && (body[0] == '+' || body[0] == '-' || body[0].isDigit());
}

static bool parseOffset(const QString& body, int& out) {
    int i = 0;
    int sign = 1;
    if (body[0] == '+' || body[0] == '-') {
        sign = (body[0] == '-') ? -1 : 1;
        i = 1;
    }
    if (i >= body.size()) return false;
    for (int k = i; k < body.size(); ++k) {
        if (!body[k].isDigit()) return false;
    }
    bool ok = false;
    const int v = body.mid(i).toInt(&ok);
    if (!ok) return false;
    out = music::normalizePc(sign * v);
    return true;
}

} // namespace

DirectiveState::DirectiveState(music::Notation sourceNotation, int sourceKeyPc)
    : m_sourceNotation(sourceNotation),
      m_sourceKeyPc(music::normalizePc(sourceKeyPc)) {
    m_primary.notation = sourceNotation;
    m_primary.keyPc = m_sourceKeyPc;
    m_secondary = m_primary;
}

bool DirectiveState::isDirectiveLine(const QString& line) {
    const QString t = line.trimmed();
    if (!t.startsWith('!') || t.startsWith("![")) return false;
    for (const QChar c : t) {
        if (c.isSpace()) return false;
    }
    return true;
}

bool DirectiveState::apply(const QString& line, int lineNumber, book::Diagnostic& error) {
    const QString t = line.trimmed();
    const int column = line.indexOf('!') + 1;
    const bool second = t.startsWith("!!");
    const QString body = t.mid(second ? 2 : 1);

    if (body.isEmpty() || body.startsWith('!')) {
        error = book::Diagnostic::syntax({lineNumber, column}, "offset (+N, -N, 0) or notation name",
                                         QString("malformed directive '%1'").arg(t));
        return false;
    }

    TransformTarget& target = second ? m_secondary : m_primary;

    if (isOffsetBody(body)) {
        int offset = 0;
        if (!parseOffset(body, offset)) {
            error = book::Diagnostic::syntax({lineNumber, column}, "integer semitone offset",
                                             QString("malformed transposition directive '%1'").arg(t));
            return false;
        }
        target.offset = offset;
        if (second) m_secondaryEnabled = true;
        return true;
    }

    const int colon = body.indexOf(':');
    const QString name = (colon >= 0) ? body.left(colon) : body;
    music::Notation notation = music::Notation::English;
    if (!music::notationFromName(name, notation)) {
        error = book::Diagnostic::unsupportedNotation({lineNumber, column}, name);
        return false;
    }

    // Without ":key" the active tonic is kept when the notation does not change
    int keyPc = (notation == target.notation) ? target.keyPc : m_sourceKeyPc;
    if (colon >= 0) {
        const QString key = body.mid(colon + 1);
        if (!music::parsePitchClass(key, keyPc)) {
            error = book::Diagnostic::syntax({lineNumber, column + (second ? 2 : 1) + colon + 1}, "key name such as G or Eb",
                                             QString("invalid key '%1' in directive '%2'").arg(key, t));
            return false;
        }
    }

    target.notation = notation;
    target.keyPc = keyPc;
    if (second) m_secondaryEnabled = true;
    return true;
}

bool DirectiveState::renderChord(const music::ChordSymbol& source,
                                 const TransformTarget& target,
                                 QString& out,
                                 music::ChordError& error) const {
    music::ChordSymbol shifted;
    if (!music::transposeChord(source, target.offset, shifted, &error)) return false;
    music::ChordSymbol converted;
    if (!music::convertChordNotation(shifted, target.notation, target.keyPc, converted, &error)) return false;
    out = music::chordText(converted);
    return true;
}

bool DirectiveState::resolveChord(const QString& raw,
                                  QString& primary,
                                  QString& alt,
                                  bool& hasAlt,
                                  music::ChordError& error) const {
    music::ChordSymbol source;
    if (!music::parseChordSymbol(raw, m_sourceNotation, m_sourceKeyPc, source, &error)) return false;

    if (!renderChord(source, m_primary, primary, error)) return false;

    hasAlt = m_secondaryEnabled;
    alt.clear();
    if (hasAlt && !renderChord(source, m_secondary, alt, error)) return false;
    return true;
}

} // namespace markup
