#include "markup/InlineParser.h"

#include <QRegularExpression>

#include <utility>

namespace markup {
namespace {

using book::Inline;
using book::Inlines;

static bool isAsciiLetter(QChar c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool isAsciiLetterOrDigit(QChar c) {
    return isAsciiLetter(c) || (c >= '0' && c <= '9');
}

static bool isEscapable(QChar c) {
    return c.unicode() < 128 && (c.isPunct() || c.isSymbol());
}

static QString unescape(const QString& s) {
    QString out;
    out.reserve(s.size());
    for (int i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size() && isEscapable(s[i + 1])) {
            out += s[i + 1];
            ++i;
            continue;
        }
        out += s[i];
    }
    return out;
}

// Splits a link/image destination: target [=WxH] ["quoted"].
static bool splitDestination(const QString& dest, QString& target, QString& size, QString& quoted, QString& problem) {
    QString d = dest.trimmed();
    const int q = d.indexOf('"');
    if (q >= 0) {
        if (d.size() - 1 == q || !d.endsWith('"')) {
            problem = "closing '\"'";
            return false;
        }
        quoted = d.mid(q + 1, d.size() - q - 2);
        d = d.left(q).trimmed();
    }

    static const QRegularExpression reSpace(R"(\s+)");
    const QStringList parts = d.split(reSpace, Qt::SkipEmptyParts);
    if (!parts.isEmpty()) target = parts[0];
    if (parts.size() > 1) size = parts[1];
    if (parts.size() > 2) {
        problem = "')'";
        return false;
    }
    return true;
}

static book::Diagnostic chordDiagnostic(const music::ChordError& ce, book::SourceLocation loc) {
    switch (ce.kind) {
    case music::ChordErrorKind::UnsupportedNotation: {
        book::Diagnostic d;
        d.kind = book::DiagnosticKind::UnsupportedNotation;
        d.location = loc;
        d.message = ce.message;
        return d;
    }
    case music::ChordErrorKind::InvalidTransposition:
        return book::Diagnostic::invalidTransposition(loc, ce.message);
    case music::ChordErrorKind::Syntax:
    case music::ChordErrorKind::None:
        break;
    }
    return book::Diagnostic::syntax(loc, ce.expected, ce.message);
}

static bool isBlankText(const Inlines& inlines) {
    for (const auto& i : inlines) {
        if (i.kind != Inline::Kind::Text || !i.text.trimmed().isEmpty()) return false;
    }
    return true;
}

} // namespace

InlineParser::InlineParser(const DirectiveState& directives)
    : m_directives(directives) {
}

bool InlineParser::parseLine(const QString& line,
                             int lineNumber,
                             int columnOffset,
                             book::Inlines& out,
                             book::Diagnostic& error) {
    m_s = line;
    m_pos = 0;
    m_line = lineNumber;
    m_columnOffset = columnOffset;
    m_unclosed.clear();

    Inlines seq;
    bool closed = false;
    if (!parseSequence(QString(), seq, closed)) {
        error = m_error;
        return false;
    }
    out = std::move(seq);
    return true;
}

bool InlineParser::parseSequence(const QString& closer, book::Inlines& out, bool& closed) {
    closed = false;
    QString text;
    auto flush = [&]() {
        if (!text.isEmpty()) {
            out.push_back(Inline::makeText(text));
            text.clear();
        }
    };

    while (m_pos < m_s.size()) {
        if (!closer.isEmpty() && atCloser(closer)) {
            flush();
            m_pos += closer.size();
            closed = true;
            return groupChords(out);
        }

        const QChar c = m_s[m_pos];

        if (c == '\\') {
            if (m_pos + 1 == m_s.size()) {
                flush();
                out.push_back(Inline::makeBreak());
                m_pos += 1;
                continue;
            }
            if (isEscapable(m_s[m_pos + 1])) {
                text += m_s[m_pos + 1];
                m_pos += 2;
                continue;
            }
            text += c;
            m_pos += 1;
            continue;
        }

        if (c == '`') {
            Inline node;
            if (!parseChord(node)) return false;
            flush();
            out.push_back(std::move(node));
            continue;
        }

        if (c == '*' || c == '_') {
            if (!parseEmphasis(c, out, text)) return false;
            continue;
        }

        if (c == '!' && m_pos + 1 < m_s.size() && m_s[m_pos + 1] == '[') {
            Inline node;
            const Match m = parseImage(node);
            if (m == Match::Failed) return false;
            if (m == Match::Parsed) {
                flush();
                out.push_back(std::move(node));
            } else {
                text += c;
                m_pos += 1;
            }
            continue;
        }

        if (c == '[') {
            Inline node;
            const Match m = parseLink(node);
            if (m == Match::Failed) return false;
            if (m == Match::Parsed) {
                flush();
                out.push_back(std::move(node));
            } else {
                text += c;
                m_pos += 1;
            }
            continue;
        }

        if (c == '>') {
            const int r = runLength(m_pos, '>');
            const int after = m_pos + r;
            const bool wordStart = (m_pos == 0) || m_s[m_pos - 1].isSpace();
            const bool wordEnd = (after >= m_s.size()) || m_s[after].isSpace();
            if (wordStart && wordEnd) {
                const bool prespace = !m_s.left(m_pos).trimmed().isEmpty();
                flush();
                out.push_back(Inline::makeChorusRef(r, prespace, m_line, location(m_pos).column));
                m_pos = after;
                continue;
            }
            text += m_s.mid(m_pos, r);
            m_pos = after;
            continue;
        }

        if (c == '<' && m_pos + 1 < m_s.size()) {
            const QChar n1 = m_s[m_pos + 1];
            const bool opens = isAsciiLetter(n1)
                || (n1 == '/' && m_pos + 2 < m_s.size() && isAsciiLetter(m_s[m_pos + 2]));
            if (opens) {
                Inline node;
                const Match m = parseTag(node);
                if (m == Match::Failed) return false;
                flush();
                out.push_back(std::move(node));
                continue;
            }
        }

        text += c;
        m_pos += 1;
    }

    flush();
    // An emphasis span that reaches the end of the line is not a span; the caller backtracks.
    if (!closer.isEmpty()) return true;
    closed = true;
    return groupChords(out);
}

bool InlineParser::parseChord(book::Inline& node) {
    const int start = m_pos;
    const int r = runLength(start, '`');
    if (r > 2) {
        return fail(book::Diagnostic::syntax(location(start), "chord delimited by one or two backticks",
                                             QString("chord delimiter of %1 backticks").arg(r)));
    }

    int close = -1;
    int from = start + r;
    while (true) {
        const int idx = m_s.indexOf('`', from);
        if (idx < 0) break;
        const int run = runLength(idx, '`');
        if (run == r) {
            close = idx;
            break;
        }
        from = idx + run;
    }
    if (close < 0) {
        return fail(book::Diagnostic::syntax(location(start), QString(r, '`'), "unterminated chord"));
    }

    const QString raw = m_s.mid(start + r, close - start - r);
    QString primary;
    QString alt;
    bool hasAlt = false;
    music::ChordError ce;
    if (!m_directives.resolveChord(raw, primary, alt, hasAlt, ce)) {
        int lead = 0;
        while (lead < raw.size() && raw[lead].isSpace()) ++lead;
        return fail(chordDiagnostic(ce, location(start + r + lead + ce.position)));
    }

    node = Inline::makeChord(primary, r);
    node.hasAltChord = hasAlt;
    node.altChord = alt;
    m_pos = close + r;
    return true;
}

bool InlineParser::parseEmphasis(QChar marker, book::Inlines& out, QString& text) {
    const int r = runLength(m_pos, marker);
    const int after = m_pos + r;
    const bool leftFlanking = after < m_s.size() && !m_s[after].isSpace();
    const bool intraword = marker == '_' && m_pos > 0 && m_s[m_pos - 1].isLetterOrNumber();
    if (!leftFlanking || intraword || m_unclosed.contains(m_pos)) {
        text += m_s.mid(m_pos, r);
        m_pos = after;
        return true;
    }

    const int take = (r >= 2) ? 2 : 1;
    const QString delim(take, marker);
    const int opener = m_pos;
    m_pos += take;

    Inlines inner;
    bool closed = false;
    if (!parseSequence(delim, inner, closed)) return false;

    if (closed && !inner.empty()) {
        if (!text.isEmpty()) {
            out.push_back(Inline::makeText(text));
            text.clear();
        }
        out.push_back(Inline::makeSpan(take == 2 ? Inline::Kind::Strong : Inline::Kind::Emph, std::move(inner)));
        return true;
    }

    m_unclosed.insert(opener);
    m_pos = opener + take;
    text += delim;
    return true;
}

InlineParser::Match InlineParser::parseLink(book::Inline& node) {
    const int start = m_pos;
    int depth = 0;
    int close = -1;
    for (int i = start; i < m_s.size(); ++i) {
        const QChar c = m_s[i];
        if (c == '\\') { ++i; continue; }
        if (c == '[') ++depth;
        else if (c == ']' && --depth == 0) { close = i; break; }
    }
    if (close < 0 || close + 1 >= m_s.size() || m_s[close + 1] != '(') return Match::Literal;

    const int paren = m_s.indexOf(')', close + 2);
    if (paren < 0) {
        fail(book::Diagnostic::syntax(location(close + 1), "')'", "unterminated link destination"));
        return Match::Failed;
    }

    QString url;
    QString size;
    QString title;
    QString problem;
    if (!splitDestination(m_s.mid(close + 2, paren - close - 2), url, size, title, problem) || !size.isEmpty()) {
        fail(book::Diagnostic::syntax(location(close + 2), problem.isEmpty() ? "'\"title\"' or ')'" : problem,
                                      "malformed link destination"));
        return Match::Failed;
    }

    node = Inline::makeLink(url, title, unescape(m_s.mid(start + 1, close - start - 1)));
    m_pos = paren + 1;
    return Match::Parsed;
}

InlineParser::Match InlineParser::parseImage(book::Inline& node) {
    const int start = m_pos; // at '!'
    const int close = m_s.indexOf(']', start + 2);
    if (close < 0 || close + 1 >= m_s.size() || m_s[close + 1] != '(') return Match::Literal;

    const int paren = m_s.indexOf(')', close + 2);
    if (paren < 0) {
        fail(book::Diagnostic::syntax(location(close + 1), "')'", "unterminated image destination"));
        return Match::Failed;
    }

    QString path;
    QString size;
    QString imageClass;
    QString problem;
    if (!splitDestination(m_s.mid(close + 2, paren - close - 2), path, size, imageClass, problem)) {
        fail(book::Diagnostic::syntax(location(close + 2), problem, "malformed image destination"));
        return Match::Failed;
    }

    int width = 0;
    int height = 0;
    if (!size.isEmpty()) {
        static const QRegularExpression reSize(R"(^=(\d*)x(\d*)$)");
        const QRegularExpressionMatch m = reSize.match(size);
        if (!m.hasMatch()) {
            fail(book::Diagnostic::syntax(location(close + 2), "=WIDTHxHEIGHT",
                                          QString("malformed image size '%1'").arg(size)));
            return Match::Failed;
        }
        width = m.captured(1).toInt();
        height = m.captured(2).toInt();
    }

    node = Inline::makeImage(path, width, height, imageClass);
    m_pos = paren + 1;
    return Match::Parsed;
}

InlineParser::Match InlineParser::parseTag(book::Inline& node) {
    const int start = m_pos; // at '<'
    const int n = m_s.size();
    int i = start + 1;
    bool closing = false;
    if (m_s[i] == '/') {
        closing = true;
        ++i;
    }

    const int nameStart = i;
    while (i < n && (isAsciiLetterOrDigit(m_s[i]) || m_s[i] == '-')) ++i;
    const QString name = m_s.mid(nameStart, i - nameStart);

    QMap<QString, QString> attrs;
    while (true) {
        while (i < n && m_s[i].isSpace()) ++i;
        if (i >= n) {
            fail(book::Diagnostic::syntax(location(start), "'>'", QString("unterminated tag <%1").arg(name)));
            return Match::Failed;
        }
        if (m_s[i] == '>') {
            ++i;
            break;
        }
        if (!closing && m_s[i] == '/' && i + 1 < n && m_s[i + 1] == '>') {
            i += 2;
            break;
        }
        if (closing) {
            fail(book::Diagnostic::syntax(location(i), "'>'", QString("unexpected text in closing tag </%1>").arg(name)));
            return Match::Failed;
        }

        const int attrStart = i;
        while (i < n && (isAsciiLetterOrDigit(m_s[i]) || m_s[i] == '-' || m_s[i] == '_' || m_s[i] == ':' || m_s[i] == '.')) ++i;
        if (i == attrStart) {
            fail(book::Diagnostic::syntax(location(i), "attribute name or '>'",
                                          QString("unexpected '%1' in tag <%2>").arg(m_s[i]).arg(name)));
            return Match::Failed;
        }
        const QString attrName = m_s.mid(attrStart, i - attrStart);

        QString value;
        int j = i;
        while (j < n && m_s[j].isSpace()) ++j;
        if (j < n && m_s[j] == '=') {
            i = j + 1;
            while (i < n && m_s[i].isSpace()) ++i;
            if (i >= n) {
                fail(book::Diagnostic::syntax(location(start), "attribute value", QString("unterminated tag <%1").arg(name)));
                return Match::Failed;
            }
            const QChar q = m_s[i];
            if (q == '"' || q == '\'') {
                const int end = m_s.indexOf(q, i + 1);
                if (end < 0) {
                    fail(book::Diagnostic::syntax(location(i), QString(q), "unterminated attribute value"));
                    return Match::Failed;
                }
                value = m_s.mid(i + 1, end - i - 1);
                i = end + 1;
            } else {
                const int valueStart = i;
                while (i < n && !m_s[i].isSpace() && m_s[i] != '>'
                       && !(m_s[i] == '/' && i + 1 < n && m_s[i + 1] == '>')) {
                    ++i;
                }
                value = m_s.mid(valueStart, i - valueStart);
            }
        }
        attrs.insert(attrName, value);
    }

    if (!closing && name.compare("br", Qt::CaseInsensitive) == 0) {
        node = Inline::makeBreak();
    } else {
        node = Inline::makeTag(closing ? "/" + name : name, attrs);
    }
    m_pos = i;
    return Match::Parsed;
}

bool InlineParser::groupChords(book::Inlines& seq) {
    Inlines out;
    out.reserve(seq.size());

    std::size_t i = 0;
    while (i < seq.size()) {
        if (seq[i].kind != Inline::Kind::Chord) {
            out.push_back(std::move(seq[i]));
            ++i;
            continue;
        }

        Inline chord = std::move(seq[i]);
        ++i;

        Inlines lyrics;
        while (i < seq.size() && seq[i].kind != Inline::Kind::Chord && seq[i].kind != Inline::Kind::Break) {
            if (book::containsChord(seq[i].inlines)) {
                return fail(book::Diagnostic::nestedChord(book::SourceLocation{m_line, 0}));
            }
            lyrics.push_back(std::move(seq[i]));
            ++i;
        }

        if (isBlankText(lyrics)) {
            chord.baseline = true;
            out.push_back(std::move(chord));
            for (auto& l : lyrics) out.push_back(std::move(l));
        } else {
            chord.inlines = std::move(lyrics);
            out.push_back(std::move(chord));
        }
    }

    seq = std::move(out);
    return true;
}

bool InlineParser::atCloser(const QString& closer) const {
    const QChar c = closer[0];
    if (m_s[m_pos] != c) return false;
    // Closing marks must follow content: "*a *" does not close at the second '*'.
    if (m_pos == 0 || m_s[m_pos - 1].isSpace()) return false;

    const int r = runLength(m_pos, c);
    if (r < closer.size()) return false;
    const int after = m_pos + r;
    if (r > closer.size()) {
        // Surplus marks close only when nothing could be opened after them ("***x***").
        if (after < m_s.size() && !m_s[after].isSpace() && !m_s[after].isPunct()) return false;
    }
    if (c == '_' && after < m_s.size() && m_s[after].isLetterOrNumber()) return false;
    return true;
}

int InlineParser::runLength(int pos, QChar c) const {
    int r = 0;
    while (pos + r < m_s.size() && m_s[pos + r] == c) ++r;
    return r;
}

bool InlineParser::fail(const book::Diagnostic& d) {
    m_error = d;
    return false;
}

book::SourceLocation InlineParser::location(int pos) const {
    return book::SourceLocation{m_line, m_columnOffset + pos + 1};
}

} // namespace markup
