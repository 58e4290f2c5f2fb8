#include "markup/BlockParser.h"

#include <QDebug>
#include <QRegularExpression>

#include <utility>

namespace markup {
namespace {

using book::Block;
using book::Inline;
using book::Inlines;

static const QRegularExpression& reRule() {
    static const QRegularExpression re(R"(^ {0,3}([-*_])[ \t]*(?:\1[ \t]*){2,}$)");
    return re;
}

static const QRegularExpression& reBullet() {
    static const QRegularExpression re(R"(^ {0,3}[-*+][ \t]+(.*)$)");
    return re;
}

static const QRegularExpression& reVerseItem() {
    static const QRegularExpression re(R"(^ {0,3}\d{1,9}[.)](?:[ \t]+(.*))?$)");
    return re;
}

static const QRegularExpression& reChorusItem() {
    static const QRegularExpression re(R"(^ {0,3}(>+)[ \t]+(\S.*)$)");
    return re;
}

static const QRegularExpression& reCustomItem() {
    static const QRegularExpression re(R"(^ {0,3}\[([^\]]+)\][ \t]+(\S.*)$)");
    return re;
}

static int indentOf(const QString& line) {
    int i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    return i;
}

static bool isBlank(const QString& line) {
    return line.trimmed().isEmpty();
}

static void appendInlines(Inlines& dst, Inlines src) {
    for (auto& i : src) dst.push_back(std::move(i));
}

} // namespace

BlockParser::BlockParser(DirectiveState& directives)
    : m_directives(directives),
      m_inline(directives) {
}

int BlockParser::fenceRun(const QString& line, QChar& marker) {
    const int indent = indentOf(line);
    if (indent > 3 || indent >= line.size()) return 0;
    const QChar c = line[indent];
    if (c != '`' && c != '~') return 0;
    int run = 0;
    while (indent + run < line.size() && line[indent + run] == c) ++run;
    if (run < 3) return 0;
    // ```G7``` is a malformed chord, not a fence
    if (c == '`' && line.indexOf('`', indent + run) >= 0) return 0;
    marker = c;
    return run;
}

bool BlockParser::closesFence(const QString& line, QChar marker, int run) {
    QChar c;
    const int r = fenceRun(line, c);
    if (r < run || c != marker) return false;
    return isBlank(line.mid(indentOf(line) + r));
}

BlockParser::LineKind BlockParser::classify(const QString& line) {
    if (isBlank(line)) return LineKind::Blank;
    if (DirectiveState::isDirectiveLine(line)) return LineKind::Directive;

    QChar marker;
    if (fenceRun(line, marker) > 0) return LineKind::Fence;
    if (reRule().match(line).hasMatch()) return LineKind::Rule;

    if (line.size() > 1 && line[0] == '<') {
        const QChar c = line[1];
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '/' || c == '!') return LineKind::Html;
    }

    if (reBullet().match(line).hasMatch()) return LineKind::Bullet;
    if (reVerseItem().match(line).hasMatch()) return LineKind::VerseItem;
    if (reChorusItem().match(line).hasMatch()) return LineKind::ChorusItem;
    if (reCustomItem().match(line).hasMatch()) return LineKind::CustomItem;
    return LineKind::Text;
}

BlockParser::LineContent BlockParser::content(const QString& line, LineKind kind) {
    LineContent c;
    QRegularExpressionMatch m;
    int group = 0;

    switch (kind) {
    case LineKind::Bullet:
        m = reBullet().match(line);
        group = 1;
        break;
    case LineKind::VerseItem:
        m = reVerseItem().match(line);
        group = 1;
        break;
    case LineKind::ChorusItem:
        m = reChorusItem().match(line);
        c.number = m.captured(1).size();
        group = 2;
        break;
    case LineKind::CustomItem:
        m = reCustomItem().match(line);
        c.label = m.captured(1).trimmed();
        group = 2;
        break;
    default:
        break;
    }

    if (group > 0 && m.hasMatch()) {
        if (m.capturedStart(group) >= 0) {
            c.text = m.captured(group);
            c.column = m.capturedStart(group);
        } else {
            c.column = line.size();
        }
        return c;
    }

    c.column = indentOf(line);
    c.text = line.mid(c.column);
    return c;
}

QVector<book::Block> BlockParser::parse(const QStringList& lines, int firstLine, book::Diagnostics& diagnostics) {
    m_lines = lines;
    m_firstLine = firstLine;

    QVector<Block> blocks;
    int i = 0;
    while (i < m_lines.size()) {
        const QString& line = m_lines[i];
        const LineKind kind = classify(line);

        if (kind == LineKind::Blank) {
            ++i;
            continue;
        }

        if (kind == LineKind::Directive) {
            book::Diagnostic error;
            if (!m_directives.apply(line, lineNumber(i), error)) diagnostics.push_back(error);
            ++i;
            continue;
        }

        const int end = blockEnd(i, kind);
        Block block;
        block.line = lineNumber(i);
        book::Diagnostic error;
        int verseCounter = m_nextVerse;
        bool ok = true;

        switch (kind) {
        case LineKind::Fence:
            parsePre(i, end, block);
            break;
        case LineKind::Rule:
            block.kind = Block::Kind::HorizontalLine;
            break;
        case LineKind::Html:
            ok = parseHtml(i, end, block, error);
            break;
        case LineKind::Bullet:
            ok = parseBullets(i, end, block, error);
            break;
        default:
            ok = parseVerse(i, end, verseCounter, block, error);
            break;
        }

        if (ok) {
            m_nextVerse = verseCounter;
            blocks.push_back(std::move(block));
        } else {
            qDebug().noquote() << QString("BlockParser: dropped %1 block at lines %2-%3: %4")
                .arg(book::blockKindName(block.kind))
                .arg(lineNumber(i))
                .arg(lineNumber(end - 1))
                .arg(error.message);
            diagnostics.push_back(error);
        }
        i = end;
    }
    return blocks;
}

int BlockParser::blockEnd(int start, LineKind kind) const {
    const int n = m_lines.size();

    switch (kind) {
    case LineKind::Rule:
        return start + 1;

    case LineKind::Fence: {
        QChar marker;
        const int run = fenceRun(m_lines[start], marker);
        for (int i = start + 1; i < n; ++i) {
            if (closesFence(m_lines[i], marker, run)) return i + 1;
        }
        return n; // unterminated fence runs to the end of the song
    }

    case LineKind::Html: {
        int i = start + 1;
        while (i < n) {
            const LineKind k = classify(m_lines[i]);
            if (k == LineKind::Blank || k == LineKind::Directive) break;
            ++i;
        }
        return i;
    }

    case LineKind::Bullet: {
        int i = start + 1;
        while (i < n) {
            const LineKind k = classify(m_lines[i]);
            if (k == LineKind::Bullet) { ++i; continue; }
            if (k == LineKind::Blank || k == LineKind::Directive || k == LineKind::Fence) break;
            if (indentOf(m_lines[i]) < 2) break;
            ++i;
        }
        return i;
    }

    default: {
        int i = start + 1;
        while (i < n) {
            const LineKind k = classify(m_lines[i]);
            if (k != LineKind::VerseItem && k != LineKind::ChorusItem
                && k != LineKind::CustomItem && k != LineKind::Text) {
                break;
            }
            ++i;
        }
        return i;
    }
    }
}

bool BlockParser::parseVerse(int start, int end, int& verseCounter, book::Block& block, book::Diagnostic& error) {
    block.kind = Block::Kind::Verse;

    for (int i = start; i < end; ++i) {
        const LineKind kind = classify(m_lines[i]);
        const LineContent c = content(m_lines[i], kind);

        Inlines inlines;
        if (!m_inline.parseLine(c.text, lineNumber(i), c.column, inlines, error)) return false;

        if (kind == LineKind::Text && !block.paragraphs.isEmpty()) {
            Inlines& dst = block.paragraphs.last().inlines;
            if (!dst.empty() && dst.back().kind != Inline::Kind::Break) dst.push_back(Inline::makeBreak());
            appendInlines(dst, std::move(inlines));
            continue;
        }

        book::Paragraph p;
        p.line = lineNumber(i);
        switch (kind) {
        case LineKind::VerseItem:
            p.label.kind = book::ParagraphLabel::Kind::Verse;
            p.label.number = verseCounter++;
            break;
        case LineKind::ChorusItem:
            p.label.kind = book::ParagraphLabel::Kind::Chorus;
            p.label.number = c.number;
            break;
        case LineKind::CustomItem:
            p.label.kind = book::ParagraphLabel::Kind::Custom;
            p.label.text = c.label;
            break;
        default:
            break;
        }
        p.inlines = std::move(inlines);
        block.paragraphs.push_back(std::move(p));
    }
    return true;
}

bool BlockParser::parseBullets(int start, int end, book::Block& block, book::Diagnostic& error) {
    block.kind = Block::Kind::BulletList;

    for (int i = start; i < end; ++i) {
        const LineKind kind = classify(m_lines[i]);
        const LineContent c = content(m_lines[i], kind == LineKind::Bullet ? kind : LineKind::Text);

        Inlines inlines;
        if (!m_inline.parseLine(c.text, lineNumber(i), c.column, inlines, error)) return false;
        const QString text = book::plainText(inlines).trimmed();

        if (kind == LineKind::Bullet || block.items.isEmpty()) {
            block.items.push_back(text);
        } else if (!text.isEmpty()) {
            QString& item = block.items.last();
            if (!item.isEmpty()) item += ' ';
            item += text;
        }
    }
    return true;
}

bool BlockParser::parseHtml(int start, int end, book::Block& block, book::Diagnostic& error) {
    block.kind = Block::Kind::HtmlBlock;

    for (int i = start; i < end; ++i) {
        Inlines inlines;
        if (!m_inline.parseLine(m_lines[i], lineNumber(i), 0, inlines, error)) return false;
        if (i > start && !block.inlines.empty() && block.inlines.back().kind != Inline::Kind::Break) {
            block.inlines.push_back(Inline::makeBreak());
        }
        appendInlines(block.inlines, std::move(inlines));
    }
    return true;
}

void BlockParser::parsePre(int start, int end, book::Block& block) const {
    block.kind = Block::Kind::Pre;

    QChar marker;
    const int run = fenceRun(m_lines[start], marker);
    int last = end;
    if (end - 1 > start && closesFence(m_lines[end - 1], marker, run)) last = end - 1;

    QStringList body;
    for (int i = start + 1; i < last; ++i) body.push_back(m_lines[i]);
    block.preText = body.join('\n');
}

} // namespace markup
