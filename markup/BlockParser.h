#pragma once

#include <QChar>
#include <QString>
#include <QStringList>
#include <QVector>

#include "book/BookModel.h"
#include "book/Diagnostic.h"
#include "markup/DirectiveState.h"
#include "markup/InlineParser.h"

namespace markup {

// Groups the body lines of one song into blocks:
// - verse blocks: "1." / "1)" items, "> " chorus items, "[Label] " custom items, continuation lines
// - bullet lists: "- ", "* ", "+ " items; lines indented by 2+ spaces continue the previous item
// - horizontal lines: "---", "***", "___"
// - pre blocks: fenced with ``` or ~~~, stored byte-for-byte
// - html blocks: a line starting with '<' plus a letter, '/' or '!', up to the next blank line
// Directive lines are applied to the DirectiveState as they are reached and end the current block.
// A block whose content fails to parse is dropped and reported; scanning resumes after it.
class BlockParser {
public:
    enum class LineKind {
        Blank,
        Directive,
        Fence,
        Rule,
        Html,
        Bullet,
        VerseItem,
        ChorusItem,
        CustomItem,
        Text,
    };

    explicit BlockParser(DirectiveState& directives);

    // `firstLine` is the source line number of lines[0].
    QVector<book::Block> parse(const QStringList& lines, int firstLine, book::Diagnostics& diagnostics);

    static LineKind classify(const QString& line);

    // Length of the fence run opening `line` (0 if it is not a fence); `marker` gets '`' or '~'.
    static int fenceRun(const QString& line, QChar& marker);
    static bool closesFence(const QString& line, QChar marker, int run);

private:
    struct LineContent {
        QString text;
        int column = 0; // 0-based column of text[0] within the line
        int number = 0; // ChorusItem: length of the '>' run
        QString label;  // CustomItem
    };

    static LineContent content(const QString& line, LineKind kind);

    int blockEnd(int start, LineKind kind) const;
    int lineNumber(int index) const { return m_firstLine + index; }

    bool parseVerse(int start, int end, int& verseCounter, book::Block& block, book::Diagnostic& error);
    bool parseBullets(int start, int end, book::Block& block, book::Diagnostic& error);
    bool parseHtml(int start, int end, book::Block& block, book::Diagnostic& error);
    void parsePre(int start, int end, book::Block& block) const;

    DirectiveState& m_directives;
    InlineParser m_inline;

    QStringList m_lines;
    int m_firstLine = 1;
    int m_nextVerse = 1;
};

} // namespace markup
