#pragma once

#include <QSet>
#include <QString>

#include "book/BookModel.h"
#include "book/Diagnostic.h"
#include "markup/DirectiveState.h"

namespace markup {

// Parses one line of song content into inline nodes.
// - chords: `G7` (style 1) or ``G7`` (style 2), resolved through the current directive state
// - *emph* _emph_ **strong** __strong__ (unmatched marks stay literal)
// - [text](url "title"), ![alt](path =WxH "class")
// - trailing backslash and <br> are line breaks
// - a standalone run of '>' is a chorus reference (one '>' per chorus number)
// - <name attr="v"> and </name> become tags
// A chord owns the inlines that follow it up to the next chord or break; a chord showing up
// inside another chord's lyrics is a NestedChordError.
class InlineParser {
public:
    explicit InlineParser(const DirectiveState& directives);

    // `columnOffset` is the 0-based column of line[0] in the source line, for diagnostics.
    bool parseLine(const QString& line, int lineNumber, int columnOffset, book::Inlines& out, book::Diagnostic& error);

private:
    enum class Match {
        Parsed,
        Literal,
        Failed,
    };

    bool parseSequence(const QString& closer, book::Inlines& out, bool& closed);
    bool parseChord(book::Inline& node);
    bool parseEmphasis(QChar marker, book::Inlines& out, QString& text);
    Match parseLink(book::Inline& node);
    Match parseImage(book::Inline& node);
    Match parseTag(book::Inline& node);
    bool groupChords(book::Inlines& seq);

    bool atCloser(const QString& closer) const;
    int runLength(int pos, QChar c) const;
    bool fail(const book::Diagnostic& d);
    book::SourceLocation location(int pos) const;

    const DirectiveState& m_directives;

    QString m_s;
    int m_pos = 0;
    int m_line = 0;
    int m_columnOffset = 0;
    QSet<int> m_unclosed; // emphasis openers already known to have no closer
    book::Diagnostic m_error;
};

} // namespace markup
