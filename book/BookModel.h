#pragma once

#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <vector>

namespace book {

struct Inline;
// Inline children nest recursively; std::vector is used because it is specified for incomplete element types.
using Inlines = std::vector<Inline>;

struct Inline {
    enum class Kind {
        Text,
        Chord,
        Break,
        Emph,
        Strong,
        Link,
        Image,
        ChorusRef,
        Tag,
    };

    Kind kind = Kind::Text;

    // Text: literal content. Link: display text.
    QString text;

    // Chord
    QString chord;          // primary text after transposition / notation conversion
    QString altChord;       // secondary row, only when hasAltChord
    bool hasAltChord = false;
    int style = 1;          // number of delimiter marks in source (1 or 2)
    bool baseline = false;  // no lyrics attached; `inlines` is empty

    // Chord lyrics, Emph and Strong content.
    Inlines inlines;

    // Link
    QString url;
    QString title;          // optional; empty when absent

    // Image
    QString path;
    int width = 0;          // 0 = not given
    int height = 0;
    QString imageClass;     // optional alignment class

    // ChorusRef
    int chorusNumber = 0;
    bool prespace = false;  // content precedes the reference on its line
    int line = 0;           // source position, for diagnostics
    int column = 0;

    // Tag (opaque to the parser, resolved by the renderer)
    QString tagName;        // closing tags are named "/name"
    QMap<QString, QString> attrs;

    static Inline makeText(const QString& text);
    static Inline makeBreak();
    static Inline makeChord(const QString& chord, int style);
    static Inline makeSpan(Kind kind, Inlines content);
    static Inline makeLink(const QString& url, const QString& title, const QString& text);
    static Inline makeImage(const QString& path, int width, int height, const QString& imageClass);
    static Inline makeChorusRef(int number, bool prespace, int line, int column = 0);
    static Inline makeTag(const QString& name, const QMap<QString, QString>& attrs);
};

// Stable tag names the renderers dispatch on.
QString inlineKindName(Inline::Kind kind);

// True if any Chord occurs in `inlines`, at any depth.
bool containsChord(const Inlines& inlines);

// Concatenated human-readable text of inlines (chords contribute their lyrics only).
QString plainText(const Inlines& inlines);

struct ParagraphLabel {
    enum class Kind {
        None,
        Verse,
        Chorus,
        Custom,
    };

    Kind kind = Kind::None;
    int number = 0;     // Verse / Chorus
    QString text;       // Custom
};

struct Paragraph {
    ParagraphLabel label;
    Inlines inlines;
    int line = 0;
};

struct Block {
    enum class Kind {
        Verse,
        BulletList,
        HorizontalLine,
        Pre,
        HtmlBlock,
    };

    Kind kind = Kind::Verse;

    QVector<Paragraph> paragraphs; // Verse
    QStringList items;             // BulletList, already rendered to text
    QString preText;               // Pre, byte-for-byte source
    Inlines inlines;               // HtmlBlock

    int line = 0;                  // first source line
};

QString blockKindName(Block::Kind kind);

struct Song {
    QString title;
    QStringList subtitles;
    QVector<Block> blocks;
};

struct BookMetadata {
    QString title;
    QString subtitle;
    QString frontImage;
    QString titleNote;
    QString chorusLabel;
    QString notation; // declared default notation system name
};

struct Book {
    BookMetadata meta;
    QVector<Song> songs;
};

} // namespace book
