#include "book/BookModel.h"

#include <utility>

namespace book {

Inline Inline::makeText(const QString& text) {
    Inline i;
    i.kind = Kind::Text;
    i.text = text;
    return i;
}

Inline Inline::makeBreak() {
    Inline i;
    i.kind = Kind::Break;
    return i;
}

Inline Inline::makeChord(const QString& chord, int style) {
    Inline i;
    i.kind = Kind::Chord;
    i.chord = chord;
    i.style = style;
    return i;
}

Inline Inline::makeSpan(Kind kind, Inlines content) {
    Inline i;
    i.kind = kind;
    i.inlines = std::move(content);
    return i;
}

Inline Inline::makeLink(const QString& url, const QString& title, const QString& text) {
    Inline i;
    i.kind = Kind::Link;
    i.url = url;
    i.title = title;
    i.text = text;
    return i;
}

Inline Inline::makeImage(const QString& path, int width, int height, const QString& imageClass) {
    Inline i;
    i.kind = Kind::Image;
    i.path = path;
    i.width = width;
    i.height = height;
    i.imageClass = imageClass;
    return i;
}

Inline Inline::makeChorusRef(int number, bool prespace, int line, int column) {
    Inline i;
    i.kind = Kind::ChorusRef;
    i.chorusNumber = number;
    i.prespace = prespace;
    i.line = line;
    i.column = column;
    return i;
}

Inline Inline::makeTag(const QString& name, const QMap<QString, QString>& attrs) {
    Inline i;
    i.kind = Kind::Tag;
    i.tagName = name;
    i.attrs = attrs;
    return i;
}

QString inlineKindName(Inline::Kind kind) {
    switch (kind) {
    case Inline::Kind::Text:      return "i-text";
    case Inline::Kind::Chord:     return "i-chord";
    case Inline::Kind::Break:     return "i-break";
    case Inline::Kind::Emph:      return "i-emph";
    case Inline::Kind::Strong:    return "i-strong";
    case Inline::Kind::Link:      return "i-link";
    case Inline::Kind::Image:     return "i-image";
    case Inline::Kind::ChorusRef: return "i-chorus-ref";
    case Inline::Kind::Tag:       return "i-tag";
    }
    return {};
}

QString blockKindName(Block::Kind kind) {
    switch (kind) {
    case Block::Kind::Verse:          return "b-verse";
    case Block::Kind::BulletList:     return "b-bullet-list";
    case Block::Kind::HorizontalLine: return "b-horizontal-line";
    case Block::Kind::Pre:            return "b-pre";
    case Block::Kind::HtmlBlock:      return "b-html-block";
    }
    return {};
}

bool containsChord(const Inlines& inlines) {
    for (const auto& i : inlines) {
        if (i.kind == Inline::Kind::Chord) return true;
        if (containsChord(i.inlines)) return true;
    }
    return false;
}

QString plainText(const Inlines& inlines) {
    QString out;
    for (const auto& i : inlines) {
        switch (i.kind) {
        case Inline::Kind::Text:
        case Inline::Kind::Link:
            out += i.text;
            break;
        case Inline::Kind::Break:
            out += '\n';
            break;
        case Inline::Kind::Chord:
        case Inline::Kind::Emph:
        case Inline::Kind::Strong:
            out += plainText(i.inlines);
            break;
        case Inline::Kind::Image:
        case Inline::Kind::ChorusRef:
        case Inline::Kind::Tag:
            break;
        }
    }
    return out;
}

} // namespace book
