#include "book/BookJson.h"

#include <QJsonDocument>

#include "book/AstVersion.h"

namespace book {
namespace {

static QJsonValue labelToJson(const ParagraphLabel& label) {
    QJsonObject o;
    switch (label.kind) {
    case ParagraphLabel::Kind::None:
        return QJsonValue(QJsonValue::Null);
    case ParagraphLabel::Kind::Verse:
        o.insert("verse", label.number);
        break;
    case ParagraphLabel::Kind::Chorus:
        o.insert("chorus", label.number);
        break;
    case ParagraphLabel::Kind::Custom:
        o.insert("custom", label.text);
        break;
    }
    return o;
}

static QJsonObject attrsToJson(const QMap<QString, QString>& attrs) {
    QJsonObject o;
    for (auto it = attrs.cbegin(); it != attrs.cend(); ++it) o.insert(it.key(), it.value());
    return o;
}

} // namespace

QJsonObject inlineToJson(const Inline& i) {
    QJsonObject o;
    o.insert("type", inlineKindName(i.kind));
    switch (i.kind) {
    case Inline::Kind::Text:
        o.insert("text", i.text);
        break;
    case Inline::Kind::Chord:
        o.insert("primary", i.chord);
        o.insert("alt_chord", i.hasAltChord ? QJsonValue(i.altChord) : QJsonValue(QJsonValue::Null));
        o.insert("style", i.style);
        o.insert("baseline", i.baseline);
        o.insert("inlines", inlinesToJson(i.inlines));
        break;
    case Inline::Kind::Break:
        break;
    case Inline::Kind::Emph:
    case Inline::Kind::Strong:
        o.insert("inlines", inlinesToJson(i.inlines));
        break;
    case Inline::Kind::Link:
        o.insert("url", i.url);
        o.insert("title", i.title.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(i.title));
        o.insert("text", i.text);
        break;
    case Inline::Kind::Image:
        o.insert("path", i.path);
        o.insert("width", i.width);
        o.insert("height", i.height);
        o.insert("class", i.imageClass.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(i.imageClass));
        break;
    case Inline::Kind::ChorusRef:
        o.insert("num", i.chorusNumber);
        o.insert("prespace", i.prespace);
        break;
    case Inline::Kind::Tag:
        o.insert("name", i.tagName);
        o.insert("attrs", attrsToJson(i.attrs));
        break;
    }
    return o;
}

QJsonArray inlinesToJson(const Inlines& inlines) {
    QJsonArray a;
    for (const auto& i : inlines) a.append(inlineToJson(i));
    return a;
}

QJsonObject blockToJson(const Block& b) {
    QJsonObject o;
    o.insert("type", blockKindName(b.kind));
    switch (b.kind) {
    case Block::Kind::Verse: {
        QJsonArray paragraphs;
        for (const auto& p : b.paragraphs) {
            QJsonObject po;
            po.insert("label", labelToJson(p.label));
            po.insert("inlines", inlinesToJson(p.inlines));
            paragraphs.append(po);
        }
        o.insert("paragraphs", paragraphs);
        break;
    }
    case Block::Kind::BulletList:
        o.insert("items", QJsonArray::fromStringList(b.items));
        break;
    case Block::Kind::HorizontalLine:
        break;
    case Block::Kind::Pre:
        o.insert("text", b.preText);
        break;
    case Block::Kind::HtmlBlock:
        o.insert("inlines", inlinesToJson(b.inlines));
        break;
    }
    return o;
}

QJsonObject songToJson(const Song& s) {
    QJsonObject o;
    o.insert("title", s.title);
    o.insert("subtitles", QJsonArray::fromStringList(s.subtitles));
    QJsonArray blocks;
    for (const auto& b : s.blocks) blocks.append(blockToJson(b));
    o.insert("blocks", blocks);
    return o;
}

QJsonObject bookToJson(const Book& b) {
    QJsonObject o;
    o.insert("title", b.meta.title);
    o.insert("subtitle", b.meta.subtitle.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(b.meta.subtitle));
    o.insert("front_img", b.meta.frontImage.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(b.meta.frontImage));
    o.insert("title_note", b.meta.titleNote.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(b.meta.titleNote));
    o.insert("chorus_label", b.meta.chorusLabel);
    o.insert("notation", b.meta.notation);
    return o;
}

QJsonObject documentToJson(const Book& b, const Diagnostics& diagnostics) {
    QJsonObject o;
    o.insert("ast_version", currentAstVersion().toString());
    o.insert("book", bookToJson(b));
    QJsonArray songs;
    for (const auto& s : b.songs) songs.append(songToJson(s));
    o.insert("songs", songs);
    QJsonArray diags;
    for (const auto& d : diagnostics) diags.append(d.toJson());
    o.insert("diagnostics", diags);
    return o;
}

QString documentToJsonString(const Book& b, const Diagnostics& diagnostics, bool compact) {
    const QJsonDocument doc(documentToJson(b, diagnostics));
    return QString::fromUtf8(doc.toJson(compact ? QJsonDocument::Compact : QJsonDocument::Indented));
}

} // namespace book
