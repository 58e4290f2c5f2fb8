#include "book/AstVersion.h"
#include "book/BookJson.h"
#include "book/BookModel.h"
#include "book/BookSettings.h"
#include "book/Diagnostic.h"
#include "book/DocumentAssembler.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtGlobal>

#include <utility>

using book::Block;
using book::DiagnosticKind;
using book::Inline;
using book::Inlines;
using book::Paragraph;
using book::ParagraphLabel;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static Paragraph paragraph(ParagraphLabel::Kind kind, int number, Inlines inlines, int line) {
    Paragraph p;
    p.label.kind = kind;
    p.label.number = number;
    p.inlines = std::move(inlines);
    p.line = line;
    return p;
}

static Block verse(QVector<Paragraph> paragraphs) {
    Block b;
    b.kind = Block::Kind::Verse;
    b.paragraphs = std::move(paragraphs);
    return b;
}

} // namespace

static void testAssembler() {
    book::Song song;
    song.title = "Refs";

    Inlines withRef;
    withRef.push_back(Inline::makeText("again "));
    withRef.push_back(Inline::makeChorusRef(1, true, 5));
    withRef.push_back(Inline::makeChorusRef(3, true, 5));
    withRef.push_back(Inline::makeBreak());

    Inlines early;
    early.push_back(Inline::makeChorusRef(1, false, 1));

    Inlines chorus;
    chorus.push_back(Inline::makeText("chorus"));
    Inlines chorusAgain;
    chorusAgain.push_back(Inline::makeText("chorus again"));

    song.blocks.push_back(verse({paragraph(ParagraphLabel::Kind::None, 0, early, 1)}));
    song.blocks.push_back(verse({
        paragraph(ParagraphLabel::Kind::Chorus, 1, chorus, 3),
        paragraph(ParagraphLabel::Kind::None, 0, withRef, 5),
        paragraph(ParagraphLabel::Kind::Chorus, 1, chorusAgain, 6),
    }));

    book::BookMetadata meta;
    meta.title = "Book";
    meta.chorusLabel = "Ch";
    book::DocumentAssembler assembler(meta);

    book::ParsedSong first;
    first.song.title = "Clean";
    assembler.addSong(first);

    book::ParsedSong parsed;
    parsed.song = song;
    parsed.diagnostics.push_back(book::Diagnostic::syntax({9, 2}, "'`'", "unterminated chord"));
    assembler.addSong(parsed);
    assembler.addDiagnostic(book::Diagnostic::syntax({1, 1}, "song title", "text before the first song title"));

    const book::BuildResult r = assembler.finish();
    expect(!r.ok(), "build with problems is not ok");
    expectEq(r.book.songs.size(), 2, "songs kept");
    expectStrEq(r.book.meta.title, "Book", "metadata kept");

    // syntax + ref before declaration + unknown chorus 3 + duplicate chorus 1 + book-level
    expectEq(r.diagnostics.size(), 5, "diagnostic count");
    int unknown = 0;
    int duplicate = 0;
    for (const auto& d : r.diagnostics) {
        if (d.kind == DiagnosticKind::UnknownChorusReference) {
            ++unknown;
            expectEq(d.songIndex, 1, "unknown ref song index");
            expectStrEq(d.songTitle, "Refs", "unknown ref song title");
        }
        if (d.kind == DiagnosticKind::DuplicateChorusLabel) {
            ++duplicate;
            expectEq(d.chorusNumber, 1, "duplicate chorus number");
            expectEq(d.location.line, 6, "duplicate chorus line");
        }
    }
    expectEq(unknown, 2, "unknown references");
    expectEq(duplicate, 1, "duplicate labels");

    if (r.book.songs.size() != 2) return;
    const book::Song& out = r.book.songs[1];
    expectEq(int(out.blocks[0].paragraphs[0].inlines.size()), 0, "reference before the chorus removed");

    const Inlines& kept = out.blocks[1].paragraphs[1].inlines;
    expectEq(int(kept.size()), 2, "unknown ref and trailing break removed");
    if (kept.size() == 2) {
        expect(kept[1].kind == Inline::Kind::ChorusRef && kept[1].chorusNumber == 1, "known ref kept");
    }
    expect(out.blocks[1].paragraphs[2].label.kind == ParagraphLabel::Kind::None, "duplicate loses its label");
    expectStrEq(book::plainText(out.blocks[1].paragraphs[2].inlines), "chorus again", "duplicate keeps its text");

    const book::BuildResult again = assembler.finish();
    expectEq(again.book.songs.size(), 0, "finish resets the assembler");
}

static void testAssemblerRepairs() {
    // `G` with only an unknown reference as its lyrics
    Inline chord = Inline::makeChord("G", 1);
    chord.inlines.push_back(Inline::makeText(" "));
    chord.inlines.push_back(Inline::makeChorusRef(2, true, 4, 7));
    chord.inlines.push_back(Inline::makeText(" "));

    Inlines line;
    line.push_back(chord);
    line.push_back(Inline::makeText("la"));

    book::ParsedSong parsed;
    parsed.source = "songs/b.md";
    parsed.song.title = "Repairs";
    parsed.song.blocks.push_back(verse({
        paragraph(ParagraphLabel::Kind::Chorus, 1, {}, 2),
        paragraph(ParagraphLabel::Kind::None, 0, line, 4),
        paragraph(ParagraphLabel::Kind::Chorus, 1, {}, 5),
    }));

    book::BookMetadata meta;
    book::DocumentAssembler assembler(meta);
    assembler.addSong(parsed);
    const book::BuildResult r = assembler.finish();

    expectEq(r.diagnostics.size(), 2, "unknown ref and duplicate label reported");
    for (const auto& d : r.diagnostics) {
        expectStrEq(d.source, "songs/b.md", "whole-song diagnostics name their source");
        if (d.kind == DiagnosticKind::UnknownChorusReference) {
            expectEq(d.location.line, 4, "unknown ref line");
            expectEq(d.location.column, 7, "unknown ref column");
        }
    }
    if (!r.diagnostics.isEmpty()) {
        expect(r.diagnostics[0].toString().startsWith("songs/b.md: "), "source leads the diagnostic text");
    }

    if (r.book.songs.size() != 1 || r.book.songs[0].blocks.isEmpty()) {
        expect(false, "repaired song kept");
        return;
    }
    const Inlines& out = r.book.songs[0].blocks[0].paragraphs[1].inlines;
    expect(!out.empty() && out[0].kind == Inline::Kind::Chord, "chord kept");
    if (out.empty()) return;
    expect(out[0].baseline, "chord with whitespace left becomes baseline");
    expectEq(int(out[0].inlines.size()), 0, "baseline chord holds no lyrics");
    expectStrEq(book::plainText(out), "  la", "whitespace moves after the chord");
}

static void testJson() {
    book::Book b;
    b.meta.title = "Book";
    b.meta.chorusLabel = "Ch";
    b.meta.notation = "english";

    book::Song s;
    s.title = "Song";
    s.subtitles = QStringList{"Sub"};

    Inline chord = Inline::makeChord("C7", 2);
    chord.inlines.push_back(Inline::makeText("la"));
    Inline alt = Inline::makeChord("F", 1);
    alt.hasAltChord = true;
    alt.altChord = "4";
    alt.baseline = true;

    Inlines in;
    in.push_back(chord);
    in.push_back(alt);
    in.push_back(Inline::makeImage("a.png", 10, 0, QString()));
    in.push_back(Inline::makeChorusRef(1, true, 2));
    s.blocks.push_back(verse({paragraph(ParagraphLabel::Kind::Verse, 1, in, 2)}));

    Block bullets;
    bullets.kind = Block::Kind::BulletList;
    bullets.items = QStringList{"a", "b"};
    s.blocks.push_back(bullets);

    Block pre;
    pre.kind = Block::Kind::Pre;
    pre.preText = "raw\n  text";
    s.blocks.push_back(pre);
    b.songs.push_back(s);

    book::Diagnostics diags;
    diags.push_back(book::Diagnostic::unknownChorusReference({4, 0}, 2));

    const QJsonObject doc = book::documentToJson(b, diags);
    expectStrEq(doc.value("ast_version").toString(), "1.2.0", "ast version");
    expectStrEq(doc.value("book").toObject().value("chorus_label").toString(), "Ch", "book chorus label");
    expect(doc.value("book").toObject().value("subtitle").isNull(), "absent subtitle is null");

    const QJsonArray songs = doc.value("songs").toArray();
    expectEq(songs.size(), 1, "json songs");
    if (songs.isEmpty()) return;
    const QJsonObject song = songs[0].toObject();
    expectStrEq(song.value("title").toString(), "Song", "json song title");

    const QJsonArray blocks = song.value("blocks").toArray();
    expectEq(blocks.size(), 3, "json blocks");
    if (blocks.size() != 3) return;
    expectStrEq(blocks[0].toObject().value("type").toString(), "b-verse", "verse tag");
    expectStrEq(blocks[1].toObject().value("type").toString(), "b-bullet-list", "bullet tag");
    expectStrEq(blocks[2].toObject().value("type").toString(), "b-pre", "pre tag");
    expectStrEq(blocks[2].toObject().value("text").toString(), "raw\n  text", "pre text");

    const QJsonObject p = blocks[0].toObject().value("paragraphs").toArray()[0].toObject();
    expectEq(p.value("label").toObject().value("verse").toInt(), 1, "verse label json");

    const QJsonArray inlines = p.value("inlines").toArray();
    expectEq(inlines.size(), 4, "json inlines");
    if (inlines.size() != 4) return;
    const QJsonObject c0 = inlines[0].toObject();
    expectStrEq(c0.value("type").toString(), "i-chord", "chord tag");
    expectStrEq(c0.value("primary").toString(), "C7", "chord primary");
    expect(c0.value("alt_chord").isNull(), "no alt chord is null");
    expectEq(c0.value("style").toInt(), 2, "chord style");
    expect(!c0.value("baseline").toBool(), "chord baseline");
    expectEq(c0.value("inlines").toArray().size(), 1, "chord lyrics");

    const QJsonObject c1 = inlines[1].toObject();
    expectStrEq(c1.value("alt_chord").toString(), "4", "alt chord");
    expect(c1.value("baseline").toBool(), "baseline chord");

    const QJsonObject img = inlines[2].toObject();
    expectStrEq(img.value("type").toString(), "i-image", "image tag");
    expectEq(img.value("width").toInt(), 10, "image width");
    expect(img.value("class").isNull(), "image class null");

    const QJsonObject ref = inlines[3].toObject();
    expectStrEq(ref.value("type").toString(), "i-chorus-ref", "chorus ref tag");
    expectEq(ref.value("num").toInt(), 1, "chorus ref num");
    expect(ref.value("prespace").toBool(), "chorus ref prespace");

    const QJsonArray d = doc.value("diagnostics").toArray();
    expectEq(d.size(), 1, "json diagnostics");
    if (!d.isEmpty()) {
        expectStrEq(d[0].toObject().value("kind").toString(), "UnknownChorusReference", "diagnostic kind json");
        expectEq(d[0].toObject().value("chorus").toInt(), 2, "diagnostic chorus json");
    }

    const QString compact = book::documentToJsonString(b, diags, true);
    expect(!compact.contains('\n'), "compact output");
    const QJsonDocument reparsed = QJsonDocument::fromJson(compact.toUtf8());
    expect(reparsed.isObject(), "string output is valid JSON");

    expectStrEq(book::inlineKindName(Inline::Kind::Tag), "i-tag", "tag name");
    expectStrEq(book::blockKindName(Block::Kind::HtmlBlock), "b-html-block", "html block name");
    expectStrEq(book::blockKindName(Block::Kind::HorizontalLine), "b-horizontal-line", "rule name");
}

static void testVersions() {
    expectStrEq(book::currentAstVersion().toString(), "1.2.0", "current AST version");
    expectEq(book::astVersionLog().size(), 3, "version log entries");
    expectEq(book::astChangesSince(QVersionNumber(1, 0, 0)).size(), 2, "changes since 1.0");
    expectEq(book::astChangesSince(QVersionNumber(1, 2, 0)).size(), 0, "changes since current");

    expect(book::checkTemplateVersion("same", QVersionNumber(1, 2, 0)) == book::TemplateCompat::Current, "same version");
    expect(book::checkTemplateVersion("newer", QVersionNumber(1, 3, 0)) == book::TemplateCompat::TemplateNewer, "newer template");
    expect(book::checkTemplateVersion("minor", QVersionNumber(1, 1, 0)) == book::TemplateCompat::TemplateOlderCompatible, "older minor");
    expect(book::checkTemplateVersion("major", QVersionNumber(0, 9, 0)) == book::TemplateCompat::TemplateOlderIncompatible, "older major");
}

static void testSettings() {
    const book::BookSettings defaults;
    expectStrEq(defaults.chorusLabel, "Ch", "default chorus label");
    expect(defaults.notation == music::Notation::English, "default notation");
    expectEq(defaults.keyPc, 0, "default key");

    QJsonObject o;
    o.insert("title", "My Book");
    o.insert("front_img", "cover.jpg");
    o.insert("notation", "German");
    o.insert("key", "Bb");
    o.insert("chorus_label", "Ref");
    QStringList warnings;
    const book::BookSettings s = book::BookSettings::fromJson(o, &warnings);
    expect(warnings.isEmpty(), "valid settings give no warnings");
    expectStrEq(s.title, "My Book", "settings title");
    expectStrEq(s.frontImage, "cover.jpg", "settings front image");
    expect(s.notation == music::Notation::German, "settings notation");
    expectEq(s.keyPc, 10, "settings key");
    expectStrEq(s.metadata().chorusLabel, "Ref", "metadata chorus label");
    expectStrEq(s.metadata().notation, "german", "metadata notation name");

    const QJsonObject back = s.toJson();
    expectStrEq(back.value("key").toString(), "Bb", "settings key json");
    expectStrEq(back.value("notation").toString(), "german", "settings notation json");

    QJsonObject bad;
    bad.insert("notation", "klingon");
    bad.insert("key", "X#");
    warnings.clear();
    const book::BookSettings fallback = book::BookSettings::fromJson(bad, &warnings);
    expectEq(warnings.size(), 2, "invalid settings warn");
    expect(fallback.notation == music::Notation::English, "bad notation falls back");
    expectEq(fallback.keyPc, 0, "bad key falls back");
}

static void testDiagnostics() {
    book::Diagnostic d = book::Diagnostic::syntax({12, 4}, "'`'", "unterminated chord");
    d.source = "songs.md";
    d.songIndex = 1;
    d.songTitle = "Second";
    const QString text = d.toString();
    expect(text.startsWith("songs.md: song 2 'Second' line 12:4: SyntaxError"), "diagnostic text: " + text);
    expect(text.contains("expected '`'"), "diagnostic text names the expectation");

    const QJsonObject o = d.toJson();
    expectEq(o.value("line").toInt(), 12, "diagnostic json line");
    expectEq(o.value("column").toInt(), 4, "diagnostic json column");
    expectStrEq(o.value("source").toString(), "songs.md", "diagnostic json source");

    const book::Diagnostic n = book::Diagnostic::unsupportedNotation({3, 1}, "klingon");
    expectStrEq(n.notation, "klingon", "notation detail");
    expectStrEq(book::diagnosticKindName(n.kind), "UnsupportedNotation", "kind name");
    expectStrEq(book::diagnosticKindName(DiagnosticKind::NestedChordError), "NestedChordError", "nested kind name");
}

static void testModelHelpers() {
    Inlines in;
    Inline chord = Inline::makeChord("G", 1);
    chord.inlines.push_back(Inline::makeText("Hel"));
    in.push_back(chord);
    in.push_back(Inline::makeSpan(Inline::Kind::Strong, {Inline::makeText("lo")}));
    in.push_back(Inline::makeBreak());
    in.push_back(Inline::makeLink("http://x", QString(), "link"));
    expectStrEq(book::plainText(in), "Hello\nlink", "plainText");
    expect(book::containsChord(in), "containsChord top level");

    Inlines nested;
    nested.push_back(Inline::makeSpan(Inline::Kind::Emph, in));
    expect(book::containsChord(nested), "containsChord nested");
    expect(!book::containsChord({Inline::makeText("x")}), "containsChord none");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testAssembler();
    testAssemblerRepairs();
    testJson();
    testVersions();
    testSettings();
    testDiagnostics();
    testModelHelpers();

    if (g_failures == 0) {
        qInfo("BookTests: PASS");
        return 0;
    }

    qWarning("BookTests: FAIL (%d failures)", g_failures);
    return 1;
}
