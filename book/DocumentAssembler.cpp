#include "book/DocumentAssembler.h"

#include <QSet>

#include <utility>

namespace book {
namespace {

static bool isBlankText(const Inlines& inlines) {
    for (const auto& i : inlines) {
        if (i.kind != Inline::Kind::Text || !i.text.trimmed().isEmpty()) return false;
    }
    return true;
}

static void dropUnknownChorusRefs(Inlines& inlines, const QSet<int>& declared, Diagnostics& out) {
    Inlines kept;
    kept.reserve(inlines.size());
    for (auto& i : inlines) {
        if (i.kind == Inline::Kind::ChorusRef && !declared.contains(i.chorusNumber)) {
            out.push_back(Diagnostic::unknownChorusReference(SourceLocation{i.line, i.column}, i.chorusNumber));
            continue;
        }
        const size_t before = i.inlines.size();
        dropUnknownChorusRefs(i.inlines, declared, out);

        // A chord left with only whitespace lyrics becomes a baseline chord
        if (i.kind == Inline::Kind::Chord && !i.baseline && i.inlines.size() != before && isBlankText(i.inlines)) {
            Inlines rest = std::move(i.inlines);
            i.inlines.clear();
            i.baseline = true;
            kept.push_back(std::move(i));
            for (auto& r : rest) kept.push_back(std::move(r));
            continue;
        }
        kept.push_back(std::move(i));
    }
    inlines = std::move(kept);
}

static void trimTrailingBreaks(Inlines& inlines) {
    while (!inlines.empty() && inlines.back().kind == Inline::Kind::Break) inlines.pop_back();
}

} // namespace

DocumentAssembler::DocumentAssembler(const BookMetadata& meta) {
    m_result.book.meta = meta;
}

void DocumentAssembler::addSong(ParsedSong parsed) {
    Diagnostics songDiagnostics = std::move(parsed.diagnostics);
    validateSong(parsed.song, songDiagnostics);

    const int index = m_result.book.songs.size();
    for (auto& d : songDiagnostics) {
        d.songIndex = index;
        d.songTitle = parsed.song.title;
        if (d.source.isEmpty()) d.source = parsed.source;
        m_result.diagnostics.push_back(d);
    }
    m_result.book.songs.push_back(std::move(parsed.song));
}

void DocumentAssembler::addDiagnostic(const Diagnostic& d) {
    m_result.diagnostics.push_back(d);
}

BuildResult DocumentAssembler::finish() {
    BuildResult out = std::move(m_result);
    m_result = BuildResult{};
    m_result.book.meta = out.book.meta;
    return out;
}

void DocumentAssembler::validateSong(Song& song, Diagnostics& out) {
    QSet<int> declared;
    for (auto& block : song.blocks) {
        if (block.kind == Block::Kind::Verse) {
            for (auto& p : block.paragraphs) {
                if (p.label.kind == ParagraphLabel::Kind::Chorus) {
                    if (declared.contains(p.label.number)) {
                        out.push_back(Diagnostic::duplicateChorusLabel(SourceLocation{p.line, 0}, p.label.number));
                        p.label = ParagraphLabel{};
                    } else {
                        declared.insert(p.label.number);
                    }
                }
                dropUnknownChorusRefs(p.inlines, declared, out);
                trimTrailingBreaks(p.inlines);
            }
        } else if (block.kind == Block::Kind::HtmlBlock) {
            dropUnknownChorusRefs(block.inlines, declared, out);
            trimTrailingBreaks(block.inlines);
        }
    }
}

} // namespace book
