#pragma once

#include <QString>
#include <QVector>

#include "book/BookSettings.h"
#include "book/DocumentAssembler.h"

namespace markup {

struct SourceText {
    QString name; // file name or other label, copied into diagnostics
    QString text;
};

// Drives a whole build: split sources into songs, parse every song, assemble the book.
// Songs share no parser state, so with parallel mode on each song is parsed by its own
// QtConcurrent task; results are always merged in input order.
class SongbookCompiler {
public:
    explicit SongbookCompiler(const book::BookSettings& settings);

    void setParallel(bool on) { m_parallel = on; }
    bool parallel() const { return m_parallel; }

    book::BuildResult compile(const QVector<SourceText>& sources) const;
    book::BuildResult compileText(const QString& text) const;

private:
    book::BookSettings m_settings;
    bool m_parallel = true;
};

} // namespace markup
