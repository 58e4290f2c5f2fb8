#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "book/BookModel.h"
#include "music/Notation.h"

namespace book {

// Book-level configuration, owned by whoever loads the project file; read-only to the parser.
struct BookSettings {
    QString title;
    QString subtitle;
    QString frontImage;
    QString titleNote;
    QString chorusLabel = "Ch";

    // Notation the song sources are written in, and the tonic used when that notation is relative.
    music::Notation notation = music::Notation::English;
    int keyPc = 0;

    BookMetadata metadata() const;

    QJsonObject toJson() const;
    // Unknown notation or key names keep the defaults; a message per rejected value goes to `warnings`.
    static BookSettings fromJson(const QJsonObject& o, QStringList* warnings = nullptr);
};

} // namespace book
