#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include "book/BookModel.h"
#include "book/Diagnostic.h"

namespace book {

// JSON form of the tree consumed by renderers. Every node carries its kind in "type"
// (see inlineKindName / blockKindName); fields are emitted only where meaningful.
QJsonObject inlineToJson(const Inline& i);
QJsonArray inlinesToJson(const Inlines& inlines);
QJsonObject blockToJson(const Block& b);
QJsonObject songToJson(const Song& s);
QJsonObject bookToJson(const Book& b);

// Whole build output: {"ast_version", "book", "songs", "diagnostics"}.
QJsonObject documentToJson(const Book& b, const Diagnostics& diagnostics);
QString documentToJsonString(const Book& b, const Diagnostics& diagnostics, bool compact = false);

} // namespace book
