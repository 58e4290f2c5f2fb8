#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <QVersionNumber>

namespace book {

// Version of the tree format handed to renderers. Bump it whenever node kinds or fields change.
struct AstVersion {
    QVersionNumber version;
    QString description;

    QString toString() const; // "1.2.0: Description."
};

const QVector<AstVersion>& astVersionLog();
QVersionNumber currentAstVersion();

// Log entries newer than `since`, oldest first.
QStringList astChangesSince(const QVersionNumber& since);

enum class TemplateCompat {
    Current,
    TemplateNewer,              // template expects a newer tree than we produce
    TemplateOlderIncompatible,  // older major version
    TemplateOlderCompatible,    // older minor version
};

// Compares a renderer template's declared AST version with ours and logs the outcome.
TemplateCompat checkTemplateVersion(const QString& templateName, const QVersionNumber& templateVersion);

} // namespace book
