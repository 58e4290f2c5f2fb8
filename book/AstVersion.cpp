#include "book/AstVersion.h"

#include <QDebug>

namespace book {

QString AstVersion::toString() const {
    return QString("%1: %2.").arg(version.toString(), description);
}

const QVector<AstVersion>& astVersionLog() {
    static const QVector<AstVersion> kLog = {
        {QVersionNumber(1, 0, 0), "Initial version"},
        {QVersionNumber(1, 1, 0), "Added HTML blocks and tags, and baseline chords"},
        {QVersionNumber(1, 2, 0), "Images carry width and height in i-image elements"},
    };
    return kLog;
}

QVersionNumber currentAstVersion() {
    return astVersionLog().last().version;
}

QStringList astChangesSince(const QVersionNumber& since) {
    QStringList out;
    for (const auto& v : astVersionLog()) {
        if (v.version > since) out.push_back(v.toString());
    }
    return out;
}

TemplateCompat checkTemplateVersion(const QString& templateName, const QVersionNumber& templateVersion) {
    const QVersionNumber current = currentAstVersion();

    if (current < templateVersion) {
        qWarning().noquote() << QString("Template %1 has AST version %2, newer than the supported %3. Rendering may fail.")
            .arg(templateName, templateVersion.toString(), current.toString());
        return TemplateCompat::TemplateNewer;
    }

    if (current.majorVersion() > templateVersion.majorVersion()) {
        qWarning().noquote() << QString("Template %1 has AST version %2, from an older generation than %3. It may need to be converted.")
            .arg(templateName, templateVersion.toString(), current.toString());
        for (const auto& line : astChangesSince(templateVersion)) qWarning().noquote() << "  " << line;
        return TemplateCompat::TemplateOlderIncompatible;
    }

    if (current > templateVersion) {
        qInfo().noquote() << QString("Template %1 has AST version %2; %3 is supported and may offer improvements.")
            .arg(templateName, templateVersion.toString(), current.toString());
        for (const auto& line : astChangesSince(templateVersion)) qInfo().noquote() << "  " << line;
        return TemplateCompat::TemplateOlderCompatible;
    }

    return TemplateCompat::Current;
}

} // namespace book
