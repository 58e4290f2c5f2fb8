#include "book/BookSettings.h"

#include "music/Pitch.h"

namespace book {

BookMetadata BookSettings::metadata() const {
    BookMetadata m;
    m.title = title;
    m.subtitle = subtitle;
    m.frontImage = frontImage;
    m.titleNote = titleNote;
    m.chorusLabel = chorusLabel;
    m.notation = music::notationName(notation);
    return m;
}

QJsonObject BookSettings::toJson() const {
    QJsonObject o;
    o.insert("title", title);
    if (!subtitle.isEmpty()) o.insert("subtitle", subtitle);
    if (!frontImage.isEmpty()) o.insert("front_img", frontImage);
    if (!titleNote.isEmpty()) o.insert("title_note", titleNote);
    o.insert("chorus_label", chorusLabel);
    o.insert("notation", music::notationName(notation));
    o.insert("key", music::spellPitchClass(keyPc, /*preferFlats*/true));
    return o;
}

BookSettings BookSettings::fromJson(const QJsonObject& o, QStringList* warnings) {
    BookSettings s;
    s.title = o.value("title").toString(s.title);
    s.subtitle = o.value("subtitle").toString(s.subtitle);
    s.frontImage = o.value("front_img").toString(s.frontImage);
    s.titleNote = o.value("title_note").toString(s.titleNote);
    s.chorusLabel = o.value("chorus_label").toString(s.chorusLabel);

    if (o.contains("notation")) {
        const QString name = o.value("notation").toString();
        music::Notation n = s.notation;
        if (music::notationFromName(name, n)) {
            s.notation = n;
        } else if (warnings) {
            warnings->push_back(QString("unknown notation '%1', using %2").arg(name, music::notationName(s.notation)));
        }
    }

    if (o.contains("key")) {
        const QString key = o.value("key").toString();
        int pc = 0;
        if (music::parsePitchClass(key, pc)) {
            s.keyPc = pc;
        } else if (warnings) {
            warnings->push_back(QString("invalid key '%1', using C").arg(key));
        }
    }
    return s;
}

} // namespace book
