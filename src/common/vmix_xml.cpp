#include "vmix_xml.hpp"

#include <QtCore/QXmlStreamReader>

namespace vms::protocol {

namespace {

const QString kUnknown = QStringLiteral("Unknown");

int to_int(QStringView text) {
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    return ok ? value : 0;
}

QString attribute_or(const QXmlStreamAttributes &attributes, const QString &name, const QString &fallback) {
    if (!attributes.hasAttribute(name)) {
        return fallback;
    }
    const QString value = attributes.value(name).toString();
    return value.isEmpty() ? fallback : value;
}

struct RawItem {
    QString text;
    std::optional<QString> enabled;
    std::optional<QString> selected;
};

QVector<RawItem> read_list(QXmlStreamReader &reader) {
    QVector<RawItem> items;
    while (reader.readNextStartElement()) {
        if (reader.name() != QLatin1String("item")) {
            reader.skipCurrentElement();
            continue;
        }
        RawItem item;
        const auto attributes = reader.attributes();
        if (attributes.hasAttribute(QStringLiteral("enabled"))) {
            item.enabled = attributes.value(QStringLiteral("enabled")).toString();
        }
        if (attributes.hasAttribute(QStringLiteral("selected"))) {
            item.selected = attributes.value(QStringLiteral("selected")).toString();
        }
        item.text = reader.readElementText(QXmlStreamReader::IncludeChildElements).trimmed();
        items.append(item);
    }
    return items;
}

model::VideoListInput build_video_list(const model::Input &input, std::optional<int> inputSelectedIndex,
                                       const QVector<RawItem> &rawItems) {
    model::VideoListInput list;
    list.key = input.key;
    list.number = input.number;
    list.title = input.title;
    list.type = input.type;
    list.state = QStringLiteral("Running");
    list.items.reserve(rawItems.size());
    for (int index = 0; index < rawItems.size(); ++index) {
        const RawItem &raw = rawItems.at(index);
        model::VideoListItem item;
        item.key = QStringLiteral("%1_%2").arg(input.key).arg(index);
        item.number = 0;
        item.title = raw.text;
        item.type = QStringLiteral("VideoListItem");
        item.state = QStringLiteral("Available");

        const QString enabled = raw.enabled.value_or(QString()).trimmed().toLower();
        item.enabled = enabled.isEmpty() || enabled != QLatin1String("false");

        if (raw.selected) {
            item.selected = raw.selected->trimmed().toLower() == QLatin1String("true");
        } else {
            item.selected = inputSelectedIndex.has_value() && *inputSelectedIndex == index;
        }
        list.items.append(item);
    }
    model::normalize_selection(list);
    return list;
}

void read_input(QXmlStreamReader &reader, VmixState &state) {
    const auto attributes = reader.attributes();
    model::Input input;
    input.key = attributes.value(QStringLiteral("key")).toString();
    input.number = to_int(attributes.value(QStringLiteral("number")));
    input.title = attributes.value(QStringLiteral("title")).toString();
    input.type = attribute_or(attributes, QStringLiteral("type"), kUnknown);
    input.state = attribute_or(attributes, QStringLiteral("state"), kUnknown);

    // vMix reports selectedIndex 1-based
    std::optional<int> selectedIndex;
    if (attributes.hasAttribute(QStringLiteral("selectedIndex"))) {
        bool ok = false;
        const int oneBased = attributes.value(QStringLiteral("selectedIndex")).trimmed().toInt(&ok);
        if (ok) {
            selectedIndex = oneBased > 0 ? oneBased - 1 : 0;
        }
    }

    QVector<RawItem> rawItems;
    while (reader.readNextStartElement()) {
        if (reader.name() == QLatin1String("list")) {
            rawItems += read_list(reader);
        } else {
            reader.skipCurrentElement();
        }
    }

    if (input.type.compare(QLatin1String("VideoList"), Qt::CaseInsensitive) == 0) {
        state.videoLists.append(build_video_list(input, selectedIndex, rawItems));
    }
    state.inputs.append(input);
}

void read_inputs(QXmlStreamReader &reader, VmixState &state) {
    while (reader.readNextStartElement()) {
        if (reader.name() == QLatin1String("input")) {
            read_input(reader, state);
        } else {
            reader.skipCurrentElement();
        }
    }
}

}  // namespace

std::optional<VmixState> parse_state(const QByteArray &xml, QString *error) {
    QXmlStreamReader reader(xml);
    if (!reader.readNextStartElement()) {
        if (error) {
            *error = reader.hasError() ? reader.errorString() : QStringLiteral("Empty state document");
        }
        return std::nullopt;
    }
    if (reader.name() != QLatin1String("vmix")) {
        if (error) {
            *error = QStringLiteral("Unexpected root element <%1>").arg(reader.name().toString());
        }
        return std::nullopt;
    }

    VmixState state;
    while (reader.readNextStartElement()) {
        const auto name = reader.name();
        if (name == QLatin1String("version")) {
            state.status.version = reader.readElementText().trimmed();
        } else if (name == QLatin1String("edition")) {
            state.status.edition = reader.readElementText().trimmed();
        } else if (name == QLatin1String("preset")) {
            const QString preset = reader.readElementText().trimmed();
            if (!preset.isEmpty()) {
                state.status.preset = preset;
            }
        } else if (name == QLatin1String("active")) {
            state.status.activeInput = to_int(reader.readElementText());
        } else if (name == QLatin1String("preview")) {
            state.status.previewInput = to_int(reader.readElementText());
        } else if (name == QLatin1String("inputs")) {
            read_inputs(reader, state);
        } else {
            reader.skipCurrentElement();
        }
    }

    if (reader.hasError()) {
        if (error) {
            *error = QStringLiteral("XML error at line %1: %2").arg(reader.lineNumber()).arg(reader.errorString());
        }
        return std::nullopt;
    }
    return state;
}

}  // namespace vms::protocol
