#include "model.hpp"

namespace vms::model {

QString to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Http:
            return QStringLiteral("Http");
        case TransportKind::Tcp:
            return QStringLiteral("Tcp");
    }
    return QStringLiteral("Http");
}

QString to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connecting:
            return QStringLiteral("Connecting");
        case ConnectionStatus::Connected:
            return QStringLiteral("Connected");
        case ConnectionStatus::Reconnecting:
            return QStringLiteral("Reconnecting");
        case ConnectionStatus::Disconnected:
            return QStringLiteral("Disconnected");
    }
    return QStringLiteral("Disconnected");
}

std::optional<TransportKind> parse_transport_kind(const QString &text) {
    const QString lowered = text.trimmed().toLower();
    if (lowered == QLatin1String("http")) {
        return TransportKind::Http;
    }
    if (lowered == QLatin1String("tcp")) {
        return TransportKind::Tcp;
    }
    return std::nullopt;
}

quint16 default_port(TransportKind kind) {
    return kind == TransportKind::Tcp ? kDefaultTcpPort : kDefaultHttpPort;
}

QString default_label(const QString &host, TransportKind kind) {
    return QStringLiteral("%1 (%2)").arg(host, kind == TransportKind::Tcp ? QStringLiteral("TCP") : QStringLiteral("HTTP"));
}

bool operator==(const AutoRefreshConfig &lhs, const AutoRefreshConfig &rhs) {
    return lhs.enabled == rhs.enabled && lhs.intervalSeconds == rhs.intervalSeconds;
}

bool operator!=(const AutoRefreshConfig &lhs, const AutoRefreshConfig &rhs) {
    return !(lhs == rhs);
}

bool operator==(const Input &lhs, const Input &rhs) {
    return lhs.key == rhs.key && lhs.number == rhs.number && lhs.title == rhs.title && lhs.type == rhs.type &&
           lhs.state == rhs.state;
}

bool operator!=(const Input &lhs, const Input &rhs) {
    return !(lhs == rhs);
}

bool operator==(const VideoListItem &lhs, const VideoListItem &rhs) {
    return lhs.key == rhs.key && lhs.number == rhs.number && lhs.title == rhs.title && lhs.type == rhs.type &&
           lhs.state == rhs.state && lhs.selected == rhs.selected && lhs.enabled == rhs.enabled;
}

bool operator!=(const VideoListItem &lhs, const VideoListItem &rhs) {
    return !(lhs == rhs);
}

bool operator==(const VideoListInput &lhs, const VideoListInput &rhs) {
    return lhs.key == rhs.key && lhs.number == rhs.number && lhs.title == rhs.title && lhs.type == rhs.type &&
           lhs.state == rhs.state && lhs.items == rhs.items && lhs.selectedIndex == rhs.selectedIndex;
}

bool operator!=(const VideoListInput &lhs, const VideoListInput &rhs) {
    return !(lhs == rhs);
}

void normalize_selection(VideoListInput &list) {
    list.selectedIndex.reset();
    for (int i = 0; i < list.items.size(); ++i) {
        auto &item = list.items[i];
        if (!item.selected) {
            continue;
        }
        if (list.selectedIndex) {
            item.selected = false;
        } else {
            list.selectedIndex = i;
        }
    }
}

bool selection_consistent(const VideoListInput &list) {
    int selectedCount = 0;
    int selectedAt = -1;
    for (int i = 0; i < list.items.size(); ++i) {
        if (list.items.at(i).selected) {
            ++selectedCount;
            selectedAt = i;
        }
    }
    if (selectedCount > 1) {
        return false;
    }
    if (list.selectedIndex) {
        return selectedCount == 1 && *list.selectedIndex == selectedAt;
    }
    return true;
}

bool operator==(const StatusFields &lhs, const StatusFields &rhs) {
    return lhs.activeInput == rhs.activeInput && lhs.previewInput == rhs.previewInput && lhs.version == rhs.version &&
           lhs.edition == rhs.edition && lhs.preset == rhs.preset;
}

bool operator!=(const StatusFields &lhs, const StatusFields &rhs) {
    return !(lhs == rhs);
}

bool operator==(const Connection &lhs, const Connection &rhs) {
    return lhs.host == rhs.host && lhs.port == rhs.port && lhs.label == rhs.label &&
           lhs.transportKind == rhs.transportKind && lhs.status == rhs.status && lhs.activeInput == rhs.activeInput &&
           lhs.previewInput == rhs.previewInput && lhs.version == rhs.version && lhs.edition == rhs.edition &&
           lhs.preset == rhs.preset && lhs.lastError == rhs.lastError;
}

bool operator!=(const Connection &lhs, const Connection &rhs) {
    return !(lhs == rhs);
}

void register_metatypes() {
    qRegisterMetaType<Connection>("vms::model::Connection");
    qRegisterMetaType<InputList>("vms::model::InputList");
    qRegisterMetaType<VideoLists>("vms::model::VideoLists");
    qRegisterMetaType<AutoRefreshConfig>("vms::model::AutoRefreshConfig");
}

}  // namespace vms::model
