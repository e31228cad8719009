#pragma once

#include <QtCore/QHash>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace vms::model {

constexpr quint16 kDefaultHttpPort = 8088;
constexpr quint16 kDefaultTcpPort = 8099;
constexpr quint32 kDefaultRefreshSeconds = 3;

enum class TransportKind {
    Http,
    Tcp,
};

enum class ConnectionStatus {
    Connecting,
    Connected,
    Reconnecting,
    Disconnected,
};

QString to_string(TransportKind kind);
QString to_string(ConnectionStatus status);
std::optional<TransportKind> parse_transport_kind(const QString &text);
quint16 default_port(TransportKind kind);
QString default_label(const QString &host, TransportKind kind);

struct AutoRefreshConfig {
    bool enabled = true;
    quint32 intervalSeconds = kDefaultRefreshSeconds;
};

bool operator==(const AutoRefreshConfig &lhs, const AutoRefreshConfig &rhs);
bool operator!=(const AutoRefreshConfig &lhs, const AutoRefreshConfig &rhs);

struct Input {
    QString key;
    int number = 0;
    QString title;
    QString type;
    QString state;
};

bool operator==(const Input &lhs, const Input &rhs);
bool operator!=(const Input &lhs, const Input &rhs);

struct VideoListItem {
    QString key;
    int number = 0;
    QString title;
    QString type;
    QString state;
    bool selected = false;
    bool enabled = true;
};

bool operator==(const VideoListItem &lhs, const VideoListItem &rhs);
bool operator!=(const VideoListItem &lhs, const VideoListItem &rhs);

struct VideoListInput {
    QString key;
    int number = 0;
    QString title;
    QString type;
    QString state;
    QVector<VideoListItem> items;
    std::optional<int> selectedIndex;
};

bool operator==(const VideoListInput &lhs, const VideoListInput &rhs);
bool operator!=(const VideoListInput &lhs, const VideoListInput &rhs);

// Keeps the first selected item, clears the rest and points selectedIndex at it.
void normalize_selection(VideoListInput &list);
bool selection_consistent(const VideoListInput &list);

using InputList = QVector<Input>;
using VideoLists = QVector<VideoListInput>;

// Scalar part of a vMix state document.
struct StatusFields {
    int activeInput = 0;
    int previewInput = 0;
    QString version;
    QString edition;
    std::optional<QString> preset;
};

bool operator==(const StatusFields &lhs, const StatusFields &rhs);
bool operator!=(const StatusFields &lhs, const StatusFields &rhs);

struct Connection {
    QString host;
    quint16 port = 0;
    QString label;
    TransportKind transportKind = TransportKind::Http;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    int activeInput = 0;
    int previewInput = 0;
    QString version;
    QString edition;
    std::optional<QString> preset;
    std::optional<QString> lastError;
};

bool operator==(const Connection &lhs, const Connection &rhs);
bool operator!=(const Connection &lhs, const Connection &rhs);

// Status, inputs and video lists of one host at one sequence number.
struct Snapshot {
    QString host;
    quint64 sequence = 0;
    StatusFields status;
    InputList inputs;
    VideoLists videoLists;
};

void register_metatypes();

}  // namespace vms::model

Q_DECLARE_METATYPE(vms::model::Connection)
Q_DECLARE_METATYPE(vms::model::InputList)
Q_DECLARE_METATYPE(vms::model::VideoLists)
Q_DECLARE_METATYPE(vms::model::AutoRefreshConfig)
