#pragma once

#include "common/protocol.hpp"
#include "transport_client.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTimer>
#include <QtNetwork/QAbstractSocket>
#include <QtNetwork/QTcpSocket>

#include <deque>
#include <future>
#include <memory>

namespace vms::transport {

constexpr int kReconnectInitialMs = 1000;
constexpr int kReconnectMaxMs = 30000;

// Persistent vMix TCP API session. Lives on its own thread; every member is touched only
// from that thread, callers reach it through queued invocations.
class TcpSession : public QObject {
    Q_OBJECT

public:
    struct Reply {
        bool ok = false;
        QString data;
        QByteArray body;
        TransportError error;
    };
    using ReplyPromise = std::shared_ptr<std::promise<Reply>>;

    TcpSession(QString host, quint16 port, PushHandlers handlers, QObject *parent = nullptr);
    ~TcpSession() override;

    void start(ReplyPromise handshake);
    void stop();
    // replyCommand names the response line that completes the request (XML, FUNCTION).
    void request(const QByteArray &line, const QString &replyCommand, ReplyPromise reply);

private slots:
    void onConnected();
    void onDisconnected();
    void onErrorOccurred(QAbstractSocket::SocketError error);
    void onReadyRead();
    void attemptReconnect();

private:
    void handleMessage(const protocol::Message &message);
    void handleVersion(const protocol::Message &message);
    void handleXml(const protocol::Message &message);
    void handleActivator(const protocol::Message &message);
    void completeNext(const QString &command, const Reply &reply);
    void requestRefresh();
    void sendLine(const QByteArray &line);
    void linkLost(const QString &reason);
    void failPending(TransportError::Kind kind, const QString &message);

    QString host_;
    quint16 port_ = 0;
    PushHandlers handlers_;
    QTcpSocket socket_;
    QTimer reconnectTimer_;
    protocol::ProtocolParser parser_;
    // A null promise marks a request the session issued itself.
    QHash<QString, std::deque<ReplyPromise>> pending_;
    ReplyPromise handshake_;
    int reconnectDelayMs_ = kReconnectInitialMs;
    bool shouldReconnect_ = false;
    bool linkUp_ = false;
    bool refreshInFlight_ = false;
    bool refreshQueued_ = false;
};

}  // namespace vms::transport
