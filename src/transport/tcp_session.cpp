#include "tcp_session.hpp"

#include "common/logger.hpp"
#include "common/vmix_xml.hpp"

#include <algorithm>

namespace vms::transport {

using namespace vms::protocol;

namespace {

const QString kCategory = QStringLiteral("tcp");

}  // namespace

TcpSession::TcpSession(QString host, quint16 port, PushHandlers handlers, QObject *parent)
    : QObject(parent),
      host_(std::move(host)),
      port_(port),
      handlers_(std::move(handlers)),
      socket_(this),
      reconnectTimer_(this) {
    connect(&socket_, &QTcpSocket::connected, this, &TcpSession::onConnected);
    connect(&socket_, &QTcpSocket::disconnected, this, &TcpSession::onDisconnected);
    connect(&socket_, &QTcpSocket::readyRead, this, &TcpSession::onReadyRead);
    connect(&socket_, &QTcpSocket::errorOccurred, this, &TcpSession::onErrorOccurred);

    reconnectTimer_.setSingleShot(true);
    connect(&reconnectTimer_, &QTimer::timeout, this, &TcpSession::attemptReconnect);
}

TcpSession::~TcpSession() {
    stop();
}

void TcpSession::start(ReplyPromise handshake) {
    handshake_ = std::move(handshake);
    shouldReconnect_ = true;
    reconnectDelayMs_ = kReconnectInitialMs;
    common::log_info(kCategory, QStringLiteral("Connecting to %1:%2").arg(host_).arg(port_));
    socket_.connectToHost(host_, port_);
}

void TcpSession::stop() {
    shouldReconnect_ = false;
    reconnectTimer_.stop();
    failPending(TransportError::Kind::Cancelled, QStringLiteral("Session to %1 closed").arg(host_));

    disconnect(&socket_, nullptr, this, nullptr);
    if (socket_.state() == QAbstractSocket::ConnectedState) {
        socket_.disconnectFromHost();
        if (socket_.state() != QAbstractSocket::UnconnectedState) {
            socket_.waitForDisconnected(1000);
        }
    }
    if (socket_.state() != QAbstractSocket::UnconnectedState) {
        socket_.abort();
    }
    linkUp_ = false;
}

void TcpSession::request(const QByteArray &line, const QString &replyCommand, ReplyPromise reply) {
    if (!linkUp_) {
        Reply failed;
        failed.error.kind = TransportError::Kind::Network;
        failed.error.message = QStringLiteral("TCP session to %1 is not connected").arg(host_);
        reply->set_value(failed);
        return;
    }
    pending_[replyCommand].push_back(std::move(reply));
    sendLine(line);
}

void TcpSession::onConnected() {
    parser_.clear();
    common::log_debug(kCategory, QStringLiteral("Socket to %1 open, requesting version").arg(host_));
    sendLine(build_command(QString::fromLatin1(kCommandVersion)));
}

void TcpSession::onDisconnected() {
    linkLost(QStringLiteral("Connection to %1 closed by peer").arg(host_));
}

void TcpSession::onErrorOccurred(QAbstractSocket::SocketError) {
    linkLost(socket_.errorString());
}

void TcpSession::onReadyRead() {
    parser_.append(socket_.readAll());
    while (true) {
        FrameError error = FrameError::None;
        QString reason;
        const auto message = parser_.nextMessage(&error, &reason);
        if (!message.has_value()) {
            if (error != FrameError::None) {
                common::log_warn(kCategory, QStringLiteral("Malformed data from %1: %2").arg(host_, reason));
            }
            break;
        }
        handleMessage(*message);
    }
}

void TcpSession::attemptReconnect() {
    if (!shouldReconnect_) {
        return;
    }
    common::log_info(kCategory, QStringLiteral("Reconnecting to %1:%2").arg(host_).arg(port_));
    socket_.abort();
    socket_.connectToHost(host_, port_);
}

void TcpSession::handleMessage(const Message &message) {
    if (message.command == QLatin1String(kCommandXml)) {
        handleXml(message);
    } else if (message.command == QLatin1String(kCommandFunction)) {
        Reply reply;
        reply.ok = message.isOk();
        reply.data = message.data;
        if (!reply.ok) {
            reply.error.kind = TransportError::Kind::Protocol;
            reply.error.message = message.data.isEmpty() ? QStringLiteral("Function rejected") : message.data;
        }
        completeNext(QString::fromLatin1(kCommandFunction), reply);
    } else if (message.command == QLatin1String(kCommandVersion)) {
        handleVersion(message);
    } else if (message.command == QLatin1String(kCommandActs)) {
        handleActivator(message);
    } else if (message.command == QLatin1String(kCommandSubscribe)) {
        common::log_debug(kCategory, QStringLiteral("%1 subscription: %2").arg(host_, message.data));
    } else {
        common::log_debug(kCategory, QStringLiteral("Ignoring %1 from %2").arg(message.command, host_));
    }
}

void TcpSession::handleVersion(const Message &message) {
    if (!message.isOk()) {
        const QString reason = QStringLiteral("Unsupported protocol version reply: %1").arg(message.data);
        if (handshake_) {
            Reply failed;
            failed.error.kind = TransportError::Kind::Protocol;
            failed.error.message = reason;
            handshake_->set_value(failed);
            handshake_.reset();
        }
        shouldReconnect_ = false;
        common::log_error(kCategory, QStringLiteral("%1 from %2").arg(reason, host_));
        socket_.abort();
        return;
    }

    linkUp_ = true;
    reconnectDelayMs_ = kReconnectInitialMs;
    sendLine(build_command(QString::fromLatin1(kCommandSubscribe), QString::fromLatin1(kCommandActs)));

    if (handshake_) {
        Reply reply;
        reply.ok = true;
        reply.data = message.data;
        handshake_->set_value(reply);
        handshake_.reset();
        return;
    }

    common::log_info(kCategory, QStringLiteral("Session to %1 re-established (%2)").arg(host_, message.data));
    if (handlers_.onLink) {
        handlers_.onLink(model::ConnectionStatus::Connected, QString());
    }
    requestRefresh();
}

void TcpSession::handleXml(const Message &message) {
    const bool refused = message.status == ReplyStatus::Error;
    const QString refusal = message.data.isEmpty() ? QStringLiteral("State request refused") : message.data;

    auto &queue = pending_[QString::fromLatin1(kCommandXml)];
    if (!queue.empty()) {
        ReplyPromise waiting = std::move(queue.front());
        queue.pop_front();
        if (waiting) {
            Reply reply;
            reply.ok = !refused;
            if (refused) {
                reply.error.kind = TransportError::Kind::Protocol;
                reply.error.message = refusal;
            } else {
                reply.body = message.body;
            }
            waiting->set_value(reply);
            return;
        }
        refreshInFlight_ = false;
    }

    if (refused) {
        common::log_warn(kCategory, QStringLiteral("%1 refused a state request: %2").arg(host_, refusal));
    } else {
        QString reason;
        auto state = parse_state(message.body, &reason);
        if (!state) {
            common::log_warn(kCategory, QStringLiteral("Discarding malformed state from %1: %2").arg(host_, reason));
        } else if (handlers_.onState) {
            handlers_.onState(std::move(*state));
        }
    }

    if (refreshQueued_) {
        requestRefresh();
    }
}

void TcpSession::handleActivator(const Message &message) {
    const auto activator = parse_activator(message.data);
    if (!activator) {
        return;
    }
    // Only program/preview changes alter the state this application tracks.
    if (activator->name == QLatin1String("Input") || activator->name == QLatin1String("InputPreview")) {
        common::log_debug(kCategory, QStringLiteral("%1 %2 on %3").arg(activator->name, activator->args.join(QLatin1Char(' ')), host_));
        requestRefresh();
    }
}

void TcpSession::completeNext(const QString &command, const Reply &reply) {
    auto &queue = pending_[command];
    if (queue.empty()) {
        common::log_debug(kCategory, QStringLiteral("Unmatched %1 reply from %2").arg(command, host_));
        return;
    }
    ReplyPromise waiting = std::move(queue.front());
    queue.pop_front();
    if (waiting) {
        waiting->set_value(reply);
    }
}

void TcpSession::requestRefresh() {
    if (!linkUp_) {
        return;
    }
    if (refreshInFlight_) {
        refreshQueued_ = true;
        return;
    }
    refreshInFlight_ = true;
    refreshQueued_ = false;
    pending_[QString::fromLatin1(kCommandXml)].push_back(nullptr);
    sendLine(build_command(QString::fromLatin1(kCommandXml)));
}

void TcpSession::sendLine(const QByteArray &line) {
    if (socket_.write(line) < 0) {
        common::log_warn(kCategory, QStringLiteral("Write to %1 failed: %2").arg(host_, socket_.errorString()));
    }
}

void TcpSession::linkLost(const QString &reason) {
    if (handshake_) {
        Reply failed;
        failed.error.kind = TransportError::Kind::Network;
        failed.error.message = reason;
        handshake_->set_value(failed);
        handshake_.reset();
        shouldReconnect_ = false;
        return;
    }
    if (!shouldReconnect_) {
        return;
    }

    if (linkUp_) {
        linkUp_ = false;
        failPending(TransportError::Kind::Network, reason);
        common::log_warn(kCategory, QStringLiteral("Lost session to %1: %2").arg(host_, reason));
        if (handlers_.onLink) {
            handlers_.onLink(model::ConnectionStatus::Reconnecting, reason);
        }
    }

    if (!reconnectTimer_.isActive()) {
        common::log_info(kCategory, QStringLiteral("Retrying %1 in %2 ms").arg(host_).arg(reconnectDelayMs_));
        reconnectTimer_.start(reconnectDelayMs_);
        reconnectDelayMs_ = std::min(reconnectDelayMs_ * 2, kReconnectMaxMs);
    }
}

void TcpSession::failPending(TransportError::Kind kind, const QString &message) {
    Reply failed;
    failed.error.kind = kind;
    failed.error.message = message;
    for (auto &queue : pending_) {
        for (auto &waiting : queue) {
            if (waiting) {
                waiting->set_value(failed);
            }
        }
        queue.clear();
    }
    refreshInFlight_ = false;
    refreshQueued_ = false;
    if (handshake_) {
        handshake_->set_value(failed);
        handshake_.reset();
    }
}

}  // namespace vms::transport
