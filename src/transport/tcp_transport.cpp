#include "tcp_transport.hpp"

#include "common/logger.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QMetaObject>
#include <QtCore/QMutexLocker>

#include <chrono>

namespace vms::transport {

namespace {

const QString kCategory = QStringLiteral("tcp");

std::optional<TcpSession::Reply> await(std::future<TcpSession::Reply> &future, int timeoutMs, const QString &what,
                                       TransportError *error) {
    if (future.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        set_error(error, TransportError::Kind::Timeout, QStringLiteral("No %1 reply within %2 ms").arg(what).arg(timeoutMs));
        return std::nullopt;
    }
    TcpSession::Reply reply = future.get();
    if (!reply.ok) {
        if (error) {
            *error = reply.error;
        }
        return std::nullopt;
    }
    return reply;
}

}  // namespace

TcpTransport::TcpTransport(QString host, quint16 port, int timeoutMs)
    : TransportClient(std::move(host), port), timeoutMs_(timeoutMs) {}

TcpTransport::~TcpTransport() {
    close();
}

void TcpTransport::setPushHandlers(PushHandlers handlers) {
    QMutexLocker locker(&mutex_);
    handlers_ = std::move(handlers);
}

bool TcpTransport::open(TransportError *error) {
    if (host().isEmpty() || port() == 0) {
        set_error(error, TransportError::Kind::Network, QStringLiteral("Malformed address %1:%2").arg(host()).arg(port()));
        return false;
    }
    close();

    PushHandlers handlers;
    {
        QMutexLocker locker(&mutex_);
        handlers = handlers_;
    }

    auto *thread = new QThread();
    thread->setObjectName(QStringLiteral("vmix-tcp-%1").arg(host()));
    auto *session = new TcpSession(host(), port(), std::move(handlers));
    session->moveToThread(thread);
    QObject::connect(thread, &QThread::finished, session, &QObject::deleteLater);
    // The thread object is reclaimed by the application thread once it has finished.
    if (auto *app = QCoreApplication::instance()) {
        thread->moveToThread(app->thread());
        QObject::connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    }
    thread->start();

    auto handshake = std::make_shared<std::promise<TcpSession::Reply>>();
    auto future = handshake->get_future();
    QMetaObject::invokeMethod(
        session, [session, handshake]() { session->start(handshake); }, Qt::QueuedConnection);

    const auto reply = await(future, timeoutMs_, QStringLiteral("VERSION"), error);
    if (!reply) {
        common::log_warn(kCategory, QStringLiteral("Handshake with %1:%2 failed").arg(host()).arg(port()));
        teardown(thread);
        return false;
    }

    {
        QMutexLocker locker(&mutex_);
        thread_ = thread;
        session_ = session;
    }
    common::log_info(kCategory, QStringLiteral("Session to %1:%2 established (vMix %3)")
                                    .arg(host())
                                    .arg(port())
                                    .arg(reply->data));
    return true;
}

bool TcpTransport::close() {
    QThread *thread = nullptr;
    {
        QMutexLocker locker(&mutex_);
        thread = thread_;
        thread_ = nullptr;
        session_ = nullptr;
    }
    if (!thread) {
        return true;
    }
    return teardown(thread);
}

bool TcpTransport::teardown(QThread *thread) {
    thread->requestInterruption();
    thread->quit();
    if (!thread->wait(kTeardownTimeoutMs)) {
        common::log_warn(kCategory, QStringLiteral("Session thread for %1 did not stop within %2 ms")
                                        .arg(host())
                                        .arg(kTeardownTimeoutMs));
        return false;
    }
    if (!QCoreApplication::instance()) {
        delete thread;
    }
    return true;
}

std::optional<TcpSession::Reply> TcpTransport::roundTrip(const QByteArray &line, const QString &replyCommand,
                                                         TransportError *error) {
    auto promise = std::make_shared<std::promise<TcpSession::Reply>>();
    auto future = promise->get_future();
    {
        // Posting under the lock keeps close() from retiring the session mid-post.
        QMutexLocker locker(&mutex_);
        if (!session_) {
            set_error(error, TransportError::Kind::Network, QStringLiteral("TCP session to %1 is not open").arg(host()));
            return std::nullopt;
        }
        TcpSession *session = session_;
        QMetaObject::invokeMethod(
            session, [session, line, replyCommand, promise]() { session->request(line, replyCommand, promise); },
            Qt::QueuedConnection);
    }
    return await(future, timeoutMs_, replyCommand, error);
}

std::optional<protocol::VmixState> TcpTransport::fetchState(TransportError *error) {
    const auto reply = roundTrip(protocol::build_command(QString::fromLatin1(protocol::kCommandXml)),
                                 QString::fromLatin1(protocol::kCommandXml), error);
    if (!reply) {
        return std::nullopt;
    }
    QString reason;
    auto state = protocol::parse_state(reply->body, &reason);
    if (!state) {
        set_error(error, TransportError::Kind::Protocol, QStringLiteral("Malformed state from %1: %2").arg(host(), reason));
        return std::nullopt;
    }
    return state;
}

bool TcpTransport::sendFunction(const QString &function, const protocol::FunctionParams &params,
                                TransportError *error) {
    if (function.trimmed().isEmpty()) {
        set_error(error, TransportError::Kind::Protocol, QStringLiteral("Function name is empty"));
        return false;
    }
    common::log_info(kCategory, QStringLiteral("Sending %1 to %2").arg(function, host()));
    const auto reply = roundTrip(protocol::build_function(function, params),
                                 QString::fromLatin1(protocol::kCommandFunction), error);
    if (!reply) {
        return false;
    }
    common::log_debug(kCategory, QStringLiteral("%1 accepted by %2: %3").arg(function, host(), reply->data));
    return true;
}

}  // namespace vms::transport
