#include "http_transport.hpp"

#include "common/logger.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QThread>
#include <QtCore/QTimer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

namespace vms::transport {

namespace {

const QString kCategory = QStringLiteral("http");

TransportError::Kind classify(QNetworkReply::NetworkError error) {
    switch (error) {
        case QNetworkReply::TimeoutError:
        case QNetworkReply::OperationCanceledError:
            return TransportError::Kind::Timeout;
        case QNetworkReply::ContentNotFoundError:
        case QNetworkReply::ContentOperationNotPermittedError:
        case QNetworkReply::ContentAccessDenied:
        case QNetworkReply::ProtocolInvalidOperationError:
        case QNetworkReply::ProtocolFailure:
        case QNetworkReply::ProtocolUnknownError:
        case QNetworkReply::InternalServerError:
        case QNetworkReply::UnknownContentError:
        case QNetworkReply::UnknownServerError:
            return TransportError::Kind::Protocol;
        default:
            return TransportError::Kind::Network;
    }
}

}  // namespace

HttpTransport::HttpTransport(QString host, quint16 port, int timeoutMs)
    : TransportClient(std::move(host), port), timeoutMs_(timeoutMs) {}

QUrl HttpTransport::apiUrl() const {
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host());
    url.setPort(port());
    url.setPath(QStringLiteral("/api/"));
    return url;
}

bool HttpTransport::open(TransportError *error) {
    const QUrl url = apiUrl();
    if (host().isEmpty() || port() == 0 || !url.isValid()) {
        set_error(error, TransportError::Kind::Network, QStringLiteral("Malformed address %1:%2").arg(host()).arg(port()));
        return false;
    }
    closed_ = false;
    return true;
}

bool HttpTransport::close() {
    closed_ = true;
    return true;
}

std::optional<QByteArray> HttpTransport::get(const QUrl &url, TransportError *error) {
    if (closed_) {
        set_error(error, TransportError::Kind::Cancelled, QStringLiteral("Transport for %1 is closed").arg(host()));
        return std::nullopt;
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setTransferTimeout(timeoutMs_);
    QNetworkReply *reply = manager.get(request);

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    deadline.start(timeoutMs_);
    loop.exec();

    // The loop also ends early when the owning thread is asked to quit.
    if (!reply->isFinished()) {
        reply->abort();
        if (closed_ || QThread::currentThread()->isInterruptionRequested()) {
            set_error(error, TransportError::Kind::Cancelled, QStringLiteral("Request to %1 cancelled").arg(host()));
        } else {
            set_error(error, TransportError::Kind::Timeout,
                      QStringLiteral("No response from %1 within %2 ms").arg(host()).arg(timeoutMs_));
        }
        return std::nullopt;
    }

    if (reply->error() != QNetworkReply::NoError) {
        set_error(error, classify(reply->error()), reply->errorString());
        return std::nullopt;
    }
    return reply->readAll();
}

std::optional<protocol::VmixState> HttpTransport::fetchState(TransportError *error) {
    const auto body = get(apiUrl(), error);
    if (!body) {
        return std::nullopt;
    }
    QString reason;
    auto state = protocol::parse_state(*body, &reason);
    if (!state) {
        set_error(error, TransportError::Kind::Protocol, QStringLiteral("Malformed state from %1: %2").arg(host(), reason));
        return std::nullopt;
    }
    return state;
}

bool HttpTransport::sendFunction(const QString &function, const protocol::FunctionParams &params,
                                 TransportError *error) {
    if (function.trimmed().isEmpty()) {
        set_error(error, TransportError::Kind::Protocol, QStringLiteral("Function name is empty"));
        return false;
    }
    QUrl url = apiUrl();
    QString query = QStringLiteral("Function=") + QString::fromLatin1(QUrl::toPercentEncoding(function));
    if (!params.isEmpty()) {
        query += QLatin1Char('&') + protocol::encode_query(params);
    }
    url.setQuery(query, QUrl::StrictMode);

    common::log_info(kCategory, QStringLiteral("Sending %1 to %2").arg(function, host()));
    if (!get(url, error)) {
        return false;
    }
    common::log_debug(kCategory, QStringLiteral("%1 accepted by %2").arg(function, host()));
    return true;
}

}  // namespace vms::transport
