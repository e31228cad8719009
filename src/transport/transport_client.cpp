#include "transport_client.hpp"

#include "http_transport.hpp"
#include "tcp_transport.hpp"

namespace vms::transport {

QString to_string(TransportError::Kind kind) {
    switch (kind) {
        case TransportError::Kind::None:
            return QStringLiteral("none");
        case TransportError::Kind::Network:
            return QStringLiteral("network");
        case TransportError::Kind::Timeout:
            return QStringLiteral("timeout");
        case TransportError::Kind::Protocol:
            return QStringLiteral("protocol");
        case TransportError::Kind::Cancelled:
            return QStringLiteral("cancelled");
    }
    return QStringLiteral("none");
}

void set_error(TransportError *error, TransportError::Kind kind, const QString &message) {
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}

TransportClient::TransportClient(QString host, quint16 port) : host_(std::move(host)), port_(port) {}

std::optional<model::StatusFields> TransportClient::fetchStatus(TransportError *error) {
    auto state = fetchState(error);
    if (!state) {
        return std::nullopt;
    }
    return state->status;
}

std::optional<model::InputList> TransportClient::fetchInputs(TransportError *error) {
    auto state = fetchState(error);
    if (!state) {
        return std::nullopt;
    }
    return state->inputs;
}

std::optional<model::VideoLists> TransportClient::fetchVideoLists(TransportError *error) {
    auto state = fetchState(error);
    if (!state) {
        return std::nullopt;
    }
    return state->videoLists;
}

bool TransportClient::selectVideoListItem(int inputNumber, int itemIndex, TransportError *error) {
    if (itemIndex < 0) {
        set_error(error, TransportError::Kind::Protocol, QStringLiteral("Item index %1 out of range").arg(itemIndex));
        return false;
    }
    protocol::FunctionParams params;
    params.insert(QStringLiteral("Input"), QString::number(inputNumber));
    params.insert(QStringLiteral("Value"), QString::number(itemIndex + 1));  // vMix counts from 1
    return sendFunction(QStringLiteral("SelectIndex"), params, error);
}

std::unique_ptr<TransportClient> DefaultTransportFactory::create(model::TransportKind kind, const QString &host,
                                                                 quint16 port) {
    if (kind == model::TransportKind::Tcp) {
        return std::make_unique<TcpTransport>(host, port);
    }
    return std::make_unique<HttpTransport>(host, port);
}

}  // namespace vms::transport
