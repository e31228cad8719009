#pragma once

#include "tcp_session.hpp"
#include "transport_client.hpp"

#include <QtCore/QMutex>
#include <QtCore/QThread>

namespace vms::transport {

// Push transport over the vMix TCP API. Owns one TcpSession running on a dedicated thread;
// blocking calls are posted to that thread and awaited with a timeout.
class TcpTransport : public TransportClient {
public:
    TcpTransport(QString host, quint16 port, int timeoutMs = kRequestTimeoutMs);
    ~TcpTransport() override;

    model::TransportKind kind() const override { return model::TransportKind::Tcp; }

    bool open(TransportError *error = nullptr) override;
    bool close() override;

    std::optional<protocol::VmixState> fetchState(TransportError *error = nullptr) override;
    bool sendFunction(const QString &function, const protocol::FunctionParams &params,
                      TransportError *error = nullptr) override;

    bool pushes() const override { return true; }
    void setPushHandlers(PushHandlers handlers) override;

private:
    std::optional<TcpSession::Reply> roundTrip(const QByteArray &line, const QString &replyCommand,
                                               TransportError *error);
    bool teardown(QThread *thread);

    int timeoutMs_ = kRequestTimeoutMs;
    mutable QMutex mutex_;
    PushHandlers handlers_;
    QThread *thread_ = nullptr;
    TcpSession *session_ = nullptr;
};

}  // namespace vms::transport
