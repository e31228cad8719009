#pragma once

#include "transport_client.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QUrl>

#include <atomic>

namespace vms::transport {

// Stateless pull transport: every call is an independent GET against the vMix web API,
// run on the calling thread with a bounded timeout.
class HttpTransport : public TransportClient {
public:
    HttpTransport(QString host, quint16 port, int timeoutMs = kRequestTimeoutMs);

    model::TransportKind kind() const override { return model::TransportKind::Http; }

    bool open(TransportError *error = nullptr) override;
    bool close() override;

    std::optional<protocol::VmixState> fetchState(TransportError *error = nullptr) override;
    bool sendFunction(const QString &function, const protocol::FunctionParams &params,
                      TransportError *error = nullptr) override;

    QUrl apiUrl() const;

private:
    std::optional<QByteArray> get(const QUrl &url, TransportError *error);

    int timeoutMs_ = kRequestTimeoutMs;
    std::atomic<bool> closed_{false};
};

}  // namespace vms::transport
