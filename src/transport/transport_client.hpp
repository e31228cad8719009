#pragma once

#include "common/model.hpp"
#include "common/protocol.hpp"
#include "common/vmix_xml.hpp"

#include <QtCore/QString>

#include <functional>
#include <memory>
#include <optional>

namespace vms::transport {

constexpr int kRequestTimeoutMs = 5000;
constexpr int kTeardownTimeoutMs = 2000;

struct TransportError {
    enum class Kind {
        None,
        Network,
        Timeout,
        Protocol,
        Cancelled,
    };

    Kind kind = Kind::None;
    QString message;
};

QString to_string(TransportError::Kind kind);
void set_error(TransportError *error, TransportError::Kind kind, const QString &message);

// Callbacks a push transport invokes from its own session thread.
struct PushHandlers {
    std::function<void(protocol::VmixState state)> onState;
    std::function<void(model::ConnectionStatus status, QString reason)> onLink;
};

// Capability set for one vMix instance. Blocking calls; safe to call from any thread
// except a push transport's own session thread.
class TransportClient {
public:
    virtual ~TransportClient() = default;

    virtual model::TransportKind kind() const = 0;
    const QString &host() const { return host_; }
    quint16 port() const { return port_; }

    virtual bool open(TransportError *error = nullptr) = 0;
    // Bounded best-effort teardown. Returns false when the peer could not be closed cleanly.
    virtual bool close() = 0;

    virtual std::optional<protocol::VmixState> fetchState(TransportError *error = nullptr) = 0;
    virtual bool sendFunction(const QString &function, const protocol::FunctionParams &params,
                              TransportError *error = nullptr) = 0;

    std::optional<model::StatusFields> fetchStatus(TransportError *error = nullptr);
    std::optional<model::InputList> fetchInputs(TransportError *error = nullptr);
    std::optional<model::VideoLists> fetchVideoLists(TransportError *error = nullptr);
    bool selectVideoListItem(int inputNumber, int itemIndex, TransportError *error = nullptr);

    virtual bool pushes() const { return false; }
    virtual void setPushHandlers(PushHandlers handlers) { (void)handlers; }

protected:
    TransportClient(QString host, quint16 port);

private:
    QString host_;
    quint16 port_ = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::unique_ptr<TransportClient> create(model::TransportKind kind, const QString &host, quint16 port) = 0;
};

class DefaultTransportFactory : public TransportFactory {
public:
    std::unique_ptr<TransportClient> create(model::TransportKind kind, const QString &host, quint16 port) override;
};

}  // namespace vms::transport
