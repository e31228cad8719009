#include "test_support.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDeadlineTimer>
#include <QtCore/QMetaObject>
#include <QtCore/QMutexLocker>
#include <QtNetwork/QHostAddress>

namespace vms::test {

bool wait_for(const std::function<bool()> &predicate, int timeoutMs) {
    QDeadlineTimer deadline(timeoutMs);
    while (!predicate()) {
        if (deadline.hasExpired()) {
            return predicate();
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(2);
    }
    return true;
}

void pump(int milliseconds) {
    QDeadlineTimer deadline(milliseconds);
    while (!deadline.hasExpired()) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(2);
    }
}

QByteArray state_xml(const QString &version, int active, int preview, const QVector<XmlInput> &inputs,
                     const QString &edition) {
    QString xml = QStringLiteral("<vmix><version>%1</version><edition>%2</edition><inputs>").arg(version, edition);
    for (const auto &input : inputs) {
        xml += QStringLiteral("<input key=\"%1\" number=\"%2\" type=\"%3\" title=\"%4\" state=\"%5\"")
                   .arg(input.key)
                   .arg(input.number)
                   .arg(input.type, input.title, input.state);
        if (input.selectedIndex > 0) {
            xml += QStringLiteral(" selectedIndex=\"%1\"").arg(input.selectedIndex);
        }
        xml += QLatin1Char('>');
        if (!input.items.isEmpty()) {
            xml += QStringLiteral("<list>");
            for (const auto &item : input.items) {
                xml += item;
            }
            xml += QStringLiteral("</list>");
        }
        xml += QStringLiteral("%1</input>").arg(input.title);
    }
    xml += QStringLiteral("</inputs><active>%1</active><preview>%2</preview></vmix>").arg(active).arg(preview);
    return xml.toUtf8();
}

QVector<XmlInput> three_inputs() {
    XmlInput camera{QStringLiteral("a1"), 1, QStringLiteral("Capture"), QStringLiteral("Camera 1")};
    XmlInput colour{QStringLiteral("b2"), 2, QStringLiteral("Colour"), QStringLiteral("Black")};
    XmlInput playlist{QStringLiteral("c3"), 3, QStringLiteral("VideoList"), QStringLiteral("Playlist")};
    playlist.items = {QStringLiteral("<item enabled=\"true\" selected=\"true\">intro.mp4</item>"),
                      QStringLiteral("<item enabled=\"true\">loop.mp4</item>"),
                      QStringLiteral("<item enabled=\"false\">outro.mp4</item>")};
    return {camera, colour, playlist};
}

EventRecorder::EventRecorder(sync::EventBus *bus, QObject *parent) : QObject(parent) {
    connect(
        bus, &sync::EventBus::statusUpdated, this,
        [this](const model::Connection &connection) {
            Event event;
            event.kind = QStringLiteral("status");
            event.host = connection.host;
            event.connection = connection;
            record(event);
        },
        Qt::DirectConnection);
    connect(
        bus, &sync::EventBus::inputsUpdated, this,
        [this](const QString &host, const model::InputList &inputs) {
            Event event;
            event.kind = QStringLiteral("inputs");
            event.host = host;
            event.inputs = inputs;
            record(event);
        },
        Qt::DirectConnection);
    connect(
        bus, &sync::EventBus::videoListsUpdated, this,
        [this](const QString &host, const model::VideoLists &videoLists) {
            Event event;
            event.kind = QStringLiteral("videolists");
            event.host = host;
            event.videoLists = videoLists;
            record(event);
        },
        Qt::DirectConnection);
    connect(
        bus, &sync::EventBus::connectionRemoved, this,
        [this](const QString &host) {
            Event event;
            event.kind = QStringLiteral("removed");
            event.host = host;
            record(event);
        },
        Qt::DirectConnection);
}

QVector<EventRecorder::Event> EventRecorder::events() const {
    QMutexLocker locker(&mutex_);
    return events_;
}

int EventRecorder::count(const QString &kind, const QString &host) const {
    QMutexLocker locker(&mutex_);
    int total = 0;
    for (const auto &event : events_) {
        if (event.kind == kind && (host.isEmpty() || event.host == host)) {
            ++total;
        }
    }
    return total;
}

void EventRecorder::clear() {
    QMutexLocker locker(&mutex_);
    events_.clear();
}

void EventRecorder::record(Event event) {
    QMutexLocker locker(&mutex_);
    events_.push_back(std::move(event));
}

SimulatedHttpVmix::SimulatedHttpVmix(QObject *parent) : QObject(parent), server_(this) {
    connect(&server_, &QTcpServer::newConnection, this, &SimulatedHttpVmix::onNewConnection);
}

quint16 SimulatedHttpVmix::listen() {
    if (!server_.listen(QHostAddress::LocalHost, 0)) {
        return 0;
    }
    return server_.serverPort();
}

void SimulatedHttpVmix::setBody(const QByteArray &body) {
    QMutexLocker locker(&mutex_);
    body_ = body;
}

void SimulatedHttpVmix::setStatusLine(const QByteArray &statusLine) {
    QMutexLocker locker(&mutex_);
    statusLine_ = statusLine;
}

void SimulatedHttpVmix::setSilent(bool silent) {
    QMutexLocker locker(&mutex_);
    silent_ = silent;
}

QStringList SimulatedHttpVmix::requests() const {
    QMutexLocker locker(&mutex_);
    return requests_;
}

void SimulatedHttpVmix::onNewConnection() {
    while (server_.hasPendingConnections()) {
        QTcpSocket *socket = server_.nextPendingConnection();
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { respond(socket); });
        connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
    }
}

void SimulatedHttpVmix::respond(QTcpSocket *socket) {
    QByteArray request = socket->property("request").toByteArray() + socket->readAll();
    socket->setProperty("request", request);
    const qsizetype headerEnd = request.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return;
    }
    const QString requestLine = QString::fromUtf8(request.left(request.indexOf("\r\n")));

    QByteArray body;
    QByteArray statusLine;
    {
        QMutexLocker locker(&mutex_);
        requests_.append(requestLine);
        if (silent_) {
            return;
        }
        body = body_;
        statusLine = statusLine_;
    }
    QByteArray response = statusLine + "\r\nContent-Type: text/xml\r\nContent-Length: " +
                          QByteArray::number(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
    socket->write(response);
    socket->disconnectFromHost();
}

SimulatedTcpVmix::SimulatedTcpVmix() : context_(new QObject()) {
    context_->moveToThread(&thread_);
    QObject::connect(&thread_, &QThread::finished, context_, &QObject::deleteLater);
    thread_.start();
}

SimulatedTcpVmix::~SimulatedTcpVmix() {
    QMetaObject::invokeMethod(
        context_,
        [this]() {
            for (QTcpSocket *client : clients_) {
                client->abort();
            }
            clients_.clear();
            buffers_.clear();
            if (server_) {
                server_->close();
            }
        },
        Qt::BlockingQueuedConnection);
    thread_.quit();
    thread_.wait();
}

quint16 SimulatedTcpVmix::start() {
    quint16 port = 0;
    QMetaObject::invokeMethod(
        context_,
        [this, &port]() {
            server_ = new QTcpServer(context_);
            QObject::connect(server_, &QTcpServer::newConnection, context_, [this]() { onNewConnection(); });
            if (server_->listen(QHostAddress::LocalHost, 0)) {
                port = server_->serverPort();
            }
        },
        Qt::BlockingQueuedConnection);
    return port;
}

void SimulatedTcpVmix::setState(const QByteArray &xml) {
    QMutexLocker locker(&mutex_);
    state_ = xml;
}

void SimulatedTcpVmix::setVersionReply(const QByteArray &line) {
    QMutexLocker locker(&mutex_);
    versionReply_ = line;
}

void SimulatedTcpVmix::setRejectFunctions(bool reject) {
    QMutexLocker locker(&mutex_);
    rejectFunctions_ = reject;
}

void SimulatedTcpVmix::setRefuseState(bool refuse) {
    QMutexLocker locker(&mutex_);
    refuseState_ = refuse;
}

void SimulatedTcpVmix::push(const QByteArray &line) {
    QMetaObject::invokeMethod(
        context_,
        [this, line]() {
            for (QTcpSocket *client : clients_) {
                client->write(line + "\r\n");
            }
        },
        Qt::BlockingQueuedConnection);
}

void SimulatedTcpVmix::dropClients() {
    QMetaObject::invokeMethod(
        context_,
        [this]() {
            const auto clients = clients_;
            clients_.clear();
            for (QTcpSocket *client : clients) {
                buffers_.remove(client);
                client->abort();
                client->deleteLater();
            }
        },
        Qt::BlockingQueuedConnection);
}

QStringList SimulatedTcpVmix::received() const {
    QMutexLocker locker(&mutex_);
    return received_;
}

int SimulatedTcpVmix::connectionCount() const {
    QMutexLocker locker(&mutex_);
    return connections_;
}

void SimulatedTcpVmix::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket *socket = server_->nextPendingConnection();
        clients_.append(socket);
        {
            QMutexLocker locker(&mutex_);
            ++connections_;
        }
        QObject::connect(socket, &QTcpSocket::readyRead, context_, [this, socket]() { onReadyRead(socket); });
    }
}

void SimulatedTcpVmix::onReadyRead(QTcpSocket *socket) {
    QByteArray &buffer = buffers_[socket];
    buffer += socket->readAll();
    while (true) {
        const qsizetype newline = buffer.indexOf('\n');
        if (newline < 0) {
            break;
        }
        const QString line = QString::fromUtf8(buffer.left(newline)).trimmed();
        buffer.remove(0, newline + 1);
        if (!line.isEmpty()) {
            handleLine(socket, line);
        }
    }
}

void SimulatedTcpVmix::handleLine(QTcpSocket *socket, const QString &line) {
    QByteArray versionReply;
    QByteArray state;
    bool reject = false;
    bool refuse = false;
    {
        QMutexLocker locker(&mutex_);
        received_.append(line);
        versionReply = versionReply_;
        state = state_;
        reject = rejectFunctions_;
        refuse = refuseState_;
    }
    if (line == QLatin1String("VERSION")) {
        socket->write(versionReply + "\r\n");
    } else if (line.startsWith(QLatin1String("SUBSCRIBE"))) {
        socket->write("SUBSCRIBE OK ACTS\r\n");
    } else if (line == QLatin1String("XML") && refuse) {
        socket->write("XML ER Busy\r\n");
    } else if (line == QLatin1String("XML")) {
        socket->write("XML " + QByteArray::number(state.size()) + "\r\n" + state + "\r\n");
    } else if (line.startsWith(QLatin1String("FUNCTION"))) {
        socket->write(reject ? "FUNCTION ER Input not found\r\n" : "FUNCTION OK Completed\r\n");
    }
}

}  // namespace vms::test
