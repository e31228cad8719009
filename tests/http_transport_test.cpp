#include "transport/http_transport.hpp"

#include "test_support.hpp"

#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>

#include <gtest/gtest.h>

using namespace vms;
using transport::HttpTransport;
using transport::TransportError;

namespace {

const QString kLocalHost = QStringLiteral("127.0.0.1");

quint16 unused_port() {
    QTcpServer unused;
    unused.listen(QHostAddress::LocalHost, 0);
    const quint16 port = unused.serverPort();
    unused.close();
    return port;
}

}  // namespace

TEST(HttpTransportTest, FetchesAndParsesState) {
    test::SimulatedHttpVmix vmix;
    const quint16 port = vmix.listen();
    ASSERT_NE(port, 0);
    vmix.setBody(test::state_xml(QStringLiteral("27.0.0.49"), 2, 1, test::three_inputs()));

    HttpTransport transport(kLocalHost, port);
    ASSERT_TRUE(transport.open());

    TransportError error;
    auto state = transport.fetchState(&error);
    ASSERT_TRUE(state.has_value()) << error.message.toStdString();
    EXPECT_EQ(state->status.activeInput, 2);
    EXPECT_EQ(state->inputs.size(), 3);
    EXPECT_EQ(state->videoLists.size(), 1);
    ASSERT_FALSE(vmix.requests().isEmpty());
    EXPECT_TRUE(vmix.requests().last().startsWith(QStringLiteral("GET /api/ ")));

    auto status = transport.fetchStatus(&error);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->version, QStringLiteral("27.0.0.49"));
}

TEST(HttpTransportTest, SendsFunctionAsEncodedQuery) {
    test::SimulatedHttpVmix vmix;
    const quint16 port = vmix.listen();
    vmix.setBody("Function completed successfully.");

    HttpTransport transport(kLocalHost, port);
    ASSERT_TRUE(transport.open());

    protocol::FunctionParams params;
    params.insert(QStringLiteral("Input"), QStringLiteral("Camera 1"));
    params.insert(QStringLiteral("Value"), QStringLiteral("a&b"));
    TransportError error;
    ASSERT_TRUE(transport.sendFunction(QStringLiteral("SetText"), params, &error)) << error.message.toStdString();
    EXPECT_TRUE(vmix.requests().last().startsWith(
        QStringLiteral("GET /api/?Function=SetText&Input=Camera%201&Value=a%26b ")));

    ASSERT_TRUE(transport.selectVideoListItem(3, 0, &error));
    EXPECT_TRUE(vmix.requests().last().startsWith(QStringLiteral("GET /api/?Function=SelectIndex&Input=3&Value=1 ")));

    EXPECT_FALSE(transport.sendFunction(QStringLiteral("  "), {}, &error));
    EXPECT_EQ(error.kind, TransportError::Kind::Protocol);
}

TEST(HttpTransportTest, SilentHostTimesOut) {
    test::SimulatedHttpVmix vmix;
    const quint16 port = vmix.listen();
    vmix.setSilent(true);

    HttpTransport transport(kLocalHost, port, 300);
    ASSERT_TRUE(transport.open());

    TransportError error;
    EXPECT_FALSE(transport.fetchState(&error).has_value());
    EXPECT_EQ(error.kind, TransportError::Kind::Timeout);
}

TEST(HttpTransportTest, RefusedConnectionIsNetworkError) {
    HttpTransport transport(kLocalHost, unused_port(), 2000);
    ASSERT_TRUE(transport.open());

    TransportError error;
    EXPECT_FALSE(transport.fetchState(&error).has_value());
    EXPECT_EQ(error.kind, TransportError::Kind::Network);
}

TEST(HttpTransportTest, HttpErrorsAndBadBodiesAreProtocolErrors) {
    test::SimulatedHttpVmix vmix;
    const quint16 port = vmix.listen();
    HttpTransport transport(kLocalHost, port);
    ASSERT_TRUE(transport.open());

    vmix.setStatusLine("HTTP/1.1 404 Not Found");
    vmix.setBody("missing");
    TransportError error;
    EXPECT_FALSE(transport.fetchState(&error).has_value());
    EXPECT_EQ(error.kind, TransportError::Kind::Protocol);

    vmix.setStatusLine("HTTP/1.1 200 OK");
    vmix.setBody("<html><body>not vmix</body></html>");
    EXPECT_FALSE(transport.fetchState(&error).has_value());
    EXPECT_EQ(error.kind, TransportError::Kind::Protocol);
}

TEST(HttpTransportTest, ClosedTransportCancels) {
    HttpTransport transport(kLocalHost, unused_port());
    ASSERT_TRUE(transport.open());
    ASSERT_TRUE(transport.close());

    TransportError error;
    EXPECT_FALSE(transport.fetchState(&error).has_value());
    EXPECT_EQ(error.kind, TransportError::Kind::Cancelled);

    HttpTransport malformed(QString(), 8088);
    EXPECT_FALSE(malformed.open(&error));
    EXPECT_EQ(error.kind, TransportError::Kind::Network);
}
