#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <optional>

namespace vms::protocol {

constexpr int kMaxLineBytes = 64 * 1024;
constexpr qsizetype kMaxXmlBytes = 32 * 1024 * 1024;

constexpr char kCommandXml[] = "XML";
constexpr char kCommandVersion[] = "VERSION";
constexpr char kCommandFunction[] = "FUNCTION";
constexpr char kCommandSubscribe[] = "SUBSCRIBE";
constexpr char kCommandActs[] = "ACTS";

enum class FrameError {
    None = 0,
    LineTooLong,
    MalformedLine,
    InvalidLength,
};

enum class ReplyStatus {
    None,  // XML blocks carry a length instead of a status, unless refused with ER
    Ok,
    Error,
    Other,
};

// One decoded vMix TCP message: "COMMAND STATUS data\r\n" or an "XML <length>" block.
struct Message {
    QString command;
    ReplyStatus status = ReplyStatus::None;
    QString data;
    QByteArray body;

    bool isOk() const { return status == ReplyStatus::Ok; }
};

struct Activator {
    QString name;
    QStringList args;
};

using FunctionParams = QMap<QString, QString>;

class ProtocolParser {
public:
    void append(const QByteArray &data);
    std::optional<Message> nextMessage(FrameError *error = nullptr, QString *reason = nullptr);
    void clear();
    qsizetype buffered() const { return buffer_.size(); }

private:
    QByteArray buffer_;
    qsizetype pendingXmlLength_ = -1;
};

QByteArray build_command(const QString &command, const QString &arguments = QString());
QByteArray build_function(const QString &function, const FunctionParams &params);
QString encode_query(const FunctionParams &params);

// "Input 3 1" -> {Input, [3, 1]}
std::optional<Activator> parse_activator(const QString &data);

}  // namespace vms::protocol
