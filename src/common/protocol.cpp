#include "protocol.hpp"

#include <QtCore/QUrl>

namespace vms::protocol {

namespace {

void set_error(FrameError code, const QString &reason, FrameError *outCode, QString *outReason) {
    if (outCode) {
        *outCode = code;
    }
    if (outReason) {
        *outReason = reason;
    }
}

ReplyStatus parse_status(const QString &token) {
    if (token == QLatin1String("OK")) {
        return ReplyStatus::Ok;
    }
    if (token == QLatin1String("ER")) {
        return ReplyStatus::Error;
    }
    return ReplyStatus::Other;
}

}  // namespace

void ProtocolParser::append(const QByteArray &data) {
    buffer_.append(data);
}

void ProtocolParser::clear() {
    buffer_.clear();
    pendingXmlLength_ = -1;
}

std::optional<Message> ProtocolParser::nextMessage(FrameError *error, QString *reason) {
    if (error) {
        *error = FrameError::None;
    }
    if (reason) {
        reason->clear();
    }

    while (true) {
        if (pendingXmlLength_ >= 0) {
            if (buffer_.size() < pendingXmlLength_) {
                return std::nullopt;
            }
            Message message;
            message.command = QString::fromLatin1(kCommandXml);
            message.data = QString::number(pendingXmlLength_);
            message.body = buffer_.left(pendingXmlLength_).trimmed();
            buffer_.remove(0, pendingXmlLength_);
            pendingXmlLength_ = -1;
            return message;
        }

        const qsizetype newline = buffer_.indexOf('\n');
        if (newline < 0) {
            if (buffer_.size() > kMaxLineBytes) {
                buffer_.clear();
                set_error(FrameError::LineTooLong, QStringLiteral("Line exceeds %1 bytes").arg(kMaxLineBytes), error, reason);
            }
            return std::nullopt;
        }

        const QString line = QString::fromUtf8(buffer_.left(newline)).trimmed();
        buffer_.remove(0, newline + 1);
        if (line.isEmpty()) {
            continue;  // XML blocks may or may not count their trailing CRLF
        }

        const qsizetype firstSpace = line.indexOf(QLatin1Char(' '));
        const QString command = (firstSpace < 0 ? line : line.left(firstSpace)).toUpper();
        const QString rest = firstSpace < 0 ? QString() : line.mid(firstSpace + 1).trimmed();

        if (command == QLatin1String(kCommandXml)) {
            const QString first = rest.section(QLatin1Char(' '), 0, 0);
            bool ok = false;
            const qlonglong length = first.toLongLong(&ok);
            if (!ok && parse_status(first) == ReplyStatus::Error) {
                // "XML ER <reason>": the request was refused and no block follows.
                Message message;
                message.command = command;
                message.status = ReplyStatus::Error;
                message.data = rest.mid(first.size()).trimmed();
                return message;
            }
            if (!ok || length < 0 || length > kMaxXmlBytes) {
                set_error(FrameError::InvalidLength, QStringLiteral("Invalid XML length '%1'").arg(rest), error, reason);
                continue;
            }
            pendingXmlLength_ = static_cast<qsizetype>(length);
            continue;
        }

        if (rest.isEmpty()) {
            set_error(FrameError::MalformedLine, QStringLiteral("Missing status in '%1'").arg(line), error, reason);
            continue;
        }

        Message message;
        message.command = command;
        const qsizetype statusEnd = rest.indexOf(QLatin1Char(' '));
        message.status = parse_status(statusEnd < 0 ? rest : rest.left(statusEnd));
        message.data = statusEnd < 0 ? QString() : rest.mid(statusEnd + 1).trimmed();
        return message;
    }
}

QByteArray build_command(const QString &command, const QString &arguments) {
    QByteArray frame = command.toUtf8();
    if (!arguments.isEmpty()) {
        frame.append(' ');
        frame.append(arguments.toUtf8());
    }
    frame.append("\r\n");
    return frame;
}

QString encode_query(const FunctionParams &params) {
    QStringList parts;
    parts.reserve(params.size());
    for (auto it = params.cbegin(); it != params.cend(); ++it) {
        parts.append(QString::fromLatin1(QUrl::toPercentEncoding(it.key())) + QLatin1Char('=') +
                     QString::fromLatin1(QUrl::toPercentEncoding(it.value())));
    }
    return parts.join(QLatin1Char('&'));
}

QByteArray build_function(const QString &function, const FunctionParams &params) {
    QString arguments = function;
    const QString query = encode_query(params);
    if (!query.isEmpty()) {
        arguments.append(QLatin1Char(' '));
        arguments.append(query);
    }
    return build_command(QString::fromLatin1(kCommandFunction), arguments);
}

std::optional<Activator> parse_activator(const QString &data) {
    const QStringList tokens = data.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (tokens.isEmpty()) {
        return std::nullopt;
    }
    Activator activator;
    activator.name = tokens.first();
    activator.args = tokens.mid(1);
    return activator;
}

}  // namespace vms::protocol
