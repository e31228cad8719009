#include "logger.hpp"

#include <QtCore/QMutexLocker>
#include <QtCore/QTextStream>

#include <cstdio>

namespace vms::common {

QString level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return QStringLiteral("DEBUG");
        case LogLevel::Info:
            return QStringLiteral("INFO");
        case LogLevel::Warn:
            return QStringLiteral("WARN");
        case LogLevel::Error:
            return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

std::optional<LogLevel> parse_level(const QString &text) {
    const QString lowered = text.trimmed().toLower();
    if (lowered == QLatin1String("debug") || lowered == QLatin1String("trace")) {
        return LogLevel::Debug;
    }
    if (lowered == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (lowered == QLatin1String("warn") || lowered == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (lowered == QLatin1String("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

QString format_line(LogLevel level, const QString &category, const QString &message, const QDateTime &timestamp) {
    return QStringLiteral("[%1] %2 %3 - %4")
        .arg(timestamp.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz")), level_name(level), category, message);
}

Logger::Logger(QObject *parent) : QObject(parent) {
    qRegisterMetaType<LogLevel>("vms::common::LogLevel");
}

Logger &Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, const QString &category, const QString &message) {
    if (!enabled(level)) {
        return;
    }
    const QDateTime timestamp = QDateTime::currentDateTimeUtc();
    QMutexLocker locker(&mutex_);
    emit messageLogged(level, category, message, timestamp);
}

void Logger::setMinimumLevel(LogLevel level) {
    minimumLevel_ = static_cast<int>(level);
}

LogLevel Logger::minimumLevel() const {
    return static_cast<LogLevel>(minimumLevel_.load());
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= minimumLevel_.load();
}

LogFileSink::LogFileSink(QObject *parent) : QObject(parent) {
    connect(&Logger::instance(), &Logger::messageLogged, this, &LogFileSink::write);
}

LogFileSink::~LogFileSink() {
    close();
}

bool LogFileSink::open(const QString &path, QString *error) {
    close();
    file_.setFileName(path);
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        if (error) {
            *error = file_.errorString();
        }
        return false;
    }
    return true;
}

void LogFileSink::close() {
    if (file_.isOpen()) {
        file_.flush();
        file_.close();
    }
}

bool LogFileSink::isOpen() const {
    return file_.isOpen();
}

QString LogFileSink::path() const {
    return file_.fileName();
}

void LogFileSink::write(LogLevel level, QString category, QString message, QDateTime timestamp) {
    if (!file_.isOpen()) {
        return;
    }
    const QByteArray line = format_line(level, category, message, timestamp).toUtf8() + '\n';
    file_.write(line);
    file_.flush();
}

LogConsoleSink::LogConsoleSink(QObject *parent) : QObject(parent) {
    connect(&Logger::instance(), &Logger::messageLogged, this, &LogConsoleSink::write);
}

void LogConsoleSink::write(LogLevel level, QString category, QString message, QDateTime timestamp) {
    const QByteArray line = format_line(level, category, message, timestamp).toUtf8();
    std::fprintf(stderr, "%s\n", line.constData());
    std::fflush(stderr);
}

}  // namespace vms::common
