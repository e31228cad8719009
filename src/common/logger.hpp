#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <atomic>
#include <optional>

namespace vms::common {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

QString level_name(LogLevel level);
std::optional<LogLevel> parse_level(const QString &text);
QString format_line(LogLevel level, const QString &category, const QString &message, const QDateTime &timestamp);

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger &instance();

    void log(LogLevel level, const QString &category, const QString &message);

    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;
    bool enabled(LogLevel level) const;

signals:
    void messageLogged(vms::common::LogLevel level, QString category, QString message, QDateTime timestamp);

private:
    explicit Logger(QObject *parent = nullptr);

    QMutex mutex_;
    std::atomic<int> minimumLevel_{static_cast<int>(LogLevel::Info)};
};

inline void log_debug(const QString &category, const QString &message) {
    Logger::instance().log(LogLevel::Debug, category, message);
}

inline void log_info(const QString &category, const QString &message) {
    Logger::instance().log(LogLevel::Info, category, message);
}

inline void log_warn(const QString &category, const QString &message) {
    Logger::instance().log(LogLevel::Warn, category, message);
}

inline void log_error(const QString &category, const QString &message) {
    Logger::instance().log(LogLevel::Error, category, message);
}

// Appends every published line to a file. Lives on the thread that created it;
// lines from other threads arrive through queued delivery.
class LogFileSink : public QObject {
    Q_OBJECT

public:
    explicit LogFileSink(QObject *parent = nullptr);
    ~LogFileSink() override;

    bool open(const QString &path, QString *error = nullptr);
    void close();
    bool isOpen() const;
    QString path() const;

private slots:
    void write(vms::common::LogLevel level, QString category, QString message, QDateTime timestamp);

private:
    QFile file_;
};

class LogConsoleSink : public QObject {
    Q_OBJECT

public:
    explicit LogConsoleSink(QObject *parent = nullptr);

private slots:
    void write(vms::common::LogLevel level, QString category, QString message, QDateTime timestamp);
};

}  // namespace vms::common

Q_DECLARE_METATYPE(vms::common::LogLevel)
