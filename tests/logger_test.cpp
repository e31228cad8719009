#include "common/logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

#include <gtest/gtest.h>

using namespace vms::common;

namespace {

// Restores the suite-wide threshold after a test lowers it.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = Logger::instance().minimumLevel(); }
    void TearDown() override { Logger::instance().setMinimumLevel(saved_); }

private:
    LogLevel saved_ = LogLevel::Info;
};

}  // namespace

TEST_F(LoggerTest, FormatsLines) {
    const QDateTime timestamp(QDate(2024, 3, 9), QTime(7, 5, 1, 42));
    EXPECT_EQ(format_line(LogLevel::Warn, QStringLiteral("tcp"), QStringLiteral("lost"), timestamp),
              QStringLiteral("[2024-03-09 07:05:01.042] WARN tcp - lost"));
}

TEST_F(LoggerTest, ParsesLevels) {
    EXPECT_EQ(parse_level(QStringLiteral(" Debug ")), std::optional<LogLevel>(LogLevel::Debug));
    EXPECT_EQ(parse_level(QStringLiteral("warning")), std::optional<LogLevel>(LogLevel::Warn));
    EXPECT_EQ(parse_level(QStringLiteral("ERROR")), std::optional<LogLevel>(LogLevel::Error));
    EXPECT_FALSE(parse_level(QStringLiteral("loud")).has_value());
}

TEST_F(LoggerTest, ThresholdFiltersPublication) {
    QStringList seen;
    auto connection = QObject::connect(&Logger::instance(), &Logger::messageLogged,
                                       [&seen](LogLevel, QString category, QString message, QDateTime) {
                                           seen.append(category + QLatin1Char(':') + message);
                                       });
    Logger::instance().setMinimumLevel(LogLevel::Warn);
    log_info(QStringLiteral("config"), QStringLiteral("hidden"));
    log_error(QStringLiteral("config"), QStringLiteral("shown"));
    QObject::disconnect(connection);

    EXPECT_EQ(seen, QStringList{QStringLiteral("config:shown")});
}

TEST_F(LoggerTest, FileSinkAppendsLines) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("vmixsync.log"));

    Logger::instance().setMinimumLevel(LogLevel::Debug);
    {
        LogFileSink sink;
        QString error;
        ASSERT_TRUE(sink.open(path, &error)) << error.toStdString();
        log_debug(QStringLiteral("supervisor"), QStringLiteral("first"));
        log_info(QStringLiteral("supervisor"), QStringLiteral("second"));
    }

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QList<QByteArray> lines = file.readAll().split('\n');
    ASSERT_GE(lines.size(), 2);
    EXPECT_TRUE(lines[0].endsWith("DEBUG supervisor - first"));
    EXPECT_TRUE(lines[1].endsWith("INFO supervisor - second"));
}
