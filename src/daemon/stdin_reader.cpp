#include "stdin_reader.hpp"

#include <QtCore/QTextStream>
#include <QtCore/QThread>

#include <cstdio>

StdinReader::StdinReader(QObject *parent) : QObject(parent) {}

void StdinReader::start() {
    QTextStream in(stdin);
    QString line;
    while (!QThread::currentThread()->isInterruptionRequested() && in.readLineInto(&line)) {
        const QString trimmed = line.trimmed();
        if (trimmed.isEmpty()) {
            continue;
        }
        emit lineRead(trimmed);
        // Stop reading once asked to quit so the thread can be joined.
        if (trimmed == QLatin1String("quit")) {
            break;
        }
    }
    emit finished();
}
