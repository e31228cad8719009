#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>

// Reads command lines from standard input on a worker thread.
class StdinReader : public QObject {
    Q_OBJECT

public:
    explicit StdinReader(QObject *parent = nullptr);

public slots:
    void start();

signals:
    void lineRead(QString line);
    void finished();
};
