#include "engine/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>
#include <cstdio>

namespace tidemark {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        previous = s.previous;

        const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
        const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");
        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

        if (s.file.isOpen()) {
            s.file.write(line.toUtf8());
            s.file.flush();
        }
        if (!previous) {
            std::fputs(line.toLocal8Bit().constData(), stderr);
            return;
        }
    }

    // Outside the lock: the chained handler may log again.
    previous(type, ctx, msg);
}

} // namespace

bool install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) s.file.close();

        QDir dir(QFileInfo(path).absolutePath());
        dir.mkpath(QStringLiteral("."));

        s.file.setFileName(path);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return false;
        }
    }

    // The handler stamps time/level/category itself.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    auto previous = qInstallMessageHandler(message_handler);
    if (previous != message_handler) {
        QMutexLocker lock(&s.mu);
        s.previous = previous;
    }
    return true;
}

void uninstall_file_logging() {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    qInstallMessageHandler(s.previous);
    s.previous = nullptr;
    if (s.file.isOpen()) s.file.close();
}

} // namespace tidemark
