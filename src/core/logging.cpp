#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(lanscoutDiscoveryLog, "lanscout.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(lanscoutListenerLog, "lanscout.listener", QtInfoMsg)
Q_LOGGING_CATEGORY(lanscoutProbeLog, "lanscout.probe", QtInfoMsg)

namespace lanscout {
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
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void open_log_file(LoggerState& s, const QString& path) {
    if (s.file.isOpen()) {
        s.file.close();
    }
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "lanscout: cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(s.file.errorString()));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
}

} // namespace

void install_log_handler(const LogOptions& options) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        open_log_file(s, options.file_path);
    }
    set_debug_logging(options.debug);
    qInstallMessageHandler(message_handler);
}

void set_debug_logging(bool enabled) {
    QLoggingCategory::setFilterRules(enabled
        ? QStringLiteral("lanscout.*.debug=true\n")
        : QStringLiteral("lanscout.*.debug=false\n"));
}

} // namespace lanscout
