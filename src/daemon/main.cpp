#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSocketNotifier>

#include <nlohmann/json.hpp>

#include <csignal>
#include <exception>
#include <memory>

#include <sys/socket.h>
#include <unistd.h>

#include "common/blastd_version.hpp"
#include "common/logging.hpp"
#include "daemon/blast_config.hpp"
#include "daemon/blast_daemon.hpp"

namespace {

int g_signalFds[2] = {-1, -1};

void handleTerminationSignal(int)
{
    const char byte = 1;
    // Only async-signal-safe work here; the event loop does the rest.
    [[maybe_unused]] const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
}

bool installSignalHandlers()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        return false;
    }

    struct sigaction action = {};
    action.sa_handler = handleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0
        && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("blastd"));
    QCoreApplication::setApplicationVersion(QStringLiteral(BLASTD_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Receives editor activity over a local socket, buffers it and syncs it "
        "to a remote Blast server."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Read configuration from <file>."),
                                          QStringLiteral("file"));
    const QCommandLineOption traceOption(QStringLiteral("trace"),
                                         QStringLiteral("Write debug events to the trace log."));
    parser.addOption(configOption);
    parser.addOption(traceOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("BLASTD_TRACE") == 1;
    blastd::logging::initLogging(QStringLiteral("blastd"), trace);

    blastd::Config config;
    try {
        config = blastd::loadConfig(parser.value(configOption));
    } catch (const std::exception &ex) {
        qCritical() << "blastd: failed to load config:" << ex.what();
        return 1;
    }

    std::unique_ptr<blastd::BlastDaemon> daemon;
    try {
        daemon = std::make_unique<blastd::BlastDaemon>(config);
    } catch (const std::exception &ex) {
        qCritical() << "blastd: failed to create daemon:" << ex.what();
        BLASTD_LOG_ERROR(QStringLiteral("main"),
                         QStringLiteral("main"),
                         QStringLiteral("daemon_init_failed"),
                         QStringLiteral("exception"),
                         QStringLiteral("bootstrap"),
                         blastd::logging::defaultWho(),
                         QString(),
                         (nlohmann::json{{"error", ex.what()}}));
        return 1;
    }

    if (!installSignalHandlers()) {
        qCritical() << "blastd: failed to install signal handlers";
        return 1;
    }
    QSocketNotifier signalNotifier(g_signalFds[1], QSocketNotifier::Read);
    QObject::connect(&signalNotifier, &QSocketNotifier::activated, &app, [&signalNotifier] {
        signalNotifier.setEnabled(false);
        char byte = 0;
        [[maybe_unused]] const ssize_t readBytes = ::read(g_signalFds[1], &byte, sizeof(byte));
        qInfo() << "blastd: shutting down...";
        QCoreApplication::quit();
    });

    if (!daemon->start()) {
        qCritical() << "blastd: failed to listen on" << QString::fromStdString(config.socketPath);
        return 1;
    }

    const int rc = app.exec();

    // Blocks until the final flush has been attempted.
    daemon->stop();
    return rc;
}
