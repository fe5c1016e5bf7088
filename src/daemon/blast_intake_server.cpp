#include "daemon/blast_intake_server.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLocalSocket>

#include <algorithm>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"

namespace blastd {

namespace {

constexpr int kPollIntervalMs = 250;
constexpr int kWriteTimeoutMs = 5000;
constexpr qint64 kMaxLineBytes = 64 * 1024;

const QString kComponent = QStringLiteral("BlastIntakeServer");

std::string encodeResponse(const IntakeResponse &response)
{
    return nlohmann::json(response).dump(-1, ' ', false,
                                         nlohmann::json::error_handler_t::replace);
}

bool writeLine(QLocalSocket &socket, const std::string &line)
{
    QByteArray payload = QByteArray::fromStdString(line);
    payload.append('\n');
    if (socket.write(payload) != payload.size()) {
        return false;
    }
    while (socket.bytesToWrite() > 0) {
        if (!socket.waitForBytesWritten(kWriteTimeoutMs)) {
            return false;
        }
    }
    return true;
}

} // namespace

BlastIntakeServer::BlastIntakeServer(ActivityBuffer &buffer,
                                     SyncRateLimiter &rateLimiter,
                                     std::string machine,
                                     QObject *parent)
    : QLocalServer(parent)
    , m_buffer(buffer)
    , m_rateLimiter(rateLimiter)
    , m_machine(std::move(machine))
{
}

BlastIntakeServer::~BlastIntakeServer()
{
    stop();
}

void BlastIntakeServer::setSyncTrigger(SyncTrigger trigger)
{
    m_syncTrigger = std::move(trigger);
}

bool BlastIntakeServer::start(const QString &socketPath)
{
    m_stopping = false;
    m_socketPath = socketPath;

    const QFileInfo socketInfo(socketPath);
    if (!QDir().mkpath(socketInfo.absolutePath())) {
        qWarning() << "Failed to create socket directory" << socketInfo.absolutePath();
        return false;
    }

    if (QFile::exists(socketPath) && !QLocalServer::removeServer(socketPath)) {
        qWarning() << "Failed to remove stale blastd socket" << socketPath;
        return false;
    }

    setSocketOptions(QLocalServer::UserAccessOption);
    if (!listen(socketPath)) {
        qWarning() << "Failed to listen on blastd socket" << socketPath << errorString();
        return false;
    }

    if (!QFile::setPermissions(socketPath, QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        qWarning() << "Failed to restrict blastd socket permissions" << socketPath;
        close();
        QFile::remove(socketPath);
        return false;
    }

    BLASTD_LOG_INFO(kComponent,
                    QStringLiteral("start"),
                    QStringLiteral("intake_listening"),
                    QStringLiteral("daemon_start"),
                    QStringLiteral("local_socket"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"socketPath", socketPath.toStdString()}}));
    return true;
}

void BlastIntakeServer::stop()
{
    m_stopping = true;

    if (isListening()) {
        close();
        if (!m_socketPath.isEmpty()) {
            QFile::remove(m_socketPath);
        }
        BLASTD_LOG_INFO(kComponent,
                        QStringLiteral("stop"),
                        QStringLiteral("intake_stopped"),
                        QStringLiteral("shutdown"),
                        QStringLiteral("local_socket"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"openConnections", activeConnections()}}));
    }

    // Connection threads notice m_stopping within one poll interval.
    for (const auto &worker : m_workers) {
        worker->wait();
    }
    m_workers.clear();
}

int BlastIntakeServer::activeConnections() const
{
    return m_activeConnections.load();
}

void BlastIntakeServer::incomingConnection(quintptr socketDescriptor)
{
    m_workers.erase(std::remove_if(m_workers.begin(), m_workers.end(),
                                   [](const std::unique_ptr<QThread> &worker) {
                                       return worker->isFinished();
                                   }),
                    m_workers.end());

    std::unique_ptr<QThread> worker(QThread::create([this, socketDescriptor] {
        serveConnection(socketDescriptor);
    }));
    worker->start();
    m_workers.push_back(std::move(worker));
}

void BlastIntakeServer::serveConnection(quintptr socketDescriptor)
{
    QLocalSocket socket;
    if (!socket.setSocketDescriptor(socketDescriptor)) {
        BLASTD_LOG_WARN(kComponent,
                        QStringLiteral("serveConnection"),
                        QStringLiteral("connection_rejected"),
                        QStringLiteral("bad_descriptor"),
                        QStringLiteral("local_socket"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"error", socket.errorString().toStdString()}}));
        return;
    }

    ++m_activeConnections;

    while (!m_stopping.load()) {
        if (!socket.canReadLine()) {
            if (socket.bytesAvailable() > kMaxLineBytes) {
                writeLine(socket, encodeResponse(IntakeResponse::failure("request too large")));
                break;
            }
            if (!socket.waitForReadyRead(kPollIntervalMs)
                && socket.state() != QLocalSocket::ConnectedState) {
                // The client closed after a last request without '\n'.
                // Nobody is left to read the response.
                const QByteArray rest = socket.readAll().trimmed();
                if (!rest.isEmpty()) {
                    handleLine(rest.toStdString());
                }
                break;
            }
            continue;
        }

        QByteArray line = socket.readLine();
        while (line.endsWith('\n') || line.endsWith('\r')) {
            line.chop(1);
        }

        if (!writeLine(socket, handleLine(line.toStdString()))) {
            break;
        }
    }

    --m_activeConnections;
    if (socket.state() == QLocalSocket::ConnectedState) {
        socket.disconnectFromServer();
    }
}

std::string BlastIntakeServer::handleLine(const std::string &line)
{
    logging::CorrelationScope corrScope(logging::newCorrelationId());

    const auto parsed = nlohmann::json::parse(line, nullptr, false);
    IntakeRequest request;
    try {
        if (parsed.is_discarded()) {
            throw ClientInputFault("unparseable line");
        }
        request = parsed.get<IntakeRequest>();
    } catch (const ClientInputFault &ex) {
        BLASTD_LOG_WARN(kComponent,
                        QStringLiteral("handleLine"),
                        QStringLiteral("intake_request_error"),
                        QStringLiteral("parse_payload"),
                        QStringLiteral("json_parse"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"error", ex.what()}}));
        return encodeResponse(IntakeResponse::failure("invalid json"));
    }

    BLASTD_LOG_DEBUG(kComponent,
                     QStringLiteral("handleLine"),
                     QStringLiteral("intake_request_received"),
                     QStringLiteral("client_call"),
                     QStringLiteral("json_lines"),
                     logging::defaultWho(),
                     QString(),
                     (nlohmann::json{{"type", request.type}}));

    IntakeResponse response;
    try {
        if (request.type == "activity") {
            response = handleActivity(request.data);
        } else if (request.type == "sync") {
            response = handleSync();
        } else if (request.type == "ping") {
            response = IntakeResponse::success();
        } else {
            response = IntakeResponse::failure("unknown request type");
        }
    } catch (const std::exception &ex) {
        BLASTD_LOG_ERROR(kComponent,
                         QStringLiteral("handleLine"),
                         QStringLiteral("intake_request_error"),
                         QStringLiteral("exception"),
                         QStringLiteral("json_lines"),
                         logging::defaultWho(),
                         QString(),
                         (nlohmann::json{{"type", request.type}, {"error", ex.what()}}));
        response = IntakeResponse::failure(ex.what());
    }

    return encodeResponse(response);
}

IntakeResponse BlastIntakeServer::handleActivity(const nlohmann::json &data)
{
    IntakeActivityData payload;
    try {
        payload = data.get<IntakeActivityData>();
    } catch (const ClientInputFault &) {
        return IntakeResponse::failure("invalid activity data");
    }

    // Only parseability is checked; ended_at before started_at is accepted.
    const auto startedAt = parseRfc3339(payload.startedAt);
    if (!startedAt) {
        return IntakeResponse::failure("invalid started_at");
    }
    const auto endedAt = parseRfc3339(payload.endedAt);
    if (!endedAt) {
        return IntakeResponse::failure("invalid ended_at");
    }

    Activity activity;
    activity.project = payload.project;
    activity.gitRemote = payload.gitRemote;
    activity.startedAt = *startedAt;
    activity.endedAt = *endedAt;
    activity.filename = payload.filename;
    activity.filetype = payload.filetype;
    activity.linesAdded = payload.linesAdded;
    activity.linesRemoved = payload.linesRemoved;
    activity.gitBranch = payload.gitBranch;
    activity.actionsPerMinute = payload.actionsPerMinute;
    activity.wordsPerMinute = payload.wordsPerMinute;
    activity.editor = payload.editor.empty() ? kDefaultEditor : payload.editor;
    activity.machine = m_machine;

    try {
        m_buffer.append(activity);
    } catch (const StorageFault &ex) {
        BLASTD_LOG_ERROR(kComponent,
                         QStringLiteral("handleActivity"),
                         QStringLiteral("activity_store_failed"),
                         QStringLiteral("storage_fault"),
                         QStringLiteral("sqlite"),
                         logging::defaultWho(),
                         QString(),
                         (nlohmann::json{{"error", ex.what()}}));
        return IntakeResponse::failure(ex.what());
    }

    return IntakeResponse::success();
}

IntakeResponse BlastIntakeServer::handleSync()
{
    if (!m_syncTrigger) {
        return IntakeResponse::failure("sync not available");
    }

    try {
        m_rateLimiter.admit();
    } catch (const RateLimited &ex) {
        BLASTD_LOG_WARN(kComponent,
                        QStringLiteral("handleSync"),
                        QStringLiteral("sync_rate_limited"),
                        QStringLiteral("quota_exceeded"),
                        QStringLiteral("sliding_window"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"retryAfterSeconds", ex.retryAfter().count()}}));
        return IntakeResponse::failure(ex.what());
    }

    try {
        m_syncTrigger();
    } catch (const std::exception &ex) {
        BLASTD_LOG_WARN(kComponent,
                        QStringLiteral("handleSync"),
                        QStringLiteral("manual_sync_failed"),
                        QStringLiteral("client_call"),
                        QStringLiteral("sync_engine"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"error", ex.what()}}));
        return IntakeResponse::failure(ex.what());
    }

    return IntakeResponse::success("sync complete");
}

} // namespace blastd
