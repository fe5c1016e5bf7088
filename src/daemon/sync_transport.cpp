#include "daemon/sync_transport.hpp"

#include <QByteArray>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <QVariant>

#include <memory>

namespace blastd {

TransportReply QtHttpTransport::post(const std::string &url,
                                     const std::string &bearerToken,
                                     const std::string &jsonBody)
{
    TransportReply result;

    const QUrl target(QString::fromStdString(url));
    if (!target.isValid() || target.scheme().isEmpty()) {
        result.error = "invalid server url: " + url;
        return result;
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(target);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("Authorization",
                         QByteArrayLiteral("Bearer ") + QByteArray::fromStdString(bearerToken));

    // Released before the manager that parents it.
    const std::unique_ptr<QNetworkReply> reply(
        manager.post(request, QByteArray::fromStdString(jsonBody)));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (status.isValid()) {
        // Any HTTP answer, including error statuses, counts as delivered.
        result.delivered = true;
        result.statusCode = status.toInt();
        result.body = reply->readAll().toStdString();
    } else {
        result.error = reply->errorString().toStdString();
    }

    return result;
}

} // namespace blastd
