#include "NotifyServer.hpp"
#include "NotificationCoordinator.hpp"
#include "core/ResourceResolver.hpp"
#include "core/Version.hpp"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

namespace chime {

NotifyServer::NotifyServer(QObject* parent)
    : QObject(parent)
{
}

NotifyServer::~NotifyServer()
{
    stop();
}

bool NotifyServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QLocalServer::removeServer(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &NotifyServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        qWarning() << "NotifyServer: Failed to listen on" << socketPath
                   << "-" << server_->errorString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    qInfo() << "NotifyServer: Listening on" << socketPath;
    return true;
}

void NotifyServer::stop()
{
    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

bool NotifyServer::isListening() const
{
    return server_ && server_->isListening();
}

void NotifyServer::setCoordinator(NotificationCoordinator* coordinator)
{
    coordinator_ = coordinator;
}

void NotifyServer::setResolver(const ResourceResolver* resolver)
{
    resolver_ = resolver;
}

void NotifyServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        connect(socket, &QLocalSocket::readyRead, this, &NotifyServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &NotifyServer::onDisconnected);
    }
}

void NotifyServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    while (socket->canReadLine()) {
        QByteArray line = socket->readLine().trimmed();
        if (line.isEmpty())
            continue;
        socket->write(handleRequest(line) + "\n");
    }
    socket->flush();

    if (socket->bytesAvailable() > MaxRequestBytes) {
        qWarning() << "NotifyServer: request exceeds" << MaxRequestBytes
                   << "bytes without a newline, dropping client";
        socket->readAll();
        socket->write(R"({"error":"Request too large"})" "\n");
        socket->flush();
        socket->disconnectFromServer();
    }
}

void NotifyServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (socket)
        socket->deleteLater();
}

QByteArray NotifyServer::handleRequest(const QByteArray& request)
{
    QJsonDocument doc = QJsonDocument::fromJson(request);
    if (!doc.isObject()) {
        return R"({"error":"Invalid JSON"})";
    }

    QJsonObject obj = doc.object();
    QString command = obj.value("command").toString();
    QVariantMap data = obj.value("data").toObject().toVariantMap();

    if (command == QLatin1String("notify"))
        return handleNotify(data);
    if (command == QLatin1String("status"))
        return handleStatus();

    return R"({"error":"Unknown command"})";
}

QByteArray NotifyServer::handleNotify(const QVariantMap& data)
{
    if (!coordinator_) return R"({"error":"Notifications not available"})";

    QString message = data.value("message", QStringLiteral("Task completed")).toString();
    qInfo() << "NotifyServer: notify" << message;

    DeliveryOutcome outcome = coordinator_->notifyMessage(message);
    return QJsonDocument(outcome.toJson()).toJson(QJsonDocument::Compact);
}

QByteArray NotifyServer::handleStatus()
{
    QJsonObject obj;
    obj["version"] = QLatin1String(VERSION);

    if (resolver_) {
        ResourceConfig rc = resolver_->resolve();
        obj["start_sound"] = rc.soundFor(NotificationKind::Start);
        obj["complete_sound"] = rc.soundFor(NotificationKind::Complete);
        obj["visual_enabled"] = rc.visualNotificationsEnabled;
        obj["icon"] = rc.iconPath.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(rc.iconPath);
    }
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

} // namespace chime
