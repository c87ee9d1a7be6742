#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

namespace chime {

class NotificationCoordinator;
class ResourceResolver;

/// Unix domain socket front end for the notification pipeline.
///
/// One JSON request per line, one JSON reply per line:
///   {"command":"notify","data":{"message":"Task completed"}}
///     -> {"status":"success","message":...,"sound":...,"visual":true}
///   {"command":"status"} -> effective resources for the next request
/// Requests are handled one at a time on the event loop thread.
class NotifyServer : public QObject {
    Q_OBJECT

public:
    explicit NotifyServer(QObject* parent = nullptr);
    ~NotifyServer() override;

    /// Start listening. Returns false if the socket cannot be bound.
    bool start(const QString& socketPath);
    void stop();
    bool isListening() const;

    void setCoordinator(NotificationCoordinator* coordinator);
    void setResolver(const ResourceResolver* resolver);

    QByteArray handleRequest(const QByteArray& request);

    /// Unterminated input beyond this closes the connection.
    static constexpr qint64 MaxRequestBytes = 64 * 1024;

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    QByteArray handleNotify(const QVariantMap& data);
    QByteArray handleStatus();

    QLocalServer* server_ = nullptr;
    NotificationCoordinator* coordinator_ = nullptr;
    const ResourceResolver* resolver_ = nullptr;
};

} // namespace chime
