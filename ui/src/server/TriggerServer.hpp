#pragma once

#include <QHostAddress>
#include <QJsonObject>
#include <QObject>
#include <QPointer>
#include <QString>

#include <memory>

class ContextProvider;
class QHttpServer;
class QHttpServerRequest;
class QTcpServer;
class WindowController;

/**
 * @brief Lokalny serwer HTTP, przez który panel webowy uruchamia i zamyka nakładkę.
 *
 * Obsługa żądań działa w pętli zdarzeń GUI, więc równoległe żądania są serializowane,
 * a odpowiedź wysyłana jest dopiero po zastosowaniu efektu ubocznego.
 */
class TriggerServer : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool listening READ isListening NOTIFY listeningChanged)

public:
    static constexpr quint16 kDefaultPort = 1414;

    TriggerServer(WindowController& controller, ContextProvider& context, QObject* parent = nullptr);
    ~TriggerServer() override;

    bool listen(const QHostAddress& address, quint16 port, QString* errorMessage = nullptr);
    void close();

    bool isListening() const;
    quint16 serverPort() const;
    QHostAddress serverAddress() const;

    // Odczytuje pole "mobile" z ciała JSON lub application/x-www-form-urlencoded.
    static QString extractMobile(const QByteArray& body);

    QJsonObject handleStart(const QString& mobile);
    QJsonObject handleStop();
    QJsonObject statusObject() const;

signals:
    void listeningChanged();
    void startHandled(const QString& status, const QString& user);
    void stopHandled(const QString& status);
    void contextCached();

private:
    void registerRoutes();

    WindowController&            m_controller;
    ContextProvider&             m_context;
    std::unique_ptr<QHttpServer> m_server;
    QPointer<QTcpServer>         m_tcpServer;
};
