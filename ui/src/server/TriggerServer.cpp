#include "TriggerServer.hpp"

#include <QHttpHeaders>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QTcpServer>
#include <QUrlQuery>

#include <utility>

#include "capture/ContextProvider.hpp"
#include "overlay/WindowController.hpp"

Q_LOGGING_CATEGORY(lcTriggerServer, "vision.companion.trigger")

namespace {

using StatusCode = QHttpServerResponse::StatusCode;

QHttpServerResponse jsonResponse(const QJsonObject& object, StatusCode status = StatusCode::Ok)
{
    return QHttpServerResponse(object, status);
}

QHttpServerResponse errorResponse(const QString& message, StatusCode status)
{
    return jsonResponse(QJsonObject{{QStringLiteral("error"), message}}, status);
}

QHttpServerResponse preflightResponse()
{
    return QHttpServerResponse(StatusCode::NoContent);
}

} // namespace

TriggerServer::TriggerServer(WindowController& controller, ContextProvider& context, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_context(context)
{
}

TriggerServer::~TriggerServer()
{
    close();
}

bool TriggerServer::listen(const QHostAddress& address, quint16 port, QString* errorMessage)
{
    if (isListening())
        close();

    m_server = std::make_unique<QHttpServer>();
    registerRoutes();

    auto* tcpServer = new QTcpServer(m_server.get());
    if (!tcpServer->listen(address, port)) {
        const QString error = tr("Nie udało się nasłuchiwać na %1:%2: %3")
                                  .arg(address.toString())
                                  .arg(port)
                                  .arg(tcpServer->errorString());
        qCCritical(lcTriggerServer) << error;
        if (errorMessage)
            *errorMessage = error;
        m_server.reset();
        return false;
    }
    if (!m_server->bind(tcpServer)) {
        const QString error = tr("Nie udało się podpiąć serwera HTTP do %1:%2")
                                  .arg(address.toString())
                                  .arg(port);
        qCCritical(lcTriggerServer) << error;
        if (errorMessage)
            *errorMessage = error;
        m_server.reset();
        return false;
    }
    m_tcpServer = tcpServer;

    qCInfo(lcTriggerServer) << "Serwer wyzwalający nasłuchuje na" << address.toString() << serverPort();
    Q_EMIT listeningChanged();
    return true;
}

void TriggerServer::close()
{
    if (!m_server)
        return;
    qCInfo(lcTriggerServer) << "Zatrzymuję serwer wyzwalający";
    if (m_tcpServer)
        m_tcpServer->close();
    m_tcpServer.clear();
    m_server.reset();
    Q_EMIT listeningChanged();
}

bool TriggerServer::isListening() const
{
    return m_tcpServer && m_tcpServer->isListening();
}

quint16 TriggerServer::serverPort() const
{
    return m_tcpServer ? m_tcpServer->serverPort() : 0;
}

QHostAddress TriggerServer::serverAddress() const
{
    return m_tcpServer ? m_tcpServer->serverAddress() : QHostAddress();
}

QString TriggerServer::extractMobile(const QByteArray& body)
{
    const QByteArray trimmed = body.trimmed();
    if (trimmed.isEmpty())
        return {};

    if (trimmed.startsWith('{')) {
        QJsonParseError parseError{};
        const QJsonDocument document = QJsonDocument::fromJson(trimmed, &parseError);
        if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
            qCWarning(lcTriggerServer) << "Niepoprawny JSON żądania start-vision:" << parseError.errorString();
            return {};
        }
        const QJsonValue mobile = document.object().value(QStringLiteral("mobile"));
        if (mobile.isString())
            return mobile.toString().trimmed();
        if (mobile.isDouble())
            return QString::number(mobile.toDouble(), 'f', 0);
        return {};
    }

    const QUrlQuery query(QString::fromUtf8(trimmed));
    return query.queryItemValue(QStringLiteral("mobile"), QUrl::FullyDecoded).trimmed();
}

QJsonObject TriggerServer::handleStart(const QString& mobile)
{
    QString error;
    const WindowController::OpenResult result = m_controller.open(mobile, &error);
    QJsonObject reply;
    switch (result) {
    case WindowController::OpenResult::Launched:
        reply.insert(QStringLiteral("status"), QStringLiteral("launched"));
        break;
    case WindowController::OpenResult::Focused:
        reply.insert(QStringLiteral("status"), QStringLiteral("focused"));
        break;
    case WindowController::OpenResult::Failed:
        reply.insert(QStringLiteral("error"), error);
        return reply;
    }
    reply.insert(QStringLiteral("user"), m_controller.activeUser());
    qCInfo(lcTriggerServer) << "start-vision:" << reply.value(QStringLiteral("status")).toString()
                            << "użytkownik" << m_controller.activeUser();
    Q_EMIT startHandled(reply.value(QStringLiteral("status")).toString(), m_controller.activeUser());
    return reply;
}

QJsonObject TriggerServer::handleStop()
{
    const QString status = m_controller.close() ? QStringLiteral("closed") : QStringLiteral("not running");
    qCInfo(lcTriggerServer) << "stop-vision:" << status;
    Q_EMIT stopHandled(status);
    return QJsonObject{{QStringLiteral("status"), status}};
}

QJsonObject TriggerServer::statusObject() const
{
    return QJsonObject{
        {QStringLiteral("running"), m_controller.isRunning()},
        {QStringLiteral("state"), m_controller.stateName()},
        {QStringLiteral("user"), m_controller.activeUser()},
    };
}

void TriggerServer::registerRoutes()
{
    using Method = QHttpServerRequest::Method;

    m_server->route(QStringLiteral("/start-vision"), Method::Post, [this](const QHttpServerRequest& request) {
        const QJsonObject reply = handleStart(extractMobile(request.body()));
        if (reply.contains(QStringLiteral("error")))
            return jsonResponse(reply, StatusCode::InternalServerError);
        return jsonResponse(reply);
    });

    m_server->route(QStringLiteral("/stop-vision"), Method::Post, [this](const QHttpServerRequest&) {
        return jsonResponse(handleStop());
    });

    m_server->route(QStringLiteral("/vision-context"), Method::Post, [this](const QHttpServerRequest& request) {
        QJsonParseError parseError{};
        const QJsonDocument document = QJsonDocument::fromJson(request.body(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
            qCWarning(lcTriggerServer) << "Odrzucono kontekst: niepoprawny JSON" << parseError.errorString();
            return errorResponse(tr("Niepoprawny JSON kontekstu."), StatusCode::BadRequest);
        }
        QString error;
        if (!m_context.updateFromJson(document.object(), &error))
            return errorResponse(error, StatusCode::BadRequest);
        Q_EMIT contextCached();
        return jsonResponse(QJsonObject{{QStringLiteral("status"), QStringLiteral("cached")}});
    });

    m_server->route(QStringLiteral("/vision-status"), Method::Get, [this](const QHttpServerRequest&) {
        return jsonResponse(statusObject());
    });

    for (const QString& path : {QStringLiteral("/start-vision"), QStringLiteral("/stop-vision"),
                                QStringLiteral("/vision-context"), QStringLiteral("/vision-status")}) {
        m_server->route(path, Method::Options, [](const QHttpServerRequest&) { return preflightResponse(); });
    }

    m_server->addAfterRequestHandler(this, [](const QHttpServerRequest&, QHttpServerResponse& response) {
        QHttpHeaders headers = response.headers();
        headers.replaceOrAppend(QByteArrayLiteral("Access-Control-Allow-Origin"), QByteArrayLiteral("*"));
        headers.replaceOrAppend(QByteArrayLiteral("Access-Control-Allow-Headers"), QByteArrayLiteral("Content-Type"));
        headers.replaceOrAppend(QByteArrayLiteral("Access-Control-Allow-Methods"),
                                QByteArrayLiteral("GET, POST, OPTIONS"));
        response.setHeaders(std::move(headers));
    });
}
