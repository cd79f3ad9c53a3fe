#include "AdviceClient.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <utility>

Q_LOGGING_CATEGORY(lcAdviceClient, "vision.companion.advice")

AdviceClient::AdviceClient(QObject* parent)
    : QObject(parent)
{
}

AdviceClient::~AdviceClient() = default;

void AdviceClient::setEndpoint(const QUrl& endpoint)
{
    m_endpoint = endpoint;
}

void AdviceClient::requestAdvice(const AdviceRequest& request, Callback callback)
{
    if (!m_endpoint.isValid() || m_endpoint.scheme().isEmpty()) {
        AdviceResult result;
        result.errorMessage = tr("Invalid advice endpoint: %1").arg(m_endpoint.toString());
        qCWarning(lcAdviceClient) << result.errorMessage;
        if (callback)
            callback(result);
        return;
    }

    QNetworkRequest networkRequest(m_endpoint);
    networkRequest.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    networkRequest.setTransferTimeout(0);

    const QByteArray payload = buildPayload(request);
    qCInfo(lcAdviceClient) << "Wysyłam żądanie porady dla użytkownika" << request.mobileNumber
                           << "do" << m_endpoint.toString() << "- bajtów:" << payload.size();
    qCDebug(lcAdviceClient) << "Kontekst:" << request.userContext.left(kErrorExcerptLength)
                            << "obraz:" << request.imageBase64.left(80);

    QNetworkReply* reply = m_network.post(networkRequest, payload);
    connect(reply, &QNetworkReply::finished, this, [reply, callback = std::move(callback)]() {
        reply->deleteLater();
        const QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        const int status = statusAttribute.isValid() ? statusAttribute.toInt() : 0;
        const bool transportFailed = reply->error() != QNetworkReply::NoError;
        const AdviceResult result = interpretResponse(status, reply->readAll(), transportFailed, reply->errorString());
        if (result.ok) {
            qCInfo(lcAdviceClient) << "Odpowiedź porady HTTP" << status
                                   << (result.hasAdvice ? "z treścią" : "bez treści");
        } else {
            qCWarning(lcAdviceClient) << "Żądanie porady nie powiodło się:" << result.errorMessage;
        }
        if (callback)
            callback(result);
    });
}

QByteArray AdviceClient::buildPayload(const AdviceRequest& request)
{
    QJsonObject object;
    object.insert(QStringLiteral("image_base64"), request.imageBase64);
    object.insert(QStringLiteral("user_context"), request.userContext);
    object.insert(QStringLiteral("mobile_number"), request.mobileNumber);
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

AdviceResult AdviceClient::interpretResponse(int httpStatus,
                                             const QByteArray& body,
                                             bool transportFailed,
                                             const QString& transportError)
{
    AdviceResult result;
    result.httpStatus = httpStatus;

    if (httpStatus == 0) {
        result.errorMessage = QStringLiteral("Network error: %1")
                                  .arg(transportError.isEmpty() ? QStringLiteral("no response") : transportError);
        return result;
    }
    if (httpStatus < 200 || httpStatus >= 300) {
        result.errorMessage = QStringLiteral("API Error %1: %2")
                                  .arg(httpStatus)
                                  .arg(QString::fromUtf8(body).left(kErrorExcerptLength));
        return result;
    }
    if (transportFailed) {
        result.errorMessage = QStringLiteral("Network error: %1").arg(transportError);
        return result;
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        result.errorMessage = QStringLiteral("Invalid advice response: %1")
                                  .arg(QString::fromUtf8(body).left(kErrorExcerptLength));
        return result;
    }

    const QJsonValue advice = document.object().value(QStringLiteral("advice"));
    if (!advice.isUndefined() && !advice.isNull() && !advice.isString()) {
        result.errorMessage = QStringLiteral("Invalid advice response: advice is not a string");
        return result;
    }

    result.ok = true;
    result.advice = advice.toString();
    result.hasAdvice = !result.advice.trimmed().isEmpty();
    return result;
}
