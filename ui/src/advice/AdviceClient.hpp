#pragma once

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QUrl>

#include <functional>

struct AdviceRequest {
    QString imageBase64;
    QString userContext;
    QString mobileNumber;
};

struct AdviceResult {
    bool    ok = false;
    bool    hasAdvice = false;
    QString advice;
    int     httpStatus = 0;
    QString errorMessage;
};

class AdviceClientInterface {
public:
    using Callback = std::function<void(const AdviceResult&)>;

    virtual ~AdviceClientInterface() = default;

    virtual void setEndpoint(const QUrl& endpoint) = 0;
    virtual QUrl endpoint() const = 0;

    // Callback wywoływany dokładnie raz, w wątku GUI.
    virtual void requestAdvice(const AdviceRequest& request, Callback callback) = 0;
};

class AdviceClient final : public QObject, public AdviceClientInterface {
    Q_OBJECT
public:
    static constexpr int kErrorExcerptLength = 200;

    explicit AdviceClient(QObject* parent = nullptr);
    ~AdviceClient() override;

    void setEndpoint(const QUrl& endpoint) override;
    QUrl endpoint() const override { return m_endpoint; }

    void requestAdvice(const AdviceRequest& request, Callback callback) override;

    static QByteArray buildPayload(const AdviceRequest& request);
    static AdviceResult interpretResponse(int httpStatus,
                                          const QByteArray& body,
                                          bool transportFailed,
                                          const QString& transportError);

private:
    QNetworkAccessManager m_network;
    QUrl                  m_endpoint;
};
