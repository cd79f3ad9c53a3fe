#pragma once

#include <QCommandLineParser>
#include <QHostAddress>
#include <QObject>
#include <QQmlApplicationEngine>
#include <QSize>
#include <QString>
#include <QUrl>

#include <memory>
#include <optional>

#include "advice/AdviceClient.hpp"
#include "capture/CaptureOrchestrator.hpp"
#include "capture/ContextProvider.hpp"
#include "capture/ScreenCapturer.hpp"
#include "overlay/OverlayChannel.hpp"
#include "overlay/WindowController.hpp"
#include "server/TriggerServer.hpp"

/**
 * @brief Korzeń procesu towarzyszącego.
 *
 * Posiada kontroler okna, serwer wyzwalający, kanał nakładki i orkiestrator przechwytywania,
 * stosuje konfigurację z wiersza poleceń oraz politykę zakończenia procesu.
 */
class Application : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool keepAlive READ keepAlive NOTIFY configurationChanged)
    Q_PROPERTY(int triggerPort READ triggerPort NOTIFY configurationChanged)

public:
    explicit Application(QQmlApplicationEngine& engine, QObject* parent = nullptr);
    ~Application() override;

    void configureParser(QCommandLineParser& parser) const;
    bool applyParser(const QCommandLineParser& parser);

    bool start(QString* errorMessage = nullptr);
    void stop();

    static std::optional<QSize> parseSize(const QString& text);
    static QUrl defaultAdviceEndpoint();
    static bool defaultKeepAlive();

    QString initialUser() const { return m_initialUser; }
    QHostAddress triggerHost() const { return m_triggerHost; }
    int triggerPort() const { return m_triggerPort; }
    QUrl adviceEndpoint() const { return m_adviceClient->endpoint(); }
    QString contextFile() const { return m_contextFile; }
    QString captureScreenName() const { return m_screenCapturer->preferredScreenName(); }
    bool deferWindow() const { return m_deferWindow; }
    bool keepAlive() const { return m_keepAlive; }
    void setKeepAlive(bool enabled);

    void setOverlaySource(const QUrl& source) { m_overlaySource = source; }
    QUrl overlaySource() const { return m_overlaySource; }

    WindowController& windowController() { return m_controller; }
    ContextProvider& contextProvider() { return m_context; }
    CaptureOrchestrator& captureOrchestrator() { return m_orchestrator; }
    OverlayChannel& overlayChannel() { return m_channel; }
    TriggerServer& triggerServer() { return m_triggerServer; }

signals:
    void configurationChanged();
    void quitRequested();

private:
    void exposeToQml();
    void handleClosedByUser();
    void handleApplicationStateChanged(Qt::ApplicationState state);

    QQmlApplicationEngine&          m_engine;
    WindowController                m_controller;
    ContextProvider                 m_context;
    CaptureOrchestrator             m_orchestrator;
    OverlayChannel                  m_channel;
    TriggerServer                   m_triggerServer;
    std::shared_ptr<ScreenCapturer> m_screenCapturer;
    std::shared_ptr<AdviceClient>   m_adviceClient;

    QUrl         m_overlaySource{QStringLiteral("qrc:/qml/main.qml")};
    QString      m_initialUser;
    QHostAddress m_triggerHost{QHostAddress::LocalHost};
    int          m_triggerPort = TriggerServer::kDefaultPort;
    QString      m_contextFile;
    bool         m_deferWindow = false;
    bool         m_keepAlive = defaultKeepAlive();
    bool         m_started = false;
};
