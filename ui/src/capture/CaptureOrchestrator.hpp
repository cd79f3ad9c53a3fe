#pragma once

#include <QObject>
#include <QString>

#include <memory>

#include "advice/AdviceClient.hpp"
#include "capture/ScreenCapturer.hpp"
#include "overlay/OverlayTypes.hpp"

class ContextProvider;
class WindowController;

/**
 * @brief Jeden cykl zrzut ekranu -> porada.
 *
 * runCycle() i captureScreen() są dozwolone tylko przy działającej nakładce w stanie Expanded.
 * Moduł przechwytywania i klient porad muszą zostać wstrzyknięte przed pierwszym cyklem. Każdy rozpoczęty cykl kończy się
 * dokładnie jednym WindowController::showResult(), niezależnie od gałęzi błędu.
 */
class CaptureOrchestrator : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool busy READ busy NOTIFY busyChanged)

public:
    static constexpr int kDefaultMinimumCaptureBytes = 1000;

    struct CapturePayload {
        bool    ok = false;
        QString imageBase64;
        QString userContext;
        QString mobileNumber;
        QString errorMessage;
    };

    CaptureOrchestrator(WindowController& controller, ContextProvider& context, QObject* parent = nullptr);
    ~CaptureOrchestrator() override;

    void setScreenCapturer(std::shared_ptr<ScreenCapturerInterface> capturer);
    void setAdviceClient(std::shared_ptr<AdviceClientInterface> client);
    std::shared_ptr<AdviceClientInterface> adviceClient() const { return m_adviceClient; }
    std::shared_ptr<ScreenCapturerInterface> screenCapturer() const { return m_capturer; }

    void setMinimumCaptureBytes(int bytes);
    int minimumCaptureBytes() const { return m_minimumCaptureBytes; }

    bool busy() const { return m_pendingSessionId != 0; }

    bool runCycle();
    CapturePayload captureScreen();

    static QString invalidImageMessage();
    static QString captureNotAllowedMessage();
    static QString toDataUrl(const QByteArray& pngBytes);

signals:
    void busyChanged();
    void cycleStarted(quint64 sessionId);
    void cycleFinished(quint64 sessionId, const CaptureOutcome& outcome);

private:
    void performCapture(quint64 sessionId);
    void finish(quint64 sessionId, const CaptureOutcome& outcome);
    bool isValidCapture(const ScreenCapturerInterface::CaptureResult& capture) const;

    WindowController&                        m_controller;
    ContextProvider&                         m_context;
    std::shared_ptr<ScreenCapturerInterface> m_capturer;
    std::shared_ptr<AdviceClientInterface>   m_adviceClient;
    int                                      m_minimumCaptureBytes = kDefaultMinimumCaptureBytes;
    quint64                                  m_pendingSessionId = 0;
};
