#include "CaptureOrchestrator.hpp"

#include <QLoggingCategory>
#include <QPointer>
#include <QTimer>

#include <utility>

#include "capture/ContextProvider.hpp"
#include "overlay/WindowController.hpp"

Q_LOGGING_CATEGORY(lcCapture, "vision.companion.capture")

namespace {

CaptureOutcome outcomeFromAdvice(const AdviceResult& result)
{
    if (!result.ok)
        return CaptureOutcome::failure(result.errorMessage);
    if (!result.hasAdvice)
        return CaptureOutcome::noAdvice();
    return CaptureOutcome::success(result.advice);
}

} // namespace

CaptureOrchestrator::CaptureOrchestrator(WindowController& controller, ContextProvider& context, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_context(context)
{
    connect(&m_controller, &WindowController::stateChanged, this, [this](OverlayState state) {
        if (m_pendingSessionId == 0 || state == OverlayState::Capturing)
            return;
        if (state == OverlayState::Collapsed) {
            qCInfo(lcCapture) << "Porzucono cykl" << m_pendingSessionId << "bez anulowania żądania";
            m_pendingSessionId = 0;
            Q_EMIT busyChanged();
        }
    });
}

CaptureOrchestrator::~CaptureOrchestrator() = default;

void CaptureOrchestrator::setScreenCapturer(std::shared_ptr<ScreenCapturerInterface> capturer)
{
    if (!capturer)
        return;
    m_capturer = std::move(capturer);
}

void CaptureOrchestrator::setAdviceClient(std::shared_ptr<AdviceClientInterface> client)
{
    if (!client)
        return;
    m_adviceClient = std::move(client);
}

void CaptureOrchestrator::setMinimumCaptureBytes(int bytes)
{
    m_minimumCaptureBytes = qMax(1, bytes);
}

bool CaptureOrchestrator::runCycle()
{
    const quint64 sessionId = m_controller.beginCapture();
    if (sessionId == 0) {
        qCWarning(lcCapture) << "runCycle() odrzucone:" << m_controller.lastError();
        return false;
    }

    m_pendingSessionId = sessionId;
    Q_EMIT busyChanged();
    Q_EMIT cycleStarted(sessionId);

    // Zrzut w kolejnym obrocie pętli – najpierw wyrenderuje się stan Capturing.
    QTimer::singleShot(0, this, [this, sessionId]() { performCapture(sessionId); });
    return true;
}

CaptureOrchestrator::CapturePayload CaptureOrchestrator::captureScreen()
{
    CapturePayload payload;
    if (!m_controller.isRunning() || m_controller.state() != OverlayState::Expanded) {
        payload.errorMessage = captureNotAllowedMessage();
        qCWarning(lcCapture) << "capture-screen odrzucone w stanie" << m_controller.stateName()
                             << (m_controller.isRunning() ? "" : "(nakładka nie działa)");
        return payload;
    }
    if (!m_capturer) {
        payload.errorMessage = QStringLiteral("Error during capture.");
        qCWarning(lcCapture) << "Brak skonfigurowanego modułu przechwytywania ekranu";
        return payload;
    }

    const ScreenCapturerInterface::CaptureResult capture = m_capturer->capture();
    if (!isValidCapture(capture)) {
        payload.errorMessage = QStringLiteral("Error during capture.");
        return payload;
    }
    payload.ok = true;
    payload.imageBase64 = toDataUrl(capture.pngBytes);
    payload.userContext = m_context.summary();
    payload.mobileNumber = m_controller.activeUser();
    return payload;
}

QString CaptureOrchestrator::invalidImageMessage()
{
    return QStringLiteral("capture produced invalid/empty image data");
}

QString CaptureOrchestrator::captureNotAllowedMessage()
{
    return QStringLiteral("Capture is only available while the overlay is expanded.");
}

QString CaptureOrchestrator::toDataUrl(const QByteArray& pngBytes)
{
    return QStringLiteral("data:image/png;base64,") + QString::fromLatin1(pngBytes.toBase64());
}

void CaptureOrchestrator::performCapture(quint64 sessionId)
{
    if (sessionId != m_pendingSessionId) {
        qCDebug(lcCapture) << "Cykl" << sessionId << "porzucony przed przechwyceniem";
        return;
    }
    if (!m_capturer || !m_adviceClient) {
        qCCritical(lcCapture) << "Orkiestrator bez modułu przechwytywania lub klienta porad";
        finish(sessionId, CaptureOutcome::failure(QStringLiteral("capture pipeline is not configured")));
        return;
    }

    const ScreenCapturerInterface::CaptureResult capture = m_capturer->capture();
    if (!isValidCapture(capture)) {
        finish(sessionId, CaptureOutcome::failure(invalidImageMessage()));
        return;
    }

    const QString context = m_context.summary();
    m_controller.recordCapture(sessionId, capture.pngBytes, context);

    AdviceRequest request;
    request.imageBase64 = toDataUrl(capture.pngBytes);
    request.userContext = context;
    request.mobileNumber = m_controller.activeUser();

    QPointer<CaptureOrchestrator> guard(this);
    m_adviceClient->requestAdvice(request, [guard, sessionId](const AdviceResult& result) {
        if (!guard)
            return;
        guard->finish(sessionId, outcomeFromAdvice(result));
    });
}

void CaptureOrchestrator::finish(quint64 sessionId, const CaptureOutcome& outcome)
{
    if (sessionId != m_pendingSessionId) {
        qCInfo(lcCapture) << "Odrzucam wynik porzuconego cyklu" << sessionId;
        return;
    }
    m_pendingSessionId = 0;
    m_controller.showResult(sessionId, outcome);
    Q_EMIT busyChanged();
    Q_EMIT cycleFinished(sessionId, outcome);
}

bool CaptureOrchestrator::isValidCapture(const ScreenCapturerInterface::CaptureResult& capture) const
{
    if (capture.pngBytes.isEmpty()) {
        qCWarning(lcCapture) << "Pusty zrzut ekranu" << capture.errorMessage;
        return false;
    }
    if (capture.pngBytes.size() < m_minimumCaptureBytes) {
        qCWarning(lcCapture) << "Zrzut ekranu zbyt mały:" << capture.pngBytes.size() << "bajtów (minimum"
                             << m_minimumCaptureBytes << ")";
        return false;
    }
    return true;
}
