#include "OverlayChannel.hpp"

#include <QLoggingCategory>

#include "capture/CaptureOrchestrator.hpp"
#include "overlay/WindowController.hpp"

Q_LOGGING_CATEGORY(lcOverlayChannel, "vision.companion.channel")

OverlayChannel::OverlayChannel(WindowController& controller, CaptureOrchestrator& orchestrator, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_orchestrator(orchestrator)
{
}

bool OverlayChannel::send(const QString& command)
{
    Command parsed = Command::ExpandWindow;
    if (!parseCommand(command, &parsed)) {
        qCWarning(lcOverlayChannel) << "Nieznane polecenie kanału nakładki:" << command;
        Q_EMIT commandRejected(command, tr("Nieznane polecenie."));
        return false;
    }
    return dispatch(parsed);
}

bool OverlayChannel::dispatch(Command command)
{
    qCDebug(lcOverlayChannel) << "Polecenie" << commandName(command) << "w stanie" << m_controller.stateName();

    bool accepted = false;
    switch (command) {
    case Command::ExpandWindow:
        // Ponowne rozwinięcie już rozwiniętej nakładki jest dozwolonym no-opem.
        accepted = m_controller.expand()
            || (m_controller.isRunning() && m_controller.state() != OverlayState::Collapsed);
        break;
    case Command::ShrinkWindow:
        m_controller.collapse();
        accepted = true;
        break;
    case Command::MinimizeWindow:
        accepted = m_controller.minimize();
        break;
    case Command::ResetUi:
        accepted = m_controller.reset();
        break;
    case Command::CloseVision:
        // Zamknięcie z wnętrza okna traktujemy tak samo jak zamknięcie przez menedżera okien.
        accepted = m_controller.closeByUser();
        break;
    case Command::RunCycle:
        accepted = m_orchestrator.runCycle();
        break;
    }

    if (!accepted)
        Q_EMIT commandRejected(commandName(command), m_controller.lastError());
    return accepted;
}

QVariantMap OverlayChannel::captureScreen()
{
    const CaptureOrchestrator::CapturePayload payload = m_orchestrator.captureScreen();
    QVariantMap result;
    if (!payload.ok) {
        qCWarning(lcOverlayChannel) << "capture-screen nie powiodło się:" << payload.errorMessage;
        result.insert(QStringLiteral("error"), payload.errorMessage);
        return result;
    }
    qCDebug(lcOverlayChannel) << "capture-screen:" << payload.imageBase64.size() << "znaków base64, prefiks"
                              << payload.imageBase64.left(32);
    result.insert(QStringLiteral("imageBase64"), payload.imageBase64);
    result.insert(QStringLiteral("userContext"), payload.userContext);
    result.insert(QStringLiteral("mobile_number"), payload.mobileNumber);
    return result;
}

bool OverlayChannel::parseCommand(const QString& raw, Command* command)
{
    const QString normalized = raw.trimmed().toLower();
    Command parsed;
    if (normalized == QStringLiteral("expand-window"))
        parsed = Command::ExpandWindow;
    else if (normalized == QStringLiteral("shrink-window"))
        parsed = Command::ShrinkWindow;
    else if (normalized == QStringLiteral("minimize-window"))
        parsed = Command::MinimizeWindow;
    else if (normalized == QStringLiteral("reset-ui"))
        parsed = Command::ResetUi;
    else if (normalized == QStringLiteral("close-vision"))
        parsed = Command::CloseVision;
    else if (normalized == QStringLiteral("run-cycle") || normalized == QStringLiteral("capture"))
        parsed = Command::RunCycle;
    else
        return false;
    if (command)
        *command = parsed;
    return true;
}

QString OverlayChannel::commandName(Command command)
{
    switch (command) {
    case Command::ExpandWindow:
        return QStringLiteral("expand-window");
    case Command::ShrinkWindow:
        return QStringLiteral("shrink-window");
    case Command::MinimizeWindow:
        return QStringLiteral("minimize-window");
    case Command::ResetUi:
        return QStringLiteral("reset-ui");
    case Command::CloseVision:
        return QStringLiteral("close-vision");
    case Command::RunCycle:
        return QStringLiteral("run-cycle");
    }
    return QString();
}

QObject* OverlayChannel::controllerObject() const
{
    return &m_controller;
}

QObject* OverlayChannel::orchestratorObject() const
{
    return &m_orchestrator;
}
