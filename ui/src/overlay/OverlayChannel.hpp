#pragma once

#include <QObject>
#include <QString>
#include <QVariantMap>

class CaptureOrchestrator;
class WindowController;

/**
 * @brief Typowany kanał poleceń pomiędzy powierzchnią QML a logiką nakładki.
 *
 * Dostępny w QML jako `overlayChannel`. Polecenia bez ładunku przyjmuje send(),
 * zrzut diagnostyczny zwraca captureScreen().
 */
class OverlayChannel : public QObject {
    Q_OBJECT
    Q_PROPERTY(QObject* controller READ controllerObject CONSTANT)
    Q_PROPERTY(QObject* orchestrator READ orchestratorObject CONSTANT)

public:
    enum class Command {
        ExpandWindow,
        ShrinkWindow,
        MinimizeWindow,
        ResetUi,
        CloseVision,
        RunCycle,
    };
    Q_ENUM(Command)

    OverlayChannel(WindowController& controller, CaptureOrchestrator& orchestrator, QObject* parent = nullptr);

    Q_INVOKABLE bool send(const QString& command);
    Q_INVOKABLE QVariantMap captureScreen();

    bool dispatch(Command command);

    static bool parseCommand(const QString& raw, Command* command);
    static QString commandName(Command command);

    QObject* controllerObject() const;
    QObject* orchestratorObject() const;

signals:
    void commandRejected(const QString& command, const QString& reason);

private:
    WindowController&    m_controller;
    CaptureOrchestrator& m_orchestrator;
};
