#pragma once

#include <QObject>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

#include "overlay/OverlayTypes.hpp"
#include "overlay/OverlayWindow.hpp"

/**
 * @brief Jedyny właściciel okna nakładki, stanu OverlayState, ActiveUser i bieżącej sesji
 *        przechwytywania.
 *
 * Każde przejście najpierw stosuje geometrię okna (presentationFor), a dopiero potem
 * publikuje nowy stan – obserwator nie zobaczy stanu bez odpowiadającej mu geometrii.
 */
class WindowController : public QObject {
    Q_OBJECT
    Q_PROPERTY(OverlayStates::OverlayState state READ state NOTIFY stateChanged)
    Q_PROPERTY(QString stateName READ stateName NOTIFY stateChanged)
    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)
    Q_PROPERTY(QString activeUser READ activeUser NOTIFY activeUserChanged)
    Q_PROPERTY(bool iconVisible READ iconVisible NOTIFY stateChanged)
    Q_PROPERTY(bool controlsVisible READ controlsVisible NOTIFY stateChanged)
    Q_PROPERTY(bool captureEnabled READ captureEnabled NOTIFY stateChanged)
    Q_PROPERTY(bool loaderVisible READ loaderVisible NOTIFY stateChanged)
    Q_PROPERTY(bool resultVisible READ resultVisible NOTIFY stateChanged)
    Q_PROPERTY(QString resultText READ resultText NOTIFY resultChanged)
    Q_PROPERTY(QString resultHtml READ resultHtml NOTIFY resultChanged)
    Q_PROPERTY(bool resultIsError READ resultIsError NOTIFY resultChanged)

public:
    using WindowFactory = std::function<std::unique_ptr<OverlayWindowInterface>()>;

    enum class OpenResult {
        Launched,
        Focused,
        Failed,
    };

    explicit WindowController(QObject* parent = nullptr);
    ~WindowController() override;

    void setWindowFactory(WindowFactory factory);
    void setGeometry(const OverlayGeometry& geometry);
    OverlayGeometry geometry() const { return m_geometry; }

    // Cykl życia instancji
    OpenResult open(const QString& userId, QString* errorMessage = nullptr);
    bool focus();
    bool close();
    bool closeByUser();
    bool isRunning() const { return static_cast<bool>(m_window); }

    // Przejścia stanu
    bool expand();
    void collapse();
    quint64 beginCapture();
    bool recordCapture(quint64 sessionId, const QByteArray& imageBytes, const QString& context);
    bool showResult(quint64 sessionId, const CaptureOutcome& outcome);
    bool minimize();
    bool reset();

    OverlayState state() const { return m_state; }
    QString stateName() const { return overlayStateName(m_state); }
    OverlayPresentation presentation() const { return presentationFor(m_state, m_geometry); }

    QString activeUser() const;
    bool hasBoundUser() const { return !m_activeUser.isEmpty(); }

    bool iconVisible() const { return presentation().iconVisible; }
    bool controlsVisible() const { return presentation().controlsVisible; }
    bool captureEnabled() const { return presentation().captureEnabled; }
    bool loaderVisible() const { return presentation().loaderVisible; }
    bool resultVisible() const { return presentation().resultVisible; }

    QString resultText() const;
    QString resultHtml() const;
    bool resultIsError() const;

    const std::optional<CaptureSession>& session() const { return m_session; }
    QString lastError() const { return m_lastError; }

    static QString unknownUser() { return QStringLiteral("unknown"); }

signals:
    void stateChanged(OverlayStates::OverlayState state);
    void runningChanged(bool running);
    void activeUserChanged();
    void resultChanged();
    void transitionRejected(const QString& operation, OverlayStates::OverlayState state);
    void closedByUser();

private:
    void applyState(OverlayState next);
    void rejectTransition(const QString& operation);
    void clearSession();
    void clearInstanceState();
    void handleWindowClosed(OverlayWindowInterface* window);

    WindowFactory                           m_factory;
    std::unique_ptr<OverlayWindowInterface> m_window;
    OverlayGeometry                         m_geometry;
    OverlayState                            m_state = OverlayState::Collapsed;
    QString                                 m_activeUser;
    std::optional<CaptureSession>           m_session;
    quint64                                 m_nextSessionId = 1;
    QString                                 m_lastError;
};
