#include "WindowController.hpp"

#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcWindowController, "vision.companion.window")

WindowController::WindowController(QObject* parent)
    : QObject(parent)
{
}

WindowController::~WindowController() = default;

void WindowController::setWindowFactory(WindowFactory factory)
{
    m_factory = std::move(factory);
}

void WindowController::setGeometry(const OverlayGeometry& geometry)
{
    OverlayGeometry sanitized = geometry;
    if (!sanitized.collapsedSize.isValid() || sanitized.collapsedSize.isEmpty())
        sanitized.collapsedSize = OverlayGeometry{}.collapsedSize;
    if (!sanitized.expandedSize.isValid() || sanitized.expandedSize.isEmpty())
        sanitized.expandedSize = OverlayGeometry{}.expandedSize;
    m_geometry = sanitized;
    if (m_window)
        m_window->applyPresentation(presentation());
}

WindowController::OpenResult WindowController::open(const QString& userId, QString* errorMessage)
{
    const QString requestedUser = userId.trimmed();

    if (m_window) {
        if (!requestedUser.isEmpty()) {
            if (m_activeUser.isEmpty()) {
                m_activeUser = requestedUser;
                qCInfo(lcWindowController) << "Powiązano użytkownika z działającą nakładką:" << m_activeUser;
                Q_EMIT activeUserChanged();
            } else if (requestedUser != m_activeUser) {
                qCInfo(lcWindowController) << "Nakładka działa już dla użytkownika" << m_activeUser
                                           << "- ignoruję" << requestedUser;
            }
        }
        focus();
        return OpenResult::Focused;
    }

    if (!m_factory) {
        m_lastError = tr("Brak fabryki okna nakładki.");
        if (errorMessage)
            *errorMessage = m_lastError;
        qCCritical(lcWindowController) << m_lastError;
        return OpenResult::Failed;
    }

    std::unique_ptr<OverlayWindowInterface> window = m_factory();
    if (!window) {
        m_lastError = tr("Nie udało się utworzyć okna nakładki.");
        if (errorMessage)
            *errorMessage = m_lastError;
        qCCritical(lcWindowController) << m_lastError;
        return OpenResult::Failed;
    }

    QString loadError;
    if (!window->load(&loadError)) {
        m_lastError = loadError.isEmpty() ? tr("Nie udało się wczytać okna nakładki.") : loadError;
        if (errorMessage)
            *errorMessage = m_lastError;
        qCCritical(lcWindowController) << "Wczytanie okna nakładki nie powiodło się:" << m_lastError;
        return OpenResult::Failed;
    }

    OverlayWindowInterface* raw = window.get();
    window->setClosedHandler([this, raw]() {
        QMetaObject::invokeMethod(this, [this, raw]() { handleWindowClosed(raw); }, Qt::QueuedConnection);
    });

    m_window = std::move(window);
    m_activeUser = requestedUser;
    clearSession();
    m_lastError.clear();
    applyState(OverlayState::Collapsed);

    qCInfo(lcWindowController) << "Uruchomiono nakładkę dla użytkownika" << activeUser();
    Q_EMIT runningChanged(true);
    Q_EMIT activeUserChanged();
    return OpenResult::Launched;
}

bool WindowController::focus()
{
    if (!m_window)
        return false;
    m_window->raise();
    return true;
}

bool WindowController::close()
{
    if (!m_window)
        return false;

    qCInfo(lcWindowController) << "Zamykam nakładkę użytkownika" << activeUser();
    std::unique_ptr<OverlayWindowInterface> window = std::move(m_window);
    window.reset();
    clearInstanceState();
    return true;
}

bool WindowController::closeByUser()
{
    if (!m_window)
        return false;
    handleWindowClosed(m_window.get());
    return true;
}

bool WindowController::expand()
{
    if (!m_window) {
        rejectTransition(QStringLiteral("expand"));
        return false;
    }
    if (m_state != OverlayState::Collapsed) {
        qCDebug(lcWindowController) << "expand() w stanie" << stateName() << "- brak zmian";
        return false;
    }
    applyState(OverlayState::Expanded);
    return true;
}

void WindowController::collapse()
{
    clearSession();
    applyState(OverlayState::Collapsed);
}

quint64 WindowController::beginCapture()
{
    if (!m_window || m_state != OverlayState::Expanded) {
        rejectTransition(QStringLiteral("beginCapture"));
        return 0;
    }

    CaptureSession session;
    session.id = m_nextSessionId++;
    m_session = session;
    Q_EMIT resultChanged();
    applyState(OverlayState::Capturing);
    qCDebug(lcWindowController) << "Rozpoczęto sesję przechwytywania" << session.id;
    return session.id;
}

bool WindowController::recordCapture(quint64 sessionId, const QByteArray& imageBytes, const QString& context)
{
    if (!m_session || m_session->id != sessionId || m_state != OverlayState::Capturing) {
        qCDebug(lcWindowController) << "Porzucona sesja" << sessionId << "- pomijam dane przechwytywania";
        return false;
    }
    m_session->imageBytes = imageBytes;
    m_session->context = context;
    return true;
}

bool WindowController::showResult(quint64 sessionId, const CaptureOutcome& outcome)
{
    if (m_state != OverlayState::Capturing || !m_session || m_session->id != sessionId) {
        if (m_session && m_session->id == sessionId) {
            rejectTransition(QStringLiteral("showResult"));
        } else {
            qCInfo(lcWindowController) << "Wynik porzuconej sesji" << sessionId << "został odrzucony";
        }
        return false;
    }

    m_session->outcome = outcome;
    m_session->hasOutcome = true;
    Q_EMIT resultChanged();
    applyState(OverlayState::Displaying);
    if (outcome.isSuccess()) {
        qCInfo(lcWindowController) << "Sesja" << sessionId << "zakończona poradą"
                                   << (outcome.contentGap ? "(brak treści)" : "");
    } else {
        qCWarning(lcWindowController) << "Sesja" << sessionId << "zakończona błędem:" << outcome.text;
    }
    return true;
}

bool WindowController::minimize()
{
    if (!m_window)
        return false;
    m_window->minimize();
    return true;
}

bool WindowController::reset()
{
    if (!m_window) {
        rejectTransition(QStringLiteral("reset"));
        return false;
    }

    clearSession();
    QString reloadError;
    if (!m_window->reload(&reloadError)) {
        m_lastError = reloadError.isEmpty() ? tr("Nie udało się przeładować nakładki.") : reloadError;
        qCCritical(lcWindowController) << "Przeładowanie nakładki nie powiodło się:" << m_lastError;
        close();
        return false;
    }
    qCInfo(lcWindowController) << "Przeładowano powierzchnię nakładki";
    applyState(OverlayState::Collapsed);
    return true;
}

QString WindowController::activeUser() const
{
    return m_activeUser.isEmpty() ? unknownUser() : m_activeUser;
}

QString WindowController::resultText() const
{
    if (!m_session || !m_session->hasOutcome)
        return {};
    if (m_session->outcome.isSuccess())
        return m_session->outcome.text;
    return QStringLiteral("An error occurred: %1").arg(m_session->outcome.text);
}

QString WindowController::resultHtml() const
{
    QString html = resultText().toHtmlEscaped();
    html.replace(QStringLiteral("\n\n"), QStringLiteral("<br><br>"));
    html.replace(QLatin1Char('\n'), QStringLiteral("<br>"));
    return html;
}

bool WindowController::resultIsError() const
{
    return m_session && m_session->hasOutcome && !m_session->outcome.isSuccess();
}

void WindowController::applyState(OverlayState next)
{
    if (m_window)
        m_window->applyPresentation(presentationFor(next, m_geometry));
    const bool changed = next != m_state;
    m_state = next;
    if (changed)
        Q_EMIT stateChanged(m_state);
}

void WindowController::rejectTransition(const QString& operation)
{
    m_lastError = m_window
        ? tr("Niedozwolone przejście %1 ze stanu %2.").arg(operation, stateName())
        : tr("Niedozwolone przejście %1: nakładka nie działa.").arg(operation);
    qCWarning(lcWindowController) << "InvalidTransition:" << m_lastError;
    Q_EMIT transitionRejected(operation, m_state);
}

void WindowController::clearSession()
{
    if (!m_session)
        return;
    qCDebug(lcWindowController) << "Czyszczę sesję przechwytywania" << m_session->id;
    m_session.reset();
    Q_EMIT resultChanged();
}

void WindowController::clearInstanceState()
{
    clearSession();
    const bool hadUser = !m_activeUser.isEmpty();
    m_activeUser.clear();
    applyState(OverlayState::Collapsed);
    Q_EMIT runningChanged(false);
    if (hadUser)
        Q_EMIT activeUserChanged();
}

void WindowController::handleWindowClosed(OverlayWindowInterface* window)
{
    if (!m_window || m_window.get() != window)
        return;
    qCInfo(lcWindowController) << "Użytkownik zamknął nakładkę";
    std::unique_ptr<OverlayWindowInterface> closed = std::move(m_window);
    closed.reset();
    clearInstanceState();
    Q_EMIT closedByUser();
}
