#include "OverlayWindow.hpp"

#include <QColor>
#include <QLoggingCategory>
#include <QQmlComponent>
#include <QQmlEngine>
#include <QQuickWindow>
#include <QScreen>
#include <QWindow>

#include <utility>

#include "utils/ScreenUtils.hpp"

Q_LOGGING_CATEGORY(lcOverlayWindow, "vision.companion.window.quick")

QuickOverlayWindow::QuickOverlayWindow(QQmlEngine& engine, QUrl source, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_source(std::move(source))
{
}

QuickOverlayWindow::~QuickOverlayWindow()
{
    destroyWindow();
}

bool QuickOverlayWindow::load(QString* errorMessage)
{
    if (m_window)
        return true;
    return createWindow(errorMessage);
}

bool QuickOverlayWindow::reload(QString* errorMessage)
{
    destroyWindow();
    m_engine.clearComponentCache();
    return createWindow(errorMessage);
}

void QuickOverlayWindow::applyPresentation(const OverlayPresentation& presentation)
{
    if (!m_window)
        return;
    const QRect target = anchoredGeometry(presentation.windowSize);
    m_window->setMinimumSize(presentation.windowSize);
    m_window->setMaximumSize(presentation.windowSize);
    m_window->setGeometry(target);
    if (!m_window->isVisible())
        m_window->show();
}

void QuickOverlayWindow::raise()
{
    if (!m_window)
        return;
    if (m_window->windowStates().testFlag(Qt::WindowMinimized))
        m_window->setWindowStates(m_window->windowStates() & ~Qt::WindowMinimized);
    m_window->show();
    m_window->raise();
    m_window->requestActivate();
}

void QuickOverlayWindow::minimize()
{
    if (m_window)
        m_window->showMinimized();
}

QSize QuickOverlayWindow::currentSize() const
{
    return m_window ? m_window->size() : QSize();
}

bool QuickOverlayWindow::isMinimized() const
{
    return m_window && m_window->windowStates().testFlag(Qt::WindowMinimized);
}

void QuickOverlayWindow::setClosedHandler(ClosedHandler handler)
{
    m_closedHandler = std::move(handler);
}

bool QuickOverlayWindow::createWindow(QString* errorMessage)
{
    QQmlComponent component(&m_engine, m_source, QQmlComponent::PreferSynchronous);
    if (!component.isReady()) {
        if (errorMessage)
            *errorMessage = component.errorString().trimmed();
        qCWarning(lcOverlayWindow) << "Nie udało się wczytać powierzchni nakładki" << m_source
                                   << component.errorString();
        return false;
    }

    QObject* root = component.create();
    auto* window = qobject_cast<QQuickWindow*>(root);
    if (!window) {
        if (errorMessage)
            *errorMessage = tr("Komponent %1 nie jest oknem QML.").arg(m_source.toString());
        qCWarning(lcOverlayWindow) << "Korzeń komponentu nie jest QQuickWindow" << m_source;
        delete root;
        return false;
    }

    window->setFlags(Qt::Tool | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint);
    window->setColor(Qt::transparent);
    if (QScreen* screen = resolveScreen())
        window->setScreen(screen);

    connect(window, &QQuickWindow::closing, this, [this]() {
        if (m_closedHandler)
            m_closedHandler();
    });

    m_window = window;
    qCDebug(lcOverlayWindow) << "Utworzono okno nakładki" << m_source;
    return true;
}

void QuickOverlayWindow::destroyWindow()
{
    if (!m_window)
        return;
    QQuickWindow* window = m_window;
    m_window.clear();
    window->disconnect(this);
    window->close();
    // Zamknięcie może nastąpić z obsługi przycisku wewnątrz tego okna.
    window->deleteLater();
}

QScreen* QuickOverlayWindow::resolveScreen() const
{
    bool matched = false;
    QScreen* screen = vision::companion::utils::resolvePreferredScreen(m_preferredScreenName, &matched);
    if (!matched && !m_preferredScreenName.trimmed().isEmpty()) {
        qCWarning(lcOverlayWindow) << "Nie znaleziono ekranu o nazwie zawierającej"
                                   << m_preferredScreenName << "- używam ekranu podstawowego.";
    }
    return screen;
}

QRect QuickOverlayWindow::anchoredGeometry(const QSize& size) const
{
    QScreen* screen = m_window ? m_window->screen() : nullptr;
    if (!screen)
        screen = resolveScreen();

    QPoint bottomRight;
    if (m_window && m_window->isVisible()) {
        const QRect current = m_window->geometry();
        bottomRight = current.bottomRight();
    } else if (screen) {
        const QRect available = screen->availableGeometry();
        bottomRight = available.bottomRight() - QPoint(m_screenMargin, m_screenMargin);
    }

    QRect geometry(QPoint(0, 0), size);
    geometry.moveBottomRight(bottomRight);
    if (screen) {
        const QRect available = screen->availableGeometry();
        if (geometry.left() < available.left())
            geometry.moveLeft(available.left());
        if (geometry.top() < available.top())
            geometry.moveTop(available.top());
    }
    return geometry;
}
