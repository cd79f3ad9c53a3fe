#pragma once

#include <QObject>
#include <QPointer>
#include <QRect>
#include <QSize>
#include <QString>
#include <QUrl>

#include <functional>

#include "overlay/OverlayTypes.hpp"

class QQmlEngine;
class QQuickWindow;
class QScreen;

class OverlayWindowInterface {
public:
    using ClosedHandler = std::function<void()>;

    virtual ~OverlayWindowInterface() = default;

    virtual bool load(QString* errorMessage = nullptr) = 0;
    virtual bool reload(QString* errorMessage = nullptr) = 0;

    // Musi zmienić geometrię synchronicznie – kontroler emituje stan dopiero po powrocie.
    virtual void applyPresentation(const OverlayPresentation& presentation) = 0;
    virtual void raise() = 0;
    virtual void minimize() = 0;

    virtual QSize currentSize() const = 0;
    virtual bool isMinimized() const = 0;

    // Wywoływany, gdy użytkownik zamknie okno. Obsługa nie może synchronicznie niszczyć okna.
    virtual void setClosedHandler(ClosedHandler handler) = 0;
};

/**
 * @brief Bezramkowe okno nakładki (zawsze na wierzchu) ładowane z QML.
 *
 * Okno jest kotwiczone prawym dolnym rogiem do dostępnego obszaru ekranu, więc
 * rozwinięcie i zwinięcie nie przesuwa ikony widocznej dla użytkownika.
 */
class QuickOverlayWindow final : public QObject, public OverlayWindowInterface {
    Q_OBJECT
public:
    QuickOverlayWindow(QQmlEngine& engine, QUrl source, QObject* parent = nullptr);
    ~QuickOverlayWindow() override;

    bool load(QString* errorMessage = nullptr) override;
    bool reload(QString* errorMessage = nullptr) override;

    void applyPresentation(const OverlayPresentation& presentation) override;
    void raise() override;
    void minimize() override;

    QSize currentSize() const override;
    bool isMinimized() const override;

    void setClosedHandler(ClosedHandler handler) override;

    void setPreferredScreenName(const QString& name) { m_preferredScreenName = name; }
    void setScreenMargin(int margin) { m_screenMargin = qMax(0, margin); }

    QQuickWindow* quickWindow() const { return m_window; }

private:
    bool createWindow(QString* errorMessage);
    void destroyWindow();
    QScreen* resolveScreen() const;
    QRect anchoredGeometry(const QSize& size) const;

    QQmlEngine&           m_engine;
    QUrl                  m_source;
    QPointer<QQuickWindow> m_window;
    ClosedHandler         m_closedHandler;
    QString               m_preferredScreenName;
    int                   m_screenMargin = 24;
};
