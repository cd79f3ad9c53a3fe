#include "ScreenCapturer.hpp"

#include <QBuffer>
#include <QIODevice>
#include <QLoggingCategory>
#include <QObject>
#include <QPixmap>
#include <QScreen>

#include "utils/ScreenUtils.hpp"

Q_LOGGING_CATEGORY(lcScreenCapturer, "vision.companion.capture.screen")

ScreenCapturerInterface::CaptureResult ScreenCapturer::capture()
{
    CaptureResult result;

    QScreen* screen = vision::companion::utils::resolvePreferredScreen(m_preferredScreenName);
    if (!screen) {
        result.errorMessage = QObject::tr("Brak dostępnego ekranu do przechwycenia.");
        qCWarning(lcScreenCapturer) << result.errorMessage;
        return result;
    }

    const QPixmap pixmap = screen->grabWindow(0);
    if (pixmap.isNull()) {
        result.errorMessage = QObject::tr("Ekran %1 zwrócił pusty obraz.").arg(screen->name());
        qCWarning(lcScreenCapturer) << result.errorMessage;
        return result;
    }

    QBuffer buffer(&result.pngBytes);
    if (!buffer.open(QIODevice::WriteOnly) || !pixmap.save(&buffer, "PNG")) {
        result.pngBytes.clear();
        result.errorMessage = QObject::tr("Nie udało się zakodować zrzutu ekranu do PNG.");
        qCWarning(lcScreenCapturer) << result.errorMessage;
        return result;
    }

    qCInfo(lcScreenCapturer) << "Przechwycono ekran" << screen->name() << pixmap.size()
                             << "- bajtów PNG:" << result.pngBytes.size();
    return result;
}
