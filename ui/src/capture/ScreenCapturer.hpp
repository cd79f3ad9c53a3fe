#pragma once

#include <QByteArray>
#include <QString>

class ScreenCapturerInterface {
public:
    struct CaptureResult {
        QByteArray pngBytes;
        QString    errorMessage;
    };

    virtual ~ScreenCapturerInterface() = default;

    virtual CaptureResult capture() = 0;
};

/**
 * @brief Zrzut całego ekranu (QScreen::grabWindow) kodowany do PNG.
 *
 * Musi być wywoływany z wątku GUI.
 */
class ScreenCapturer final : public ScreenCapturerInterface {
public:
    ScreenCapturer() = default;

    void setPreferredScreenName(const QString& name) { m_preferredScreenName = name.trimmed(); }
    QString preferredScreenName() const { return m_preferredScreenName; }

    CaptureResult capture() override;

private:
    QString m_preferredScreenName;
};
