#pragma once

#include <QByteArray>
#include <QMetaType>
#include <QObject>
#include <QSize>
#include <QString>

namespace OverlayStates {
Q_NAMESPACE

enum class OverlayState {
    Collapsed,
    Expanded,
    Capturing,
    Displaying,
};
Q_ENUM_NS(OverlayState)

} // namespace OverlayStates

using OverlayState = OverlayStates::OverlayState;

QString overlayStateName(OverlayState state);

struct CaptureOutcome {
    enum class Kind {
        Success,
        Failure,
    };

    Kind    kind = Kind::Failure;
    QString text;
    // Sukces bez treści porady (placeholder zamiast błędu).
    bool    contentGap = false;

    bool isSuccess() const { return kind == Kind::Success; }

    static CaptureOutcome success(const QString& adviceText);
    static CaptureOutcome noAdvice();
    static CaptureOutcome failure(const QString& reason);
};

struct CaptureSession {
    quint64    id = 0;
    QByteArray imageBytes;
    QString    context;
    bool       hasOutcome = false;
    CaptureOutcome outcome;

    qsizetype byteLength() const { return imageBytes.size(); }
};

// Wygląd okna wyliczany wyłącznie ze stanu nakładki.
struct OverlayPresentation {
    QSize windowSize;
    bool  iconVisible = true;
    bool  controlsVisible = false;
    bool  captureEnabled = false;
    bool  loaderVisible = false;
    bool  resultVisible = false;

    bool operator==(const OverlayPresentation& other) const
    {
        return windowSize == other.windowSize && iconVisible == other.iconVisible
            && controlsVisible == other.controlsVisible && captureEnabled == other.captureEnabled
            && loaderVisible == other.loaderVisible && resultVisible == other.resultVisible;
    }
};

struct OverlayGeometry {
    QSize collapsedSize{80, 80};
    QSize expandedSize{380, 520};
};

OverlayPresentation presentationFor(OverlayState state, const OverlayGeometry& geometry);

Q_DECLARE_METATYPE(CaptureOutcome)
