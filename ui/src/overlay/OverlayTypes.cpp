#include "OverlayTypes.hpp"

QString overlayStateName(OverlayState state)
{
    switch (state) {
    case OverlayState::Collapsed:
        return QStringLiteral("collapsed");
    case OverlayState::Expanded:
        return QStringLiteral("expanded");
    case OverlayState::Capturing:
        return QStringLiteral("capturing");
    case OverlayState::Displaying:
        return QStringLiteral("displaying");
    }
    return QStringLiteral("unknown");
}

CaptureOutcome CaptureOutcome::success(const QString& adviceText)
{
    CaptureOutcome outcome;
    outcome.kind = Kind::Success;
    outcome.text = adviceText;
    return outcome;
}

CaptureOutcome CaptureOutcome::noAdvice()
{
    CaptureOutcome outcome;
    outcome.kind = Kind::Success;
    outcome.text = QStringLiteral("No response from AI.");
    outcome.contentGap = true;
    return outcome;
}

CaptureOutcome CaptureOutcome::failure(const QString& reason)
{
    CaptureOutcome outcome;
    outcome.kind = Kind::Failure;
    outcome.text = reason;
    return outcome;
}

OverlayPresentation presentationFor(OverlayState state, const OverlayGeometry& geometry)
{
    OverlayPresentation presentation;
    switch (state) {
    case OverlayState::Collapsed:
        presentation.windowSize = geometry.collapsedSize;
        break;
    case OverlayState::Expanded:
        presentation.windowSize = geometry.expandedSize;
        presentation.iconVisible = false;
        presentation.controlsVisible = true;
        presentation.captureEnabled = true;
        break;
    case OverlayState::Capturing:
        presentation.windowSize = geometry.expandedSize;
        presentation.iconVisible = false;
        presentation.controlsVisible = true;
        presentation.loaderVisible = true;
        break;
    case OverlayState::Displaying:
        presentation.windowSize = geometry.expandedSize;
        presentation.iconVisible = false;
        presentation.controlsVisible = true;
        presentation.resultVisible = true;
        break;
    }
    return presentation;
}
