#include "ScreenUtils.hpp"

#include <QGuiApplication>
#include <QList>
#include <QScreen>

namespace vision::companion::utils {

QScreen* resolvePreferredScreen(const QString& preferredName, bool* matched)
{
    if (matched)
        *matched = false;

    const QList<QScreen*> screens = QGuiApplication::screens();
    if (screens.isEmpty())
        return nullptr;

    const QString normalized = preferredName.trimmed().toLower();
    if (!normalized.isEmpty()) {
        for (QScreen* screen : screens) {
            if (!screen)
                continue;
            const QString screenName = screen->name();
            if (screenName.compare(normalized, Qt::CaseInsensitive) == 0
                || screenName.toLower().contains(normalized)) {
                if (matched)
                    *matched = true;
                return screen;
            }
        }
    }

    if (auto* primary = QGuiApplication::primaryScreen())
        return primary;
    return screens.constFirst();
}

} // namespace vision::companion::utils
