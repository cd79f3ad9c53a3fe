#pragma once

#include <QString>

class QScreen;

namespace vision::companion::utils {

//! Screen whose name matches (or contains) @p preferredName, otherwise the primary screen.
QScreen* resolvePreferredScreen(const QString& preferredName, bool* matched = nullptr);

} // namespace vision::companion::utils
