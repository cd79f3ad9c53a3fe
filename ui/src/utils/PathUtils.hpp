#pragma once

#include <QString>

namespace vision::companion::utils {

//! Expand $VAR, ${VAR}, %VAR%, '~' and file: URLs; relative paths resolve against the working directory.
QString expandPath(const QString& path);

} // namespace vision::companion::utils
