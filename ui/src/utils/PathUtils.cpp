#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrl>

namespace {

QString lookupVariable(const QString& name, const QString& original)
{
    const QByteArray key = name.toUtf8();
    if (name.isEmpty() || !qEnvironmentVariableIsSet(key.constData()))
        return original;
    return qEnvironmentVariable(key.constData());
}

QString expandEnvironmentVariables(const QString& input)
{
    static const QRegularExpression pattern(
        QStringLiteral(R"(\$\{([A-Za-z0-9_]+)\}|\$([A-Za-z0-9_]+)|%([A-Za-z0-9_]+)%)"));

    QString result;
    result.reserve(input.size());
    qsizetype cursor = 0;
    auto it = pattern.globalMatch(input);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        result.append(input.mid(cursor, match.capturedStart() - cursor));
        QString name = match.captured(1);
        if (name.isEmpty())
            name = match.captured(2);
        if (name.isEmpty())
            name = match.captured(3);
        result.append(lookupVariable(name, match.captured(0)));
        cursor = match.capturedEnd();
    }
    result.append(input.mid(cursor));
    return result;
}

} // namespace

namespace vision::companion::utils {

QString expandPath(const QString& path)
{
    if (path.trimmed().isEmpty())
        return {};

    QString expanded = expandEnvironmentVariables(path.trimmed());

    if (expanded.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive)) {
        const QUrl url(expanded);
        if (url.isValid() && url.isLocalFile())
            expanded = url.toLocalFile();
    }

    if (expanded == QStringLiteral("~"))
        expanded = QDir::homePath();
    else if (expanded.startsWith(QStringLiteral("~/")))
        expanded = QDir::homePath() + expanded.mid(1);

    if (!QFileInfo(expanded).isAbsolute())
        expanded = QDir::current().absoluteFilePath(expanded);

    return QDir::cleanPath(expanded);
}

} // namespace vision::companion::utils
