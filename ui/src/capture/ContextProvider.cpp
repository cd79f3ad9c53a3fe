#include "ContextProvider.hpp"

#include <QFile>
#include <QIODevice>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLoggingCategory>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcContextProvider, "vision.companion.context")

namespace {

QString unitsToString(const QJsonValue& value)
{
    if (value.isString())
        return value.toString().trimmed();
    if (value.isDouble())
        return QString::number(value.toDouble(), 'f', 0);
    return {};
}

} // namespace

ContextProvider::ContextProvider(QObject* parent)
    : QObject(parent)
{
}

QString ContextProvider::summary() const
{
    if (!m_snapshot)
        return fallbackSummary();
    const QString units = m_snapshot->netWorthUnits.isEmpty() ? QStringLiteral("N/A") : m_snapshot->netWorthUnits;
    return QStringLiteral("User financials: net worth ₹%1").arg(units);
}

bool ContextProvider::updateFromJson(const QJsonObject& object, QString* errorMessage)
{
    const QJsonValue netWorth = object.value(QStringLiteral("netWorth"));
    if (!netWorth.isUndefined() && !netWorth.isNull() && !netWorth.isObject()) {
        if (errorMessage)
            *errorMessage = tr("Pole netWorth musi być obiektem.");
        qCWarning(lcContextProvider) << "Odrzucono kontekst finansowy: netWorth nie jest obiektem";
        return false;
    }

    ContextSnapshot snapshot;
    snapshot.raw = object;
    snapshot.netWorthUnits = unitsToString(netWorth.toObject()
                                               .value(QStringLiteral("totalNetWorthValue"))
                                               .toObject()
                                               .value(QStringLiteral("units")));
    m_snapshot = snapshot;
    qCInfo(lcContextProvider) << "Zaktualizowano kontekst finansowy (net worth:"
                              << (snapshot.netWorthUnits.isEmpty() ? QStringLiteral("N/A") : snapshot.netWorthUnits)
                              << ")";
    Q_EMIT snapshotChanged();
    return true;
}

bool ContextProvider::loadFromFile(const QString& path, QString* errorMessage)
{
    const QString expanded = vision::companion::utils::expandPath(path);
    QFile file(expanded);
    if (!file.exists()) {
        if (errorMessage)
            *errorMessage = tr("Plik kontekstu %1 nie istnieje.").arg(expanded);
        qCWarning(lcContextProvider) << "Plik kontekstu nie istnieje:" << expanded;
        return false;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage)
            *errorMessage = tr("Nie można odczytać pliku kontekstu %1: %2").arg(expanded, file.errorString());
        qCWarning(lcContextProvider) << "Nie można odczytać pliku kontekstu" << expanded << file.errorString();
        return false;
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (errorMessage)
            *errorMessage = tr("Niepoprawny JSON kontekstu %1: %2").arg(expanded, parseError.errorString());
        qCWarning(lcContextProvider) << "Niepoprawny JSON kontekstu" << expanded << parseError.errorString();
        return false;
    }
    return updateFromJson(document.object(), errorMessage);
}

void ContextProvider::clear()
{
    if (!m_snapshot)
        return;
    m_snapshot.reset();
    Q_EMIT snapshotChanged();
}

QString ContextProvider::fallbackSummary()
{
    return QStringLiteral("User viewed this screen. Provide financial advice.");
}
