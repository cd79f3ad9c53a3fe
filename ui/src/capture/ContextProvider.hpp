#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <optional>

struct ContextSnapshot {
    QString     netWorthUnits;
    QJsonObject raw;
};

/**
 * @brief Pamięć podręczna kontekstu finansowego wstrzykiwanego przez środowisko hosta.
 *
 * Orkiestrator tylko czyta podsumowanie; zapis odbywa się przez plik startowy albo
 * trasę /vision-context serwera wyzwalającego.
 */
class ContextProvider : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool hasSnapshot READ hasSnapshot NOTIFY snapshotChanged)
    Q_PROPERTY(QString summary READ summary NOTIFY snapshotChanged)

public:
    explicit ContextProvider(QObject* parent = nullptr);

    bool hasSnapshot() const { return m_snapshot.has_value(); }
    std::optional<ContextSnapshot> snapshot() const { return m_snapshot; }

    QString summary() const;

    bool updateFromJson(const QJsonObject& object, QString* errorMessage = nullptr);
    bool loadFromFile(const QString& path, QString* errorMessage = nullptr);
    void clear();

    static QString fallbackSummary();

signals:
    void snapshotChanged();

private:
    std::optional<ContextSnapshot> m_snapshot;
};
