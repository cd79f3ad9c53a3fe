#include "RuntimeUtils.hpp"

#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QObject>

#include <utility>

Q_LOGGING_CATEGORY(lcRuntime, "vision.companion.runtime")

namespace vision::companion::utils {

namespace {

QString runtimeDirectory()
{
    const QByteArray overrideDir = qgetenv("VISION_COMPANION_RUNTIME_DIR");
    if (!overrideDir.isEmpty())
        return expandPath(QString::fromUtf8(overrideDir));
    return expandPath(QStringLiteral("var/runtime"));
}

} // namespace

QString runtimeLockFilePath()
{
    const QByteArray overridePath = qgetenv("VISION_COMPANION_LOCK_FILE");
    if (!overridePath.isEmpty())
        return expandPath(QString::fromUtf8(overridePath));
    return QDir(runtimeDirectory()).filePath(QStringLiteral("vision_companion.lock"));
}

bool ensureLockFileDirectory(const QString& lockPath, QString* errorMessage)
{
    QDir directory = QFileInfo(lockPath).dir();
    if (directory.exists() || directory.mkpath(QStringLiteral(".")))
        return true;
    if (errorMessage) {
        *errorMessage = QObject::tr("Nie udało się utworzyć katalogu blokady instancji (%1).")
                            .arg(directory.absolutePath());
    }
    return false;
}

SingleInstanceGuard::SingleInstanceGuard(QString lockFilePath)
    : m_lockFile(std::move(lockFilePath))
{
    m_lockFile.setStaleLockTime(0);
}

SingleInstanceGuard::~SingleInstanceGuard() = default;

bool SingleInstanceGuard::tryAcquire(int timeoutMs)
{
    m_error.clear();
    m_conflict = {};
    m_locked = false;
    m_lastError = QLockFile::NoError;

    if (m_lockFile.tryLock(timeoutMs)) {
        m_locked = true;
        return true;
    }

    m_lastError = m_lockFile.error();
    switch (m_lastError) {
    case QLockFile::LockFailedError:
        if (m_lockFile.removeStaleLockFile() && m_lockFile.tryLock(timeoutMs)) {
            qCInfo(lcRuntime) << "Usunięto nieaktualną blokadę" << m_lockFile.fileName();
            m_locked = true;
            m_lastError = QLockFile::NoError;
            return true;
        }
        m_error = QObject::tr("Vision Companion jest już uruchomiony.");
        m_lockFile.getLockInfo(&m_conflict.pid, &m_conflict.hostname, &m_conflict.applicationId);
        break;
    case QLockFile::PermissionError:
        m_error = QObject::tr("Brak uprawnień do utworzenia blokady instancji.");
        break;
    default:
        m_error = QObject::tr("Nieoczekiwany błąd blokady instancji.");
        break;
    }
    qCWarning(lcRuntime) << m_error << m_lockFile.fileName();
    return false;
}

} // namespace vision::companion::utils
