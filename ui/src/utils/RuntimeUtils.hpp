#pragma once

#include <QLockFile>
#include <QString>

namespace vision::companion::utils {

struct LockConflictInfo {
    qint64 pid = 0;
    QString hostname;
    QString applicationId;
};

QString runtimeLockFilePath();

bool ensureLockFileDirectory(const QString& lockPath, QString* errorMessage = nullptr);

//! Blokada pliku gwarantująca jeden proces towarzyszący na sesję użytkownika.
class SingleInstanceGuard {
public:
    explicit SingleInstanceGuard(QString lockFilePath);
    SingleInstanceGuard(const SingleInstanceGuard&) = delete;
    SingleInstanceGuard& operator=(const SingleInstanceGuard&) = delete;
    ~SingleInstanceGuard();

    bool tryAcquire(int timeoutMs = 0);
    bool isHeld() const { return m_locked; }
    QString errorString() const { return m_error; }
    LockConflictInfo conflictInfo() const { return m_conflict; }
    bool hasConflict() const { return m_lastError == QLockFile::LockFailedError; }
    QLockFile::LockError lastError() const { return m_lastError; }

private:
    QLockFile m_lockFile;
    QString m_error;
    LockConflictInfo m_conflict;
    bool m_locked = false;
    QLockFile::LockError m_lastError = QLockFile::NoError;
};

} // namespace vision::companion::utils
