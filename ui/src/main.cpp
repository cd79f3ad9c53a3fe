#include <QApplication>
#include <QCommandLineParser>
#include <QGuiApplication>
#include <QMessageBox>
#include <QObject>
#include <QQmlApplicationEngine>
#include <QStringList>
#include <QTextStream>

#include "app/Application.hpp"
#include "utils/RuntimeUtils.hpp"

namespace {

void reportFatal(const QString& message, bool showDialog)
{
    QTextStream(stderr) << message << Qt::endl;
    if (showDialog)
        QMessageBox::critical(nullptr, QObject::tr("Vision Companion"), message);
}

} // namespace

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QGuiApplication::setOrganizationName(QStringLiteral("vision_companion"));
    QGuiApplication::setApplicationName(QStringLiteral("Vision Companion"));
    QGuiApplication::setApplicationVersion(QStringLiteral("0.1.0"));
    // O zakończeniu procesu decyduje Application (polityka keep-alive), nie ostatnie okno.
    QGuiApplication::setQuitOnLastWindowClosed(false);

    const QString platform = QGuiApplication::platformName();
    const bool showDialog = platform.compare(QStringLiteral("offscreen"), Qt::CaseInsensitive) != 0;

    const QString lockPath = vision::companion::utils::runtimeLockFilePath();
    QString directoryError;
    if (!vision::companion::utils::ensureLockFileDirectory(lockPath, &directoryError)) {
        reportFatal(directoryError.isEmpty()
                        ? QObject::tr("Nie udało się przygotować katalogu pliku blokady instancji.")
                        : directoryError,
                    showDialog);
        return EXIT_FAILURE;
    }

    vision::companion::utils::SingleInstanceGuard guard(lockPath);
    if (!guard.tryAcquire()) {
        if (guard.hasConflict()) {
            const auto conflict = guard.conflictInfo();
            QStringList parts;
            if (conflict.pid > 0)
                parts << QObject::tr("PID %1").arg(conflict.pid);
            if (!conflict.hostname.isEmpty())
                parts << QObject::tr("host %1").arg(conflict.hostname);
            if (!conflict.applicationId.isEmpty())
                parts << QObject::tr("aplikacja %1").arg(conflict.applicationId);

            const QString suffix = parts.isEmpty() ? QString() : QStringLiteral(" (%1)").arg(parts.join(QStringLiteral(", ")));
            reportFatal(QObject::tr("Vision Companion jest już uruchomiony%1.").arg(suffix), showDialog);
        } else {
            reportFatal(guard.errorString().isEmpty()
                            ? QObject::tr("Nie udało się zarezerwować blokady instancji (kod błędu %1).").arg(guard.lastError())
                            : guard.errorString(),
                        showDialog);
        }
        return EXIT_FAILURE;
    }

    QQmlApplicationEngine engine;
    Application controller(engine);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Nakładka Vision Companion sterowana z panelu webowego"));
    controller.configureParser(parser);
    parser.process(app);
    if (!controller.applyParser(parser)) {
        reportFatal(QObject::tr("Nieprawidłowa konfiguracja – szczegóły w logu."), showDialog);
        return EXIT_FAILURE;
    }

    QString startError;
    if (!controller.start(&startError)) {
        reportFatal(QObject::tr("Nie udało się uruchomić Vision Companion: %1").arg(startError), showDialog);
        return EXIT_FAILURE;
    }

    const int exitCode = app.exec();
    controller.stop();
    return exitCode;
}
