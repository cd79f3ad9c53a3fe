#include "Application.hpp"

#include <QByteArray>
#include <QCommandLineOption>
#include <QCoreApplication>
#include <QGuiApplication>
#include <QLoggingCategory>
#include <QQmlContext>
#include <QRegularExpression>
#include <QTimer>
#include <QtGlobal>

#include <optional>
#include <utility>

#include "overlay/OverlayWindow.hpp"

Q_LOGGING_CATEGORY(lcApp, "vision.companion.app")

namespace {

constexpr char kUserEnv[] = "VISION_COMPANION_USER";
constexpr char kTriggerHostEnv[] = "VISION_COMPANION_TRIGGER_HOST";
constexpr char kTriggerPortEnv[] = "VISION_COMPANION_TRIGGER_PORT";
constexpr char kAdviceEndpointEnv[] = "VISION_COMPANION_ADVICE_ENDPOINT";
constexpr char kMinCaptureBytesEnv[] = "VISION_COMPANION_MIN_CAPTURE_BYTES";
constexpr char kContextFileEnv[] = "VISION_COMPANION_CONTEXT_FILE";
constexpr char kCaptureScreenEnv[] = "VISION_COMPANION_CAPTURE_SCREEN";
constexpr char kKeepAliveEnv[] = "VISION_COMPANION_KEEP_ALIVE";

std::optional<QString> envValue(const QByteArray& key)
{
    if (!qEnvironmentVariableIsSet(key.constData()))
        return std::nullopt;
    return qEnvironmentVariable(key.constData());
}

std::optional<bool> envBool(const QByteArray& key)
{
    const auto valueOpt = envValue(key);
    if (!valueOpt.has_value())
        return std::nullopt;
    const QString normalized = valueOpt->trimmed().toLower();
    if (normalized.isEmpty())
        return std::nullopt;
    if (normalized == QStringLiteral("1") || normalized == QStringLiteral("true") ||
        normalized == QStringLiteral("yes") || normalized == QStringLiteral("on"))
        return true;
    if (normalized == QStringLiteral("0") || normalized == QStringLiteral("false") ||
        normalized == QStringLiteral("no") || normalized == QStringLiteral("off"))
        return false;
    qCWarning(lcApp) << "Nieprawidłowa wartość" << *valueOpt
                     << "w zmiennej" << QString::fromUtf8(key)
                     << "– oczekiwano wartości boolowskiej (true/false).";
    return std::nullopt;
}

// Wartość opcji, a gdy jej nie podano – zmienna środowiskowa.
QString optionOrEnv(const QCommandLineParser& parser, const QString& option, const QByteArray& envKey)
{
    if (parser.isSet(option))
        return parser.value(option).trimmed();
    if (const auto env = envValue(envKey); env.has_value())
        return env->trimmed();
    return {};
}

} // namespace

Application::Application(QQmlApplicationEngine& engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_controller(this)
    , m_context(this)
    , m_orchestrator(m_controller, m_context, this)
    , m_channel(m_controller, m_orchestrator, this)
    , m_triggerServer(m_controller, m_context, this)
    , m_screenCapturer(std::make_shared<ScreenCapturer>())
    , m_adviceClient(std::make_shared<AdviceClient>())
{
    m_adviceClient->setEndpoint(defaultAdviceEndpoint());
    m_orchestrator.setScreenCapturer(m_screenCapturer);
    m_orchestrator.setAdviceClient(m_adviceClient);

    m_controller.setWindowFactory([this]() -> std::unique_ptr<OverlayWindowInterface> {
        auto window = std::make_unique<QuickOverlayWindow>(m_engine, m_overlaySource);
        window->setPreferredScreenName(m_screenCapturer->preferredScreenName());
        return window;
    });

    connect(&m_controller, &WindowController::closedByUser, this, &Application::handleClosedByUser);
    if (auto* guiApp = qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        connect(guiApp, &QGuiApplication::applicationStateChanged, this,
                &Application::handleApplicationStateChanged);
    }

    exposeToQml();
}

Application::~Application()
{
    stop();
}

void Application::configureParser(QCommandLineParser& parser) const
{
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({"user", tr("Identyfikator użytkownika powiązany z nakładką"), tr("id")});
    parser.addOption({"trigger-host", tr("Adres nasłuchu serwera wyzwalającego"), tr("address")});
    parser.addOption({"trigger-port", tr("Port serwera wyzwalającego"), tr("port")});
    parser.addOption({"advice-endpoint", tr("Adres usługi porad"), tr("url")});
    parser.addOption({"min-capture-bytes", tr("Minimalny rozmiar poprawnego zrzutu ekranu"), tr("bytes")});
    parser.addOption({"context-file", tr("Plik JSON z kontekstem finansowym użytkownika"), tr("path")});
    parser.addOption({"capture-screen", tr("Preferowany ekran (nazwa QScreen)"), tr("name")});
    parser.addOption({"collapsed-size", tr("Rozmiar zwiniętej ikony (SZERxWYS)"), tr("size")});
    parser.addOption({"expanded-size", tr("Rozmiar rozwiniętej nakładki (SZERxWYS)"), tr("size")});
    parser.addOption({"defer-window", tr("Nie tworzy okna przy starcie – czeka na start-vision")});
    parser.addOption({"keep-alive", tr("Proces działa dalej po zamknięciu nakładki przez użytkownika")});
    parser.addOption({"log-rules", tr("Reguły filtrowania logów (QLoggingCategory)"), tr("rules")});
}

bool Application::applyParser(const QCommandLineParser& parser)
{
    bool ok = true;

    const QString logRules = parser.value("log-rules").trimmed();
    if (!logRules.isEmpty()) {
        QString rules = logRules;
        rules.replace(QLatin1Char(';'), QLatin1Char('\n'));
        QLoggingCategory::setFilterRules(rules);
    }

    m_initialUser = optionOrEnv(parser, QStringLiteral("user"), kUserEnv);

    const QString hostRaw = optionOrEnv(parser, QStringLiteral("trigger-host"), kTriggerHostEnv);
    m_triggerHost = QHostAddress(QHostAddress::LocalHost);
    if (!hostRaw.isEmpty()) {
        QHostAddress host;
        if (hostRaw.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0) {
            host = QHostAddress(QHostAddress::LocalHost);
        } else if (!host.setAddress(hostRaw)) {
            qCWarning(lcApp) << "Nieprawidłowy adres serwera wyzwalającego" << hostRaw << "– używam 127.0.0.1.";
            host = QHostAddress(QHostAddress::LocalHost);
        }
        m_triggerHost = host;
    }

    const QString portRaw = optionOrEnv(parser, QStringLiteral("trigger-port"), kTriggerPortEnv);
    m_triggerPort = TriggerServer::kDefaultPort;
    if (!portRaw.isEmpty()) {
        bool portOk = false;
        const int port = portRaw.toInt(&portOk);
        if (!portOk || port < 0 || port > 65535) {
            qCCritical(lcApp) << "Nieprawidłowy port serwera wyzwalającego:" << portRaw;
            ok = false;
        } else {
            m_triggerPort = port;
        }
    }

    const QString endpointRaw = optionOrEnv(parser, QStringLiteral("advice-endpoint"), kAdviceEndpointEnv);
    QUrl endpoint = defaultAdviceEndpoint();
    if (!endpointRaw.isEmpty()) {
        const QUrl candidate(endpointRaw, QUrl::StrictMode);
        const QString scheme = candidate.scheme().toLower();
        if (!candidate.isValid() || candidate.host().isEmpty()
            || (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))) {
            qCCritical(lcApp) << "Nieprawidłowy adres usługi porad:" << endpointRaw;
            ok = false;
        } else {
            endpoint = candidate;
        }
    }
    m_adviceClient->setEndpoint(endpoint);

    const QString minBytesRaw = optionOrEnv(parser, QStringLiteral("min-capture-bytes"), kMinCaptureBytesEnv);
    int minimumBytes = CaptureOrchestrator::kDefaultMinimumCaptureBytes;
    if (!minBytesRaw.isEmpty()) {
        bool bytesOk = false;
        const int value = minBytesRaw.toInt(&bytesOk);
        if (!bytesOk || value <= 0) {
            qCWarning(lcApp) << "Nieprawidłowy minimalny rozmiar zrzutu" << minBytesRaw
                             << "– używam" << CaptureOrchestrator::kDefaultMinimumCaptureBytes;
        } else {
            minimumBytes = value;
        }
    }
    m_orchestrator.setMinimumCaptureBytes(minimumBytes);

    m_contextFile = optionOrEnv(parser, QStringLiteral("context-file"), kContextFileEnv);
    m_screenCapturer->setPreferredScreenName(
        optionOrEnv(parser, QStringLiteral("capture-screen"), kCaptureScreenEnv));

    OverlayGeometry geometry;
    const auto applySize = [&parser](const QString& option, QSize* target) {
        const QString raw = parser.value(option).trimmed();
        if (raw.isEmpty())
            return;
        if (const auto size = parseSize(raw); size.has_value()) {
            *target = *size;
        } else {
            qCWarning(lcApp) << "Nieprawidłowy rozmiar" << raw << "dla opcji" << option
                             << "– używam" << target->width() << 'x' << target->height();
        }
    };
    applySize(QStringLiteral("collapsed-size"), &geometry.collapsedSize);
    applySize(QStringLiteral("expanded-size"), &geometry.expandedSize);
    m_controller.setGeometry(geometry);

    m_deferWindow = parser.isSet("defer-window");

    m_keepAlive = defaultKeepAlive();
    if (parser.isSet("keep-alive")) {
        m_keepAlive = true;
    } else if (const auto envKeepAlive = envBool(kKeepAliveEnv); envKeepAlive.has_value()) {
        m_keepAlive = *envKeepAlive;
    }

    qCInfo(lcApp) << "Konfiguracja: serwer" << m_triggerHost.toString() << m_triggerPort
                  << "usługa porad" << m_adviceClient->endpoint().toString()
                  << "keep-alive" << m_keepAlive;
    Q_EMIT configurationChanged();
    return ok;
}

bool Application::start(QString* errorMessage)
{
    if (m_started)
        return true;

    if (!m_contextFile.isEmpty()) {
        QString contextError;
        if (!m_context.loadFromFile(m_contextFile, &contextError))
            qCWarning(lcApp) << "Pomijam plik kontekstu:" << contextError;
    }

    QString listenError;
    if (!m_triggerServer.listen(m_triggerHost, static_cast<quint16>(m_triggerPort), &listenError)) {
        if (errorMessage)
            *errorMessage = listenError;
        return false;
    }

    m_started = true;

    if (m_deferWindow) {
        qCInfo(lcApp) << "Okno nakładki zostanie utworzone po żądaniu start-vision";
        return true;
    }

    QString openError;
    if (m_controller.open(m_initialUser, &openError) == WindowController::OpenResult::Failed) {
        if (errorMessage)
            *errorMessage = openError;
        m_triggerServer.close();
        m_started = false;
        return false;
    }
    return true;
}

void Application::stop()
{
    if (!m_started)
        return;
    m_controller.close();
    m_triggerServer.close();
    m_started = false;
}

void Application::setKeepAlive(bool enabled)
{
    if (m_keepAlive == enabled)
        return;
    m_keepAlive = enabled;
    Q_EMIT configurationChanged();
}

std::optional<QSize> Application::parseSize(const QString& text)
{
    static const QRegularExpression pattern(QStringLiteral("^\\s*(\\d+)\\s*[xX]\\s*(\\d+)\\s*$"));
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch())
        return std::nullopt;
    const int width = match.captured(1).toInt();
    const int height = match.captured(2).toInt();
    if (width <= 0 || height <= 0)
        return std::nullopt;
    return QSize(width, height);
}

QUrl Application::defaultAdviceEndpoint()
{
    return QUrl(QStringLiteral("http://localhost:5050/api/vision/advice"));
}

bool Application::defaultKeepAlive()
{
#ifdef Q_OS_MACOS
    return true;
#else
    return false;
#endif
}

void Application::exposeToQml()
{
    m_engine.rootContext()->setContextProperty(QStringLiteral("overlayController"), &m_controller);
    m_engine.rootContext()->setContextProperty(QStringLiteral("overlayChannel"), &m_channel);
    m_engine.rootContext()->setContextProperty(QStringLiteral("captureOrchestrator"), &m_orchestrator);
    m_engine.rootContext()->setContextProperty(QStringLiteral("contextProvider"), &m_context);
}

void Application::handleClosedByUser()
{
    if (m_keepAlive) {
        qCInfo(lcApp) << "Nakładka zamknięta – proces pozostaje aktywny (keep-alive)";
        return;
    }
    qCInfo(lcApp) << "Nakładka zamknięta przez użytkownika – kończę proces";
    Q_EMIT quitRequested();
    QTimer::singleShot(0, QCoreApplication::instance(), &QCoreApplication::quit);
}

void Application::handleApplicationStateChanged(Qt::ApplicationState state)
{
    // Aktywacja z doku odtwarza okno, jeśli proces przetrwał jego zamknięcie.
    if (state != Qt::ApplicationActive || !m_started || !m_keepAlive || m_controller.isRunning())
        return;
    qCInfo(lcApp) << "Aktywacja aplikacji bez okna – odtwarzam nakładkę";
    QString error;
    if (m_controller.open(m_initialUser, &error) == WindowController::OpenResult::Failed)
        qCWarning(lcApp) << "Nie udało się odtworzyć nakładki:" << error;
}
