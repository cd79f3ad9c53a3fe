#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QVariantMap>

#include <memory>

#include "OverlayFakes.hpp"
#include "capture/CaptureOrchestrator.hpp"
#include "capture/ContextProvider.hpp"
#include "overlay/OverlayChannel.hpp"
#include "overlay/WindowController.hpp"

class OverlayChannelTest : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();
    void parsesKnownCommands();
    void expandAndShrink();
    void repeatedExpandIsAccepted();
    void minimizeKeepsState();
    void runCycleStartsCapture();
    void runCycleRejectedWhenCollapsed();
    void resetReturnsToCollapsed();
    void closeVisionEndsInstance();
    void unknownCommandIsRejected();
    void captureScreenReturnsMap();
    void captureScreenRefusedWhenCollapsed();

private:
    std::shared_ptr<FakeWindowRecorder>     m_recorder;
    std::shared_ptr<FakeScreenCapturer>  m_capturer;
    std::shared_ptr<FakeAdviceClient>    m_advice;
    std::unique_ptr<WindowController>    m_controller;
    std::unique_ptr<ContextProvider>     m_context;
    std::unique_ptr<CaptureOrchestrator> m_orchestrator;
    std::unique_ptr<OverlayChannel>      m_channel;
};

void OverlayChannelTest::init()
{
    m_recorder = std::make_shared<FakeWindowRecorder>();
    m_capturer = std::make_shared<FakeScreenCapturer>();
    m_capturer->setImageSize(2048);
    m_advice = std::make_shared<FakeAdviceClient>();
    m_controller = std::make_unique<WindowController>();
    m_controller->setWindowFactory(fakeWindowFactory(m_recorder));
    m_context = std::make_unique<ContextProvider>();
    m_orchestrator = std::make_unique<CaptureOrchestrator>(*m_controller, *m_context);
    m_orchestrator->setScreenCapturer(m_capturer);
    m_orchestrator->setAdviceClient(m_advice);
    m_channel = std::make_unique<OverlayChannel>(*m_controller, *m_orchestrator);
    m_controller->open(QStringLiteral("321"));
}

void OverlayChannelTest::cleanup()
{
    m_channel.reset();
    m_orchestrator.reset();
    m_context.reset();
    m_controller.reset();
}

void OverlayChannelTest::parsesKnownCommands()
{
    OverlayChannel::Command command = OverlayChannel::Command::ExpandWindow;
    QVERIFY(OverlayChannel::parseCommand(QStringLiteral("shrink-window"), &command));
    QCOMPARE(command, OverlayChannel::Command::ShrinkWindow);
    QVERIFY(OverlayChannel::parseCommand(QStringLiteral(" Reset-UI "), &command));
    QCOMPARE(command, OverlayChannel::Command::ResetUi);
    QVERIFY(OverlayChannel::parseCommand(QStringLiteral("capture"), &command));
    QCOMPARE(command, OverlayChannel::Command::RunCycle);
    QCOMPARE(OverlayChannel::commandName(OverlayChannel::Command::CloseVision), QStringLiteral("close-vision"));
    QVERIFY(!OverlayChannel::parseCommand(QStringLiteral("open-pod-bay-doors"), &command));
}

void OverlayChannelTest::expandAndShrink()
{
    QVERIFY(m_channel->send(QStringLiteral("expand-window")));
    QCOMPARE(m_controller->state(), OverlayState::Expanded);
    QCOMPARE(m_recorder->presentations.last().windowSize, QSize(380, 520));

    QVERIFY(m_channel->send(QStringLiteral("shrink-window")));
    QCOMPARE(m_controller->state(), OverlayState::Collapsed);
    QCOMPARE(m_recorder->presentations.last().windowSize, QSize(80, 80));
}

void OverlayChannelTest::repeatedExpandIsAccepted()
{
    QSignalSpy rejectedSpy(m_channel.get(), &OverlayChannel::commandRejected);
    QVERIFY(m_channel->send(QStringLiteral("expand-window")));
    QVERIFY(m_channel->send(QStringLiteral("expand-window")));
    QCOMPARE(rejectedSpy.count(), 0);
    QCOMPARE(m_controller->state(), OverlayState::Expanded);
}

void OverlayChannelTest::minimizeKeepsState()
{
    m_channel->send(QStringLiteral("expand-window"));
    QVERIFY(m_channel->send(QStringLiteral("minimize-window")));
    QCOMPARE(m_recorder->minimizes, 1);
    QCOMPARE(m_controller->state(), OverlayState::Expanded);
}

void OverlayChannelTest::runCycleStartsCapture()
{
    m_channel->send(QStringLiteral("expand-window"));
    QVERIFY(m_channel->send(QStringLiteral("run-cycle")));
    QCOMPARE(m_controller->state(), OverlayState::Capturing);
    QTRY_COMPARE_WITH_TIMEOUT(static_cast<int>(m_advice->pending.size()), 1, 1000);
    QVERIFY(m_advice->reply(FakeAdviceClient::advice(QStringLiteral("Pay off the card."))));
    QCOMPARE(m_controller->state(), OverlayState::Displaying);
}

void OverlayChannelTest::runCycleRejectedWhenCollapsed()
{
    QSignalSpy rejectedSpy(m_channel.get(), &OverlayChannel::commandRejected);
    QVERIFY(!m_channel->send(QStringLiteral("run-cycle")));
    QCOMPARE(rejectedSpy.count(), 1);
    QCOMPARE(rejectedSpy.first().at(0).toString(), QStringLiteral("run-cycle"));
    QCOMPARE(m_capturer->captureCount, 0);
}

void OverlayChannelTest::resetReturnsToCollapsed()
{
    m_channel->send(QStringLiteral("expand-window"));
    m_channel->send(QStringLiteral("run-cycle"));
    QVERIFY(m_channel->send(QStringLiteral("reset-ui")));
    QCOMPARE(m_recorder->reloads, 1);
    QCOMPARE(m_controller->state(), OverlayState::Collapsed);
    QVERIFY(!m_controller->session().has_value());
}

void OverlayChannelTest::closeVisionEndsInstance()
{
    QSignalSpy closedSpy(m_controller.get(), &WindowController::closedByUser);
    QVERIFY(m_channel->send(QStringLiteral("close-vision")));
    QCOMPARE(closedSpy.count(), 1);
    QVERIFY(!m_controller->isRunning());
    QVERIFY(!m_channel->send(QStringLiteral("close-vision")));
}

void OverlayChannelTest::unknownCommandIsRejected()
{
    QSignalSpy rejectedSpy(m_channel.get(), &OverlayChannel::commandRejected);
    QVERIFY(!m_channel->send(QStringLiteral("self-destruct")));
    QCOMPARE(rejectedSpy.count(), 1);
    QCOMPARE(m_controller->state(), OverlayState::Collapsed);
}

void OverlayChannelTest::captureScreenReturnsMap()
{
    QVERIFY(m_channel->send(QStringLiteral("expand-window")));
    QVariantMap result = m_channel->captureScreen();
    QVERIFY(result.value(QStringLiteral("imageBase64")).toString().startsWith(QStringLiteral("data:image/png;base64,")));
    QCOMPARE(result.value(QStringLiteral("mobile_number")).toString(), QStringLiteral("321"));
    QCOMPARE(result.value(QStringLiteral("userContext")).toString(), ContextProvider::fallbackSummary());

    m_capturer->nextResult = {};
    result = m_channel->captureScreen();
    QCOMPARE(result.value(QStringLiteral("error")).toString(), QStringLiteral("Error during capture."));
    QVERIFY(!result.contains(QStringLiteral("imageBase64")));
}

void OverlayChannelTest::captureScreenRefusedWhenCollapsed()
{
    QVariantMap result = m_channel->captureScreen();
    QCOMPARE(result.value(QStringLiteral("error")).toString(), CaptureOrchestrator::captureNotAllowedMessage());
    QVERIFY(!result.contains(QStringLiteral("imageBase64")));

    m_controller->close();
    result = m_channel->captureScreen();
    QVERIFY(result.contains(QStringLiteral("error")));
    QVERIFY(!result.contains(QStringLiteral("imageBase64")));
    QCOMPARE(m_capturer->captureCount, 0);
}

QTEST_MAIN(OverlayChannelTest)
#include "OverlayChannelTest.moc"
