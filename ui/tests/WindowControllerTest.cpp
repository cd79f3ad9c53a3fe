#include <QtTest/QtTest>
#include <QSignalSpy>

#include <memory>

#include "OverlayFakes.hpp"
#include "overlay/WindowController.hpp"

class WindowControllerTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void openCreatesCollapsedWindow();
    void repeatedOpenFocusesSingleInstance();
    void userIsBoundOnlyOnce();
    void expandAppliesGeometryBeforeStateSignal();
    void expandOutsideCollapsedIsNoOp();
    void beginCaptureRequiresExpanded();
    void showResultMovesToDisplaying();
    void staleResultIsDropped();
    void collapseClearsSession();
    void resetReloadsSurface();
    void resetFailureClosesInstance();
    void closeIsIdempotent();
    void userCloseClearsStateAndNotifies();
    void closeByUserFromChannel();
    void resultTextFormatting();
    void loadFailureReportsError();
};

void WindowControllerTest::initTestCase()
{
    qRegisterMetaType<OverlayStates::OverlayState>("OverlayStates::OverlayState");
}

void WindowControllerTest::openCreatesCollapsedWindow()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));

    QSignalSpy runningSpy(&controller, &WindowController::runningChanged);
    QCOMPARE(controller.open(QStringLiteral("9876543210")), WindowController::OpenResult::Launched);

    QVERIFY(controller.isRunning());
    QCOMPARE(recorder->alive(), 1);
    QCOMPARE(recorder->loads, 1);
    QCOMPARE(controller.state(), OverlayState::Collapsed);
    QCOMPARE(controller.activeUser(), QStringLiteral("9876543210"));
    QVERIFY(!recorder->presentations.isEmpty());
    QCOMPARE(recorder->presentations.last().windowSize, QSize(80, 80));
    QVERIFY(recorder->presentations.last().iconVisible);
    QVERIFY(!recorder->presentations.last().controlsVisible);
    QCOMPARE(runningSpy.count(), 1);
}

void WindowControllerTest::repeatedOpenFocusesSingleInstance()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));

    QCOMPARE(controller.open(QString()), WindowController::OpenResult::Launched);
    QVERIFY(controller.expand());
    for (int i = 0; i < 4; ++i)
        QCOMPARE(controller.open(QString()), WindowController::OpenResult::Focused);

    QCOMPARE(recorder->created, 1);
    QCOMPARE(recorder->raises, 4);
    // Fokus nie zmienia stanu nakładki.
    QCOMPARE(controller.state(), OverlayState::Expanded);
}

void WindowControllerTest::userIsBoundOnlyOnce()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));

    controller.open(QString());
    QVERIFY(!controller.hasBoundUser());
    QCOMPARE(controller.activeUser(), WindowController::unknownUser());

    QSignalSpy userSpy(&controller, &WindowController::activeUserChanged);
    QCOMPARE(controller.open(QStringLiteral("111")), WindowController::OpenResult::Focused);
    QCOMPARE(controller.activeUser(), QStringLiteral("111"));
    QCOMPARE(userSpy.count(), 1);

    QCOMPARE(controller.open(QStringLiteral("222")), WindowController::OpenResult::Focused);
    QCOMPARE(controller.activeUser(), QStringLiteral("111"));
    QCOMPARE(userSpy.count(), 1);

    QVERIFY(controller.close());
    QCOMPARE(controller.open(QStringLiteral("222")), WindowController::OpenResult::Launched);
    QCOMPARE(controller.activeUser(), QStringLiteral("222"));
}

void WindowControllerTest::expandAppliesGeometryBeforeStateSignal()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QString());

    QSize sizeAtSignal;
    connect(&controller, &WindowController::stateChanged, this, [&](OverlayStates::OverlayState) {
        sizeAtSignal = recorder->presentations.last().windowSize;
    });

    QVERIFY(controller.expand());
    QCOMPARE(controller.state(), OverlayState::Expanded);
    QCOMPARE(sizeAtSignal, QSize(380, 520));
    QVERIFY(controller.controlsVisible());
    QVERIFY(controller.captureEnabled());
    QVERIFY(!controller.iconVisible());
}

void WindowControllerTest::expandOutsideCollapsedIsNoOp()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));

    QSignalSpy rejectedSpy(&controller, &WindowController::transitionRejected);
    QVERIFY(!controller.expand());
    QCOMPARE(rejectedSpy.count(), 1);

    controller.open(QString());
    QVERIFY(controller.expand());
    QSignalSpy stateSpy(&controller, &WindowController::stateChanged);
    QVERIFY(!controller.expand());
    QCOMPARE(stateSpy.count(), 0);
    QCOMPARE(controller.state(), OverlayState::Expanded);
}

void WindowControllerTest::beginCaptureRequiresExpanded()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QString());

    QSignalSpy rejectedSpy(&controller, &WindowController::transitionRejected);
    QCOMPARE(controller.beginCapture(), quint64(0));
    QCOMPARE(rejectedSpy.count(), 1);
    QVERIFY(!controller.session().has_value());
    QCOMPARE(controller.state(), OverlayState::Collapsed);

    QVERIFY(controller.expand());
    const quint64 id = controller.beginCapture();
    QVERIFY(id != 0);
    QCOMPARE(controller.state(), OverlayState::Capturing);
    QVERIFY(controller.loaderVisible());
    QVERIFY(!controller.captureEnabled());

    QCOMPARE(controller.beginCapture(), quint64(0));
    QCOMPARE(controller.session()->id, id);
    QVERIFY(controller.lastError().contains(QStringLiteral("beginCapture")));
}

void WindowControllerTest::showResultMovesToDisplaying()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QString());
    controller.expand();
    const quint64 id = controller.beginCapture();

    QSignalSpy resultSpy(&controller, &WindowController::resultChanged);
    QVERIFY(controller.showResult(id, CaptureOutcome::success(QStringLiteral("Spend less."))));
    QCOMPARE(controller.state(), OverlayState::Displaying);
    QVERIFY(controller.resultVisible());
    QVERIFY(!controller.loaderVisible());
    QCOMPARE(controller.resultText(), QStringLiteral("Spend less."));
    QVERIFY(!controller.resultIsError());
    QVERIFY(resultSpy.count() >= 1);

    QVERIFY(!controller.showResult(id, CaptureOutcome::failure(QStringLiteral("late"))));
    QCOMPARE(controller.resultText(), QStringLiteral("Spend less."));
}

void WindowControllerTest::staleResultIsDropped()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QString());
    controller.expand();
    const quint64 first = controller.beginCapture();
    controller.collapse();
    controller.expand();
    const quint64 second = controller.beginCapture();
    QVERIFY(second != first);

    QVERIFY(!controller.showResult(first, CaptureOutcome::success(QStringLiteral("old"))));
    QCOMPARE(controller.state(), OverlayState::Capturing);
    QVERIFY(controller.showResult(second, CaptureOutcome::success(QStringLiteral("new"))));
    QCOMPARE(controller.resultText(), QStringLiteral("new"));
}

void WindowControllerTest::collapseClearsSession()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QString());
    controller.expand();
    const quint64 id = controller.beginCapture();
    controller.recordCapture(id, QByteArray(2048, 'x'), QStringLiteral("ctx"));
    controller.showResult(id, CaptureOutcome::success(QStringLiteral("advice")));

    controller.collapse();
    QCOMPARE(controller.state(), OverlayState::Collapsed);
    QVERIFY(!controller.session().has_value());
    QVERIFY(controller.resultText().isEmpty());
    QCOMPARE(recorder->presentations.last().windowSize, QSize(80, 80));
}

void WindowControllerTest::resetReloadsSurface()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QStringLiteral("555"));
    controller.expand();
    const quint64 id = controller.beginCapture();

    QVERIFY(controller.reset());
    QCOMPARE(recorder->reloads, 1);
    QCOMPARE(controller.state(), OverlayState::Collapsed);
    QVERIFY(!controller.session().has_value());
    QCOMPARE(controller.activeUser(), QStringLiteral("555"));
    QVERIFY(!controller.showResult(id, CaptureOutcome::success(QStringLiteral("late"))));
}

void WindowControllerTest::resetFailureClosesInstance()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    recorder->failReload = true;
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QString());

    QVERIFY(!controller.reset());
    QVERIFY(!controller.isRunning());
    QCOMPARE(recorder->alive(), 0);
    QVERIFY(controller.lastError().contains(QStringLiteral("fake reload failure")));
}

void WindowControllerTest::closeIsIdempotent()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));

    QVERIFY(!controller.close());
    controller.open(QStringLiteral("777"));
    controller.expand();
    QVERIFY(controller.close());
    QVERIFY(!controller.close());
    QCOMPARE(recorder->alive(), 0);
    QCOMPARE(controller.state(), OverlayState::Collapsed);
    QVERIFY(!controller.hasBoundUser());
}

void WindowControllerTest::userCloseClearsStateAndNotifies()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QStringLiteral("777"));
    controller.expand();
    controller.beginCapture();

    QSignalSpy closedSpy(&controller, &WindowController::closedByUser);
    recorder->simulateUserClose();
    QVERIFY(controller.isRunning());

    QTRY_COMPARE_WITH_TIMEOUT(closedSpy.count(), 1, 1000);
    QVERIFY(!controller.isRunning());
    QVERIFY(!controller.session().has_value());
    QCOMPARE(controller.activeUser(), WindowController::unknownUser());
    QCOMPARE(recorder->alive(), 0);
}

void WindowControllerTest::closeByUserFromChannel()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));

    QSignalSpy closedSpy(&controller, &WindowController::closedByUser);
    QVERIFY(!controller.closeByUser());
    controller.open(QString());
    QVERIFY(controller.closeByUser());
    QCOMPARE(closedSpy.count(), 1);
    QVERIFY(!controller.isRunning());
}

void WindowControllerTest::resultTextFormatting()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));
    controller.open(QString());
    controller.expand();
    quint64 id = controller.beginCapture();
    controller.showResult(id, CaptureOutcome::success(QStringLiteral("First <b>\n\nSecond\nThird")));
    QCOMPARE(controller.resultHtml(), QStringLiteral("First &lt;b&gt;<br><br>Second<br>Third"));

    controller.collapse();
    controller.expand();
    id = controller.beginCapture();
    controller.showResult(id, CaptureOutcome::failure(QStringLiteral("API Error 500: boom")));
    QVERIFY(controller.resultIsError());
    QCOMPARE(controller.resultText(), QStringLiteral("An error occurred: API Error 500: boom"));
}

void WindowControllerTest::loadFailureReportsError()
{
    auto recorder = std::make_shared<FakeWindowRecorder>();
    recorder->failLoad = true;
    WindowController controller;
    controller.setWindowFactory(fakeWindowFactory(recorder));

    QString error;
    QCOMPARE(controller.open(QString(), &error), WindowController::OpenResult::Failed);
    QCOMPARE(error, QStringLiteral("fake load failure"));
    QVERIFY(!controller.isRunning());
    QCOMPARE(recorder->alive(), 0);

    WindowController noFactory;
    QCOMPARE(noFactory.open(QString(), &error), WindowController::OpenResult::Failed);
    QVERIFY(!error.isEmpty());
}

QTEST_MAIN(WindowControllerTest)
#include "WindowControllerTest.moc"
