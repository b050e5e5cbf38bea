#include <QTest>
#include <QSignalSpy>
#include <QApplication>
#include <QMouseEvent>

#include "hotzonecapturecontroller.h"
#include "hotzoneoverlay.h"

namespace {

const QRect LeftScreen(0, 0, 1920, 1080);
const QRect RightScreen(1920, 0, 1280, 800);

void pressOverlay(HotzoneOverlay *overlay, const QPointF &localPos, const QPointF &globalPos,
                  Qt::MouseButton button = Qt::LeftButton)
{
    QMouseEvent press(QEvent::MouseButtonPress, localPos, globalPos,
                      button, button, Qt::NoModifier);
    QApplication::sendEvent(overlay, &press);
}

// 遮罩恰好位于显示器原点时的点击
void clickOverlay(HotzoneOverlay *overlay, const QPointF &localPos,
                  Qt::MouseButton button = Qt::LeftButton)
{
    pressOverlay(overlay, localPos, QPointF(overlay->screenGeometry().topLeft()) + localPos, button);
}

int liveOverlayCount()
{
    int count = 0;
    const QWidgetList widgets = QApplication::topLevelWidgets();
    for (QWidget *widget : widgets) {
        if (qobject_cast<HotzoneOverlay *>(widget)) {
            ++count;
        }
    }
    return count;
}

} // namespace

class TestHotzoneCaptureController : public QObject
{
    Q_OBJECT

private:
    void flushDeletes()
    {
        QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    }

private slots:
    void cleanup()
    {
        flushDeletes();
        QCOMPARE(liveOverlayCount(), 0);
    }

    void test_start_coversEveryScreen()
    {
        HotzoneCaptureController controller;
        controller.setScreenProvider([] { return QList<QRect> { LeftScreen, RightScreen }; });

        controller.start();

        QVERIFY(controller.isActive());
        QCOMPARE(controller.overlayCount(), 2);
        const QList<HotzoneOverlay *> overlays = controller.overlays();
        QCOMPARE(overlays.at(0)->screenGeometry(), LeftScreen);
        QCOMPARE(overlays.at(1)->screenGeometry(), RightScreen);
        QVERIFY(overlays.at(0)->isVisible());
        QVERIFY(overlays.at(0)->windowFlags().testFlag(Qt::WindowStaysOnTopHint));

        controller.cancel();
    }

    void test_click_emitsGlobalPointOnce()
    {
        HotzoneCaptureController controller;
        controller.setScreenProvider([] { return QList<QRect> { LeftScreen, RightScreen }; });
        QSignalSpy selected(&controller, &HotzoneCaptureController::pointSelected);
        QSignalSpy cancelled(&controller, &HotzoneCaptureController::cancelled);

        controller.start();
        const QList<HotzoneOverlay *> overlays = controller.overlays();
        clickOverlay(overlays.at(1), QPointF(100.5, 40));

        QCOMPARE(selected.count(), 1);
        QCOMPARE(selected.first().at(0).toPointF(), QPointF(2020.5, 40));
        QCOMPARE(cancelled.count(), 0);
        QVERIFY(!controller.isActive());
        QCOMPARE(controller.overlayCount(), 0);

        // 遮罩删除前迟到的点击不再生效
        clickOverlay(overlays.at(0), QPointF(812, 413));
        QCOMPARE(selected.count(), 1);
    }

    void test_click_usesWindowSystemGlobalPosition()
    {
        HotzoneCaptureController controller;
        controller.setScreenProvider([] { return QList<QRect> { LeftScreen, RightScreen }; });
        QSignalSpy selected(&controller, &HotzoneCaptureController::pointSelected);

        controller.start();
        // 窗口管理器把遮罩放在面板下方：窗口内坐标与全局坐标差的不是显示器原点
        pressOverlay(controller.overlays().at(1), QPointF(100, 40), QPointF(2020, 72));

        QCOMPARE(selected.count(), 1);
        QCOMPARE(selected.first().at(0).toPointF(), QPointF(2020, 72));
    }

    void test_rightClick_isIgnored()
    {
        HotzoneCaptureController controller;
        controller.setScreenProvider([] { return QList<QRect> { LeftScreen }; });
        QSignalSpy selected(&controller, &HotzoneCaptureController::pointSelected);

        controller.start();
        clickOverlay(controller.overlays().first(), QPointF(10, 10), Qt::RightButton);

        QCOMPARE(selected.count(), 0);
        QVERIFY(controller.isActive());

        controller.cancel();
    }

    void test_escape_cancelsSession()
    {
        HotzoneCaptureController controller;
        controller.setScreenProvider([] { return QList<QRect> { LeftScreen, RightScreen }; });
        QSignalSpy selected(&controller, &HotzoneCaptureController::pointSelected);
        QSignalSpy cancelled(&controller, &HotzoneCaptureController::cancelled);

        controller.start();
        QTest::keyClick(controller.overlays().at(1), Qt::Key_Escape);

        QCOMPARE(cancelled.count(), 1);
        QCOMPARE(selected.count(), 0);
        QCOMPARE(controller.overlayCount(), 0);
    }

    void test_cancel_withoutSession_isNoop()
    {
        HotzoneCaptureController controller;
        QSignalSpy cancelled(&controller, &HotzoneCaptureController::cancelled);

        controller.cancel();

        QCOMPARE(cancelled.count(), 0);
    }

    void test_noScreens_cancelsImmediately()
    {
        HotzoneCaptureController controller;
        controller.setScreenProvider([] { return QList<QRect>(); });
        QSignalSpy cancelled(&controller, &HotzoneCaptureController::cancelled);

        QTest::ignoreMessage(QtWarningMsg, "没有可用的显示器，取消热区选择");
        controller.start();

        QCOMPARE(cancelled.count(), 1);
        QVERIFY(!controller.isActive());
    }

    void test_restart_replacesPreviousSession()
    {
        HotzoneCaptureController controller;
        controller.setScreenProvider([] { return QList<QRect> { LeftScreen, RightScreen }; });
        QSignalSpy selected(&controller, &HotzoneCaptureController::pointSelected);
        QSignalSpy cancelled(&controller, &HotzoneCaptureController::cancelled);

        controller.start();
        controller.start();

        QCOMPARE(controller.overlayCount(), 2);
        QCOMPARE(cancelled.count(), 0);
        flushDeletes();
        QCOMPARE(liveOverlayCount(), 2);

        clickOverlay(controller.overlays().at(0), QPointF(812, 413));
        QCOMPARE(selected.count(), 1);
        QCOMPARE(selected.first().at(0).toPointF(), QPointF(812, 413));
    }

    void test_destruction_closesOverlays()
    {
        {
            HotzoneCaptureController controller;
            controller.setScreenProvider([] { return QList<QRect> { LeftScreen }; });
            controller.start();
            QCOMPARE(liveOverlayCount(), 1);
        }
        QCOMPARE(liveOverlayCount(), 0);
    }
};

QTEST_MAIN(TestHotzoneCaptureController)
#include "test_hotzonecapturecontroller.moc"
