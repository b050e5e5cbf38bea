#include <QTest>

#include "globalhotkeymanager.h"
#include "x11hotkeyapi.h"

#include <X11/Xlib.h>
#include <X11/keysym.h>

namespace {

int s_calls = 0;

void countCall(void *userData)
{
    Q_UNUSED(userData)
    ++s_calls;
}

bool hasDisplay()
{
    Display *display = XOpenDisplay(nullptr);
    if (!display) {
        return false;
    }
    XCloseDisplay(display);
    return true;
}

} // namespace

class TestX11HotkeyApi : public QObject
{
    Q_OBJECT

private slots:
    void test_withoutDisplay_reportsFailure()
    {
        if (hasDisplay()) {
            QSKIP("需要没有 X 服务器的环境");
        }

        X11HotkeyApi api;
        NativeHotkeyApi::Handle handle = NativeHotkeyApi::InvalidHandle;
        QVERIFY(!api.registerHotkey(XK_C, ControlMask | Mod1Mask,
                                    GlobalHotkeyManager::HotkeySignature, GlobalHotkeyManager::HotkeyId, &handle));
        QCOMPARE(api.lastStatus(), long(BadImplementation));
        QCOMPARE(handle, NativeHotkeyApi::InvalidHandle);

        QVERIFY(!api.installHandler(GlobalHotkeyManager::HotkeySignature, GlobalHotkeyManager::HotkeyId,
                                    &countCall, nullptr, &handle));
    }

    void test_unknownKeysym_isRejected()
    {
        if (!hasDisplay()) {
            QSKIP("需要 X 服务器");
        }

        X11HotkeyApi api;
        NativeHotkeyApi::Handle handle = NativeHotkeyApi::InvalidHandle;
        QVERIFY(!api.registerHotkey(NoSymbol, ControlMask,
                                    GlobalHotkeyManager::HotkeySignature, GlobalHotkeyManager::HotkeyId, &handle));
        QCOMPARE(api.lastStatus(), long(BadValue));
    }

    void test_grabLifecycle()
    {
        if (!hasDisplay()) {
            QSKIP("需要 X 服务器");
        }

        X11HotkeyApi api;
        NativeHotkeyApi::Handle hotkey = NativeHotkeyApi::InvalidHandle;
        NativeHotkeyApi::Handle handler = NativeHotkeyApi::InvalidHandle;

        // 四个修饰键全按的 F12 几乎不会被其他程序占用
        QVERIFY(api.registerHotkey(XK_F12, ControlMask | Mod1Mask | ShiftMask | Mod4Mask,
                                   GlobalHotkeyManager::HotkeySignature, GlobalHotkeyManager::HotkeyId, &hotkey));
        QVERIFY(hotkey != NativeHotkeyApi::InvalidHandle);
        QVERIFY(api.installHandler(GlobalHotkeyManager::HotkeySignature, GlobalHotkeyManager::HotkeyId,
                                   &countCall, nullptr, &handler));

        // 事件循环空转时会排空 Xlib 队列，没有按键就不应有回调
        s_calls = 0;
        QTest::qWait(50);
        QCOMPARE(s_calls, 0);

        api.removeHandler(handler);
        api.unregisterHotkey(hotkey);

        // 释放后可以立即重新抓取
        QVERIFY(api.registerHotkey(XK_F12, ControlMask | Mod1Mask | ShiftMask | Mod4Mask,
                                   GlobalHotkeyManager::HotkeySignature, GlobalHotkeyManager::HotkeyId, &hotkey));
        api.unregisterHotkey(hotkey);
    }
};

QTEST_GUILESS_MAIN(TestX11HotkeyApi)
#include "test_x11hotkeyapi.moc"
