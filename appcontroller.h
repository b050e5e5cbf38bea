#ifndef APPCONTROLLER_H
#define APPCONTROLLER_H

#include <QObject>
#include <QPointF>
#include <QString>

#include <memory>

#include "cursordispatcher.h"
#include "hotkeytypes.h"
#include "nativehotkeyapi.h"

class SettingsStore;
class GlobalHotkeyManager;
class HotzoneCaptureController;

// 界面层调用的入口：定义热区、录制快捷键、应用设置、退出。
// 设置变化时自动重新注册全局快捷键。
class AppController : public QObject
{
    Q_OBJECT

public:
    explicit AppController(SettingsStore *settings,
                           std::unique_ptr<NativeHotkeyApi> hotkeyApi = nullptr,
                           std::unique_ptr<CursorDevice> cursorDevice = nullptr,
                           QObject *parent = nullptr);
    ~AppController();

    // 启动时按当前设置注册快捷键
    void startup();

    SettingsStore *settings() const { return m_settings; }
    GlobalHotkeyManager *hotkeyManager() const { return m_hotkeyManager; }
    HotzoneCaptureController *captureController() const { return m_captureController; }
    CursorDispatcher *dispatcher() const { return m_dispatcher; }

    QString statusText() const { return m_statusText; }
    bool isHotkeySuspended() const { return m_hotkeySuspended; }

public slots:
    void requestDefineHotzone();
    void requestRecordShortcut();
    void applySettings(const ShortcutDefinition &shortcut, bool enabled);
    void requestQuit();

    // 录制快捷键期间暂停全局注册，结束后按最新设置重新注册
    void suspendHotkey();
    void resumeHotkey();

signals:
    void hotzoneCaptureStarted();
    void hotzoneCaptureFinished();
    void recordShortcutRequested();
    void statusChanged(const QString &status);
    void quitRequested();

private slots:
    void refreshRegistration();
    void onHotzoneSelected(const QPointF &point);
    void onHotzoneCancelled();

private:
    void updateStatus();

    SettingsStore *m_settings;
    GlobalHotkeyManager *m_hotkeyManager;
    HotzoneCaptureController *m_captureController;
    CursorDispatcher *m_dispatcher;
    QString m_statusText;
    bool m_hotkeySuspended;
};

#endif // APPCONTROLLER_H
