#ifndef GLOBALHOTKEYMANAGER_H
#define GLOBALHOTKEYMANAGER_H

#include <QObject>
#include <QString>

#include <memory>

#include "hotkeytypes.h"
#include "nativehotkeyapi.h"

class SettingsStore;

// 持有唯一的系统级快捷键注册。
// 状态只有两种：未注册 / 已注册；start() 总是先 stop() 再注册。
class GlobalHotkeyManager : public QObject
{
    Q_OBJECT

public:
    // 'cosy'
    static constexpr quint32 HotkeySignature = 0x636F7379;
    static constexpr quint32 HotkeyId = 1;

    // api 为空时使用当前平台的实现
    explicit GlobalHotkeyManager(SettingsStore *settings,
                                 std::unique_ptr<NativeHotkeyApi> api = nullptr,
                                 QObject *parent = nullptr);
    ~GlobalHotkeyManager();

    bool start();
    void stop();

    bool isRegistered() const { return m_registered; }
    ShortcutDefinition registeredShortcut() const { return m_registeredShortcut; }

    HotkeyError lastError() const { return m_lastError; }
    QString errorString() const { return m_errorString; }

signals:
    void activated();
    void registrationChanged(bool registered);
    void registrationFailed(HotkeyError error, const QString &message);

private:
    static void hotKeyHandler(void *userData);
    static GlobalHotkeyManager *s_instance;

    bool fail(HotkeyError error, const QString &message);

    SettingsStore *m_settings;
    std::unique_ptr<NativeHotkeyApi> m_api;

    bool m_registered;
    NativeHotkeyApi::Handle m_hotkeyHandle;
    NativeHotkeyApi::Handle m_handlerHandle;
    ShortcutDefinition m_registeredShortcut;

    HotkeyError m_lastError;
    QString m_errorString;
};

#endif // GLOBALHOTKEYMANAGER_H
