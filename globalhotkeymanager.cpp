#include "globalhotkeymanager.h"

#include <QDebug>
#include <QScopeGuard>

#include "hotkeycodec.h"
#include "settingsstore.h"

GlobalHotkeyManager *GlobalHotkeyManager::s_instance = nullptr;

void GlobalHotkeyManager::hotKeyHandler(void *userData)
{
    // userData 是安装时捕获的非持有指针，只有与当前已注册实例一致才分发
    GlobalHotkeyManager *manager = static_cast<GlobalHotkeyManager *>(userData);
    if (!manager || manager != s_instance || !manager->m_registered) {
        qWarning() << "收到已失效的快捷键回调，忽略";
        return;
    }

    qDebug() << "全局快捷键被触发!";
    emit manager->activated();
}

GlobalHotkeyManager::GlobalHotkeyManager(SettingsStore *settings,
                                         std::unique_ptr<NativeHotkeyApi> api,
                                         QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_api(std::move(api))
    , m_registered(false)
    , m_hotkeyHandle(NativeHotkeyApi::InvalidHandle)
    , m_handlerHandle(NativeHotkeyApi::InvalidHandle)
    , m_lastError(HotkeyError::NoError)
{
    if (!m_api) {
        m_api = createNativeHotkeyApi();
    }
}

GlobalHotkeyManager::~GlobalHotkeyManager()
{
    stop();
}

bool GlobalHotkeyManager::start()
{
    // 注册永远不是叠加的：先完整拆除旧注册
    stop();

    m_lastError = HotkeyError::NoError;
    m_errorString.clear();

    if (!m_settings->isHotkeyEnabled()) {
        qDebug() << "快捷键已禁用，不注册";
        return true;
    }

    const ShortcutDefinition shortcut = m_settings->shortcut();
    const QString keyString = HotkeyCodec::encodeForDisplay(shortcut);
    qDebug() << "注册全局快捷键:" << keyString;

    if (!shortcut.hasModifiers()) {
        return fail(HotkeyError::RegistrationFailed,
                    QStringLiteral("快捷键缺少修饰键: %1").arg(keyString));
    }

    const std::optional<quint32> nativeKey = HotkeyCodec::toNativeKeyCode(shortcut.keyCode);
    if (!nativeKey) {
        return fail(HotkeyError::RegistrationFailed,
                    QStringLiteral("暂不支持此按键: %1").arg(keyString));
    }

    const quint32 nativeModifiers = HotkeyCodec::toNativeModifierMask(shortcut.modifiers);

    NativeHotkeyApi::Handle hotkeyHandle = NativeHotkeyApi::InvalidHandle;
    if (!m_api->registerHotkey(*nativeKey, nativeModifiers, HotkeySignature, HotkeyId, &hotkeyHandle)) {
        return fail(HotkeyError::RegistrationFailed,
                    QStringLiteral("全局快捷键注册失败: %1，错误码: %2").arg(keyString).arg(m_api->lastStatus()));
    }

    // 回调安装失败时撤销刚注册的快捷键，避免留下无法触发的注册
    auto rollback = qScopeGuard([this, hotkeyHandle] {
        m_api->unregisterHotkey(hotkeyHandle);
    });

    NativeHotkeyApi::Handle handlerHandle = NativeHotkeyApi::InvalidHandle;
    if (!m_api->installHandler(HotkeySignature, HotkeyId, &GlobalHotkeyManager::hotKeyHandler,
                               this, &handlerHandle)) {
        return fail(HotkeyError::HandlerInstallFailed,
                    QStringLiteral("快捷键事件处理器安装失败，错误码: %1").arg(m_api->lastStatus()));
    }
    rollback.dismiss();

    m_hotkeyHandle = hotkeyHandle;
    m_handlerHandle = handlerHandle;
    m_registeredShortcut = shortcut;
    m_registered = true;
    s_instance = this;

    qInfo() << "全局快捷键注册成功:" << keyString;
    emit registrationChanged(true);
    return true;
}

void GlobalHotkeyManager::stop()
{
    if (s_instance == this) {
        s_instance = nullptr;
    }

    if (!m_registered) {
        return;
    }

    if (m_handlerHandle != NativeHotkeyApi::InvalidHandle) {
        m_api->removeHandler(m_handlerHandle);
        m_handlerHandle = NativeHotkeyApi::InvalidHandle;
    }
    if (m_hotkeyHandle != NativeHotkeyApi::InvalidHandle) {
        m_api->unregisterHotkey(m_hotkeyHandle);
        m_hotkeyHandle = NativeHotkeyApi::InvalidHandle;
    }

    m_registered = false;
    m_registeredShortcut = ShortcutDefinition();

    qDebug() << "全局快捷键已取消注册";
    emit registrationChanged(false);
}

bool GlobalHotkeyManager::fail(HotkeyError error, const QString &message)
{
    m_lastError = error;
    m_errorString = message;
    qWarning() << message;
    emit registrationFailed(error, message);
    return false;
}
