#include "appcontroller.h"

#include <QCoreApplication>
#include <QDebug>

#include "cursordispatcher.h"
#include "globalhotkeymanager.h"
#include "hotkeycodec.h"
#include "hotzonecapturecontroller.h"
#include "nativehotkeyapi.h"
#include "settingsstore.h"

AppController::AppController(SettingsStore *settings,
                             std::unique_ptr<NativeHotkeyApi> hotkeyApi,
                             std::unique_ptr<CursorDevice> cursorDevice,
                             QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_hotkeyManager(new GlobalHotkeyManager(settings, std::move(hotkeyApi), this))
    , m_captureController(new HotzoneCaptureController(this))
    , m_dispatcher(new CursorDispatcher(settings, std::move(cursorDevice), this))
    , m_hotkeySuspended(false)
{
    connect(m_hotkeyManager, &GlobalHotkeyManager::activated, m_dispatcher, &CursorDispatcher::activate);
    connect(m_hotkeyManager, &GlobalHotkeyManager::registrationChanged, this, &AppController::updateStatus);
    connect(m_hotkeyManager, &GlobalHotkeyManager::registrationFailed, this, &AppController::updateStatus);

    connect(m_settings, &SettingsStore::shortcutChanged, this, &AppController::refreshRegistration);
    connect(m_settings, &SettingsStore::hotkeyEnabledChanged, this, &AppController::refreshRegistration);

    connect(m_captureController, &HotzoneCaptureController::pointSelected, this, &AppController::onHotzoneSelected);
    connect(m_captureController, &HotzoneCaptureController::cancelled, this, &AppController::onHotzoneCancelled);
}

AppController::~AppController()
{
}

void AppController::startup()
{
    refreshRegistration();
    qInfo() << "CursorAnchor 已启动，当前热区:" << m_settings->hotzoneDescription();
}

void AppController::requestDefineHotzone()
{
    qDebug() << "启动热区定义";
    emit hotzoneCaptureStarted();
    m_captureController->start();
}

void AppController::requestRecordShortcut()
{
    if (!m_settings->isShortcutConfigurable()) {
        qDebug() << "快捷键不可配置，忽略录制请求";
        return;
    }
    emit recordShortcutRequested();
}

void AppController::applySettings(const ShortcutDefinition &shortcut, bool enabled)
{
    // 每次写入都会同步触发重新注册
    m_settings->setShortcut(shortcut);
    m_settings->setHotkeyEnabled(enabled);
}

void AppController::requestQuit()
{
    m_hotkeySuspended = false;
    m_captureController->cancel();
    m_hotkeyManager->stop();
    emit quitRequested();
    QCoreApplication::quit();
}

void AppController::suspendHotkey()
{
    if (m_hotkeySuspended) {
        return;
    }
    qDebug() << "录制快捷键，暂停全局注册";
    m_hotkeySuspended = true;
    refreshRegistration();
}

void AppController::resumeHotkey()
{
    if (!m_hotkeySuspended) {
        return;
    }
    m_hotkeySuspended = false;
    refreshRegistration();
}

void AppController::refreshRegistration()
{
    if (m_settings->isHotkeyEnabled() && !m_hotkeySuspended) {
        m_hotkeyManager->start();
    } else {
        m_hotkeyManager->stop();
    }
    updateStatus();
}

void AppController::onHotzoneSelected(const QPointF &point)
{
    m_settings->setHotzone(point);
    qInfo() << "热区已更新:" << m_settings->hotzoneDescription();
    emit hotzoneCaptureFinished();
}

void AppController::onHotzoneCancelled()
{
    emit hotzoneCaptureFinished();
}

void AppController::updateStatus()
{
    QString status;
    if (!m_settings->isHotkeyEnabled()) {
        status = QStringLiteral("快捷键已禁用");
    } else if (m_hotkeySuspended) {
        status = QStringLiteral("正在录制快捷键");
    } else if (m_hotkeyManager->isRegistered()) {
        status = QStringLiteral("快捷键已注册: %1")
                     .arg(HotkeyCodec::encodeForDisplay(m_hotkeyManager->registeredShortcut()));
    } else if (m_hotkeyManager->lastError() != HotkeyError::NoError) {
        status = QStringLiteral("快捷键注册失败: %1").arg(m_hotkeyManager->errorString());
    } else {
        status = QStringLiteral("快捷键未注册");
    }

    if (status != m_statusText) {
        m_statusText = status;
        emit statusChanged(m_statusText);
    }
}
