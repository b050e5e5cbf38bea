#include "preferenceswindow.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGroupBox>
#include <QLabel>
#include <QPushButton>
#include <QCheckBox>
#include <QSystemTrayIcon>
#include <QMenu>
#include <QAction>
#include <QApplication>
#include <QStyle>
#include <QDebug>

#include "appcontroller.h"
#include "cursordispatcher.h"
#include "hotkeycapturefield.h"
#include "settingsstore.h"

PreferencesWindow::PreferencesWindow(AppController *controller, QWidget *parent)
    : QWidget(parent)
    , m_controller(controller)
    , m_hotzoneLabel(nullptr)
    , m_defineButton(nullptr)
    , m_hotkeyField(nullptr)
    , m_recordButton(nullptr)
    , m_enabledCheckBox(nullptr)
    , m_statusLabel(nullptr)
    , m_quitButton(nullptr)
    , m_trayIcon(nullptr)
    , m_trayMenu(nullptr)
    , m_wasVisibleBeforeCapture(false)
{
    setWindowTitle("Cursor Anchor");
    resize(350, 340);

    setupUI();
    setupConnections();
    loadSettings();
}

PreferencesWindow::~PreferencesWindow()
{
}

void PreferencesWindow::setupUI()
{
    QVBoxLayout *mainLayout = new QVBoxLayout(this);

    QLabel *titleLabel = new QLabel("Cursor Anchor", this);
    titleLabel->setStyleSheet("QLabel { font-size: 22px; font-weight: bold; }");
    titleLabel->setAlignment(Qt::AlignCenter);
    mainLayout->addWidget(titleLabel);

    // 热区
    QGroupBox *hotzoneGroup = new QGroupBox("当前热区", this);
    QVBoxLayout *hotzoneLayout = new QVBoxLayout(hotzoneGroup);
    m_hotzoneLabel = new QLabel(hotzoneGroup);
    m_defineButton = new QPushButton("定义/重新定义热区", hotzoneGroup);
    hotzoneLayout->addWidget(m_hotzoneLabel);
    hotzoneLayout->addWidget(m_defineButton);
    mainLayout->addWidget(hotzoneGroup);

    // 快捷键
    QGroupBox *hotkeyGroup = new QGroupBox("全局快捷键", this);
    QVBoxLayout *hotkeyLayout = new QVBoxLayout(hotkeyGroup);
    QHBoxLayout *fieldLayout = new QHBoxLayout();
    m_hotkeyField = new HotkeyCaptureField(hotkeyGroup);
    m_recordButton = new QPushButton("录制", hotkeyGroup);
    fieldLayout->addWidget(m_hotkeyField);
    fieldLayout->addWidget(m_recordButton);
    m_enabledCheckBox = new QCheckBox("启用快捷键", hotkeyGroup);
    hotkeyLayout->addLayout(fieldLayout);
    hotkeyLayout->addWidget(m_enabledCheckBox);
    mainLayout->addWidget(hotkeyGroup);

    // 状态显示
    m_statusLabel = new QLabel(this);
    m_statusLabel->setWordWrap(true);
    m_statusLabel->setStyleSheet("QLabel { color: gray; font-size: 11px; }");
    mainLayout->addWidget(m_statusLabel);

    mainLayout->addStretch();

    m_quitButton = new QPushButton("退出 Cursor Anchor", this);
    mainLayout->addWidget(m_quitButton);
}

void PreferencesWindow::setupConnections()
{
    SettingsStore *settings = m_controller->settings();

    connect(m_defineButton, &QPushButton::clicked, m_controller, &AppController::requestDefineHotzone);
    connect(m_recordButton, &QPushButton::clicked, m_controller, &AppController::requestRecordShortcut);
    connect(m_quitButton, &QPushButton::clicked, m_controller, &AppController::requestQuit);

    connect(m_hotkeyField, &HotkeyCaptureField::shortcutCaptured, this, &PreferencesWindow::onShortcutCaptured);
    connect(m_hotkeyField, &HotkeyCaptureField::recordingStarted, m_controller, &AppController::suspendHotkey);
    connect(m_hotkeyField, &HotkeyCaptureField::recordingFinished, m_controller, &AppController::resumeHotkey);
    connect(m_enabledCheckBox, &QCheckBox::toggled, this, &PreferencesWindow::onEnabledToggled);

    connect(m_controller, &AppController::recordShortcutRequested, this, &PreferencesWindow::onRecordShortcutRequested);
    connect(m_controller, &AppController::hotzoneCaptureStarted, this, &PreferencesWindow::onHotzoneCaptureStarted);
    connect(m_controller, &AppController::hotzoneCaptureFinished, this, &PreferencesWindow::onHotzoneCaptureFinished);
    connect(m_controller, &AppController::statusChanged, this, &PreferencesWindow::onStatusChanged);

    // 设置变更时刷新显示
    connect(settings, &SettingsStore::hotzoneChanged, this, [this, settings]() {
        m_hotzoneLabel->setText(settings->hotzoneDescription());
    });
    connect(settings, &SettingsStore::shortcutChanged, m_hotkeyField, &HotkeyCaptureField::setShortcut);
    connect(settings, &SettingsStore::hotkeyEnabledChanged, m_enabledCheckBox, &QCheckBox::setChecked);
}

void PreferencesWindow::createTrayIcon()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qWarning() << "系统托盘不可用，直接显示设置窗口";
        show();
        return;
    }

    m_trayMenu = new QMenu(this);

    QAction *preferencesAction = m_trayMenu->addAction("设置(&S)");
    connect(preferencesAction, &QAction::triggered, this, [this]() {
        show();
        raise();
        activateWindow();
    });

    QAction *defineAction = m_trayMenu->addAction("定义热区(&D)");
    connect(defineAction, &QAction::triggered, m_controller, &AppController::requestDefineHotzone);

    QAction *jumpAction = m_trayMenu->addAction("移动光标到热区(&J)");
    connect(jumpAction, &QAction::triggered, m_controller->dispatcher(), &CursorDispatcher::activate);

    m_trayMenu->addSeparator();
    QAction *quitAction = m_trayMenu->addAction("退出(&X)");
    connect(quitAction, &QAction::triggered, m_controller, &AppController::requestQuit);

    m_trayIcon = new QSystemTrayIcon(style()->standardIcon(QStyle::SP_ComputerIcon), this);
    m_trayIcon->setContextMenu(m_trayMenu);
    m_trayIcon->setToolTip(QString("Cursor Anchor\n%1").arg(m_controller->statusText()));
    connect(m_trayIcon, &QSystemTrayIcon::activated, this, [this](QSystemTrayIcon::ActivationReason reason) {
        if (reason == QSystemTrayIcon::Trigger) {
            toggleVisible();
        }
    });
    m_trayIcon->show();
}

void PreferencesWindow::loadSettings()
{
    SettingsStore *settings = m_controller->settings();

    m_hotzoneLabel->setText(settings->hotzoneDescription());
    m_hotkeyField->setShortcut(settings->shortcut());

    // 初始化时不触发重新注册
    m_enabledCheckBox->blockSignals(true);
    m_enabledCheckBox->setChecked(settings->isHotkeyEnabled());
    m_enabledCheckBox->blockSignals(false);

    const bool configurable = settings->isShortcutConfigurable();
    m_hotkeyField->setEnabled(configurable);
    m_recordButton->setEnabled(configurable);

    m_statusLabel->setText(m_controller->statusText());
}

void PreferencesWindow::onShortcutCaptured(const ShortcutDefinition &shortcut)
{
    m_controller->applySettings(shortcut, m_enabledCheckBox->isChecked());
}

void PreferencesWindow::onEnabledToggled(bool checked)
{
    m_controller->applySettings(m_controller->settings()->shortcut(), checked);
}

void PreferencesWindow::onRecordShortcutRequested()
{
    show();
    raise();
    activateWindow();
    m_hotkeyField->setFocus(Qt::OtherFocusReason);
}

void PreferencesWindow::onHotzoneCaptureStarted()
{
    // 选择热区期间隐藏设置窗口，避免挡住遮罩
    m_wasVisibleBeforeCapture = isVisible();
    hide();
}

void PreferencesWindow::onHotzoneCaptureFinished()
{
    if (m_wasVisibleBeforeCapture) {
        show();
        raise();
    }
    m_wasVisibleBeforeCapture = false;
}

void PreferencesWindow::onStatusChanged(const QString &status)
{
    m_statusLabel->setText(status);
    if (m_trayIcon) {
        m_trayIcon->setToolTip(QString("Cursor Anchor\n%1").arg(status));
    }
}

void PreferencesWindow::toggleVisible()
{
    if (isVisible()) {
        hide();
    } else {
        show();
        raise();
        activateWindow();
    }
}
