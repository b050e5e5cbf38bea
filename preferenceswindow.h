#ifndef PREFERENCESWINDOW_H
#define PREFERENCESWINDOW_H

#include <QWidget>

#include "hotkeytypes.h"

QT_BEGIN_NAMESPACE
class QLabel;
class QPushButton;
class QCheckBox;
class QSystemTrayIcon;
class QMenu;
QT_END_NAMESPACE

class AppController;
class HotkeyCaptureField;

class PreferencesWindow : public QWidget
{
    Q_OBJECT

public:
    explicit PreferencesWindow(AppController *controller, QWidget *parent = nullptr);
    ~PreferencesWindow();

    void createTrayIcon();

private slots:
    void onShortcutCaptured(const ShortcutDefinition &shortcut);
    void onEnabledToggled(bool checked);
    void onRecordShortcutRequested();
    void onHotzoneCaptureStarted();
    void onHotzoneCaptureFinished();
    void onStatusChanged(const QString &status);
    void toggleVisible();

private:
    void setupUI();
    void setupConnections();
    void loadSettings();

    AppController *m_controller;

    // UI 组件
    QLabel *m_hotzoneLabel;
    QPushButton *m_defineButton;
    HotkeyCaptureField *m_hotkeyField;
    QPushButton *m_recordButton;
    QCheckBox *m_enabledCheckBox;
    QLabel *m_statusLabel;
    QPushButton *m_quitButton;

    // 托盘
    QSystemTrayIcon *m_trayIcon;
    QMenu *m_trayMenu;

    bool m_wasVisibleBeforeCapture;
};

#endif // PREFERENCESWINDOW_H
