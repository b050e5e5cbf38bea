#include <QApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QTimer>
#include <QDebug>

#include "appcontroller.h"
#include "preferenceswindow.h"
#include "settingsstore.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("CursorAnchor");
    QApplication::setOrganizationName("CursorAnchor");
    QApplication::setApplicationVersion("1.0");
    // 常驻后台，关闭设置窗口不退出
    QApplication::setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    parser.setApplicationDescription("用全局快捷键把鼠标光标移动到预设的热区");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption fixedShortcutOption("fixed-shortcut", "本次运行使用固定快捷键 ⌃⌥C，不允许修改");
    QCommandLineOption defineHotzoneOption("define-hotzone", "启动后立即进入热区选择");
    QCommandLineOption resetOption("reset", "启动前恢复默认设置");
    parser.addOption(fixedShortcutOption);
    parser.addOption(defineHotzoneOption);
    parser.addOption(resetOption);
    parser.process(app);

    SettingsStore settings;
    if (parser.isSet(resetOption)) {
        settings.resetToDefaults();
    }
    if (parser.isSet(fixedShortcutOption)) {
        settings.setShortcutConfigurable(false);
    }

    AppController controller(&settings);
    PreferencesWindow window(&controller);

    controller.startup();
    window.createTrayIcon();

    if (parser.isSet(defineHotzoneOption)) {
        QTimer::singleShot(0, &controller, &AppController::requestDefineHotzone);
    }

    return app.exec();
}
