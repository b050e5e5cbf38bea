#include <QTest>
#include <QSignalSpy>
#include <QSettings>
#include <QTemporaryDir>

#include <memory>

#include "settingsstore.h"

class TestSettingsStore : public QObject
{
    Q_OBJECT

private:
    QString settingsPath() const { return m_dir->filePath(QStringLiteral("settings.ini")); }

    std::unique_ptr<QSettings> openSettings() const
    {
        return std::make_unique<QSettings>(settingsPath(), QSettings::IniFormat);
    }

    std::unique_ptr<QTemporaryDir> m_dir;

private slots:
    void initTestCase()
    {
        qRegisterMetaType<ShortcutDefinition>();
    }

    void init()
    {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
    }

    void test_firstRun_defaults()
    {
        auto backend = openSettings();
        SettingsStore store(backend.get());

        QVERIFY(store.isHotkeyEnabled());
        QCOMPARE(store.shortcut(), SettingsStore::defaultShortcut());
        QCOMPARE(store.shortcut().keyCode, int(Qt::Key_C));
        QCOMPARE(store.shortcut().modifiers, HotkeyModifier::Control | HotkeyModifier::Option);
        QVERIFY(!store.hotzone().has_value());
        QCOMPARE(store.hotzoneDescription(), SettingsStore::undefinedHotzoneDescription());
        QVERIFY(store.isShortcutConfigurable());
    }

    void test_hotzone_persistsAcrossInstances()
    {
        {
            auto backend = openSettings();
            SettingsStore store(backend.get());
            QSignalSpy spy(&store, &SettingsStore::hotzoneChanged);

            store.setHotzone(QPointF(812.4, 412.6));
            QCOMPARE(spy.count(), 1);
            QCOMPARE(store.hotzoneDescription(), QStringLiteral("(812, 413)"));
        }

        auto backend = openSettings();
        SettingsStore reopened(backend.get());
        QVERIFY(reopened.hotzone().has_value());
        QCOMPARE(*reopened.hotzone(), QPointF(812.4, 412.6));
        QCOMPARE(reopened.hotzoneDescription(), QStringLiteral("(812, 413)"));
    }

    void test_negativeCoordinates_onSecondaryDisplay()
    {
        auto backend = openSettings();
        SettingsStore store(backend.get());

        store.setHotzone(QPointF(-1280.0, 200.0));
        QCOMPARE(*store.hotzone(), QPointF(-1280.0, 200.0));
        QCOMPARE(store.hotzoneDescription(), QStringLiteral("(-1280, 200)"));
    }

    void test_shortcut_notifiesOncePerChange()
    {
        auto backend = openSettings();
        SettingsStore store(backend.get());
        QSignalSpy spy(&store, &SettingsStore::shortcutChanged);

        ShortcutDefinition shortcut;
        shortcut.keyCode = Qt::Key_J;
        shortcut.modifiers = HotkeyModifier::Command | HotkeyModifier::Shift;

        store.setShortcut(shortcut);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).value<ShortcutDefinition>(), shortcut);
        QCOMPARE(store.shortcut(), shortcut);

        // 相同的值不再通知
        store.setShortcut(shortcut);
        QCOMPARE(spy.count(), 1);

        auto again = openSettings();
        SettingsStore reopened(again.get());
        QCOMPARE(reopened.shortcut(), shortcut);
    }

    void test_emptyModifierShortcut_isStoredAsIs()
    {
        auto backend = openSettings();
        SettingsStore store(backend.get());

        ShortcutDefinition bare;
        bare.keyCode = Qt::Key_A;
        store.setShortcut(bare);

        QCOMPARE(store.shortcut(), bare);
        QVERIFY(!store.shortcut().hasModifiers());
    }

    void test_enabledFlag()
    {
        auto backend = openSettings();
        SettingsStore store(backend.get());
        QSignalSpy spy(&store, &SettingsStore::hotkeyEnabledChanged);

        // 首次运行默认即为启用
        store.setHotkeyEnabled(true);
        QCOMPARE(spy.count(), 0);

        store.setHotkeyEnabled(false);
        QCOMPARE(spy.count(), 1);

        store.setHotkeyEnabled(false);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.last().at(0).toBool(), false);
        QVERIFY(!store.isHotkeyEnabled());
        QCOMPARE(backend->value(QStringLiteral("isHotkeyEnabled")).toBool(), false);
    }

    void test_fixedShortcut_ignoresWrites()
    {
        auto backend = openSettings();
        SettingsStore store(backend.get());

        ShortcutDefinition custom;
        custom.keyCode = Qt::Key_K;
        custom.modifiers = HotkeyModifier::Control;
        store.setShortcut(custom);

        QSignalSpy spy(&store, &SettingsStore::shortcutChanged);
        store.setShortcutConfigurable(false);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(store.shortcut(), SettingsStore::defaultShortcut());

        ShortcutDefinition other;
        other.keyCode = Qt::Key_L;
        other.modifiers = HotkeyModifier::Option;
        store.setShortcut(other);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(store.shortcut(), SettingsStore::defaultShortcut());

        // 解除锁定后恢复之前保存的值
        store.setShortcutConfigurable(true);
        QCOMPARE(store.shortcut(), custom);
    }

    void test_fixedShortcut_readFromSettings()
    {
        auto backend = openSettings();
        backend->setValue(QStringLiteral("shortcutConfigurable"), false);
        backend->setValue(QStringLiteral("hotkeyKeyCode"), int(Qt::Key_Z));

        SettingsStore store(backend.get());
        QVERIFY(!store.isShortcutConfigurable());
        QCOMPARE(store.shortcut(), SettingsStore::defaultShortcut());
    }

    void test_resetToDefaults()
    {
        auto backend = openSettings();
        SettingsStore store(backend.get());

        ShortcutDefinition custom;
        custom.keyCode = Qt::Key_1;
        custom.modifiers = HotkeyModifier::Shift;
        store.setShortcut(custom);
        store.setHotkeyEnabled(false);
        store.setHotzone(QPointF(10, 20));

        QSignalSpy shortcutSpy(&store, &SettingsStore::shortcutChanged);
        QSignalSpy enabledSpy(&store, &SettingsStore::hotkeyEnabledChanged);
        QSignalSpy hotzoneSpy(&store, &SettingsStore::hotzoneChanged);

        store.resetToDefaults();

        QCOMPARE(shortcutSpy.count(), 1);
        QCOMPARE(enabledSpy.count(), 1);
        QCOMPARE(hotzoneSpy.count(), 1);
        QCOMPARE(store.shortcut(), SettingsStore::defaultShortcut());
        QVERIFY(store.isHotkeyEnabled());
        QVERIFY(!store.hotzone().has_value());
        QCOMPARE(store.hotzoneDescription(), SettingsStore::undefinedHotzoneDescription());
    }

    void test_corruptHotzone_treatedAsUndefined()
    {
        auto backend = openSettings();
        backend->setValue(QStringLiteral("hotzoneX"), QStringLiteral("left"));
        backend->setValue(QStringLiteral("hotzoneY"), 100.0);

        SettingsStore store(backend.get());
        QVERIFY(!store.hotzone().has_value());
    }
};

QTEST_GUILESS_MAIN(TestSettingsStore)
#include "test_settingsstore.moc"
