#ifndef SETTINGSSTORE_H
#define SETTINGSSTORE_H

#include <QObject>
#include <QPointF>
#include <QString>

#include <optional>

#include "hotkeytypes.h"

class QSettings;

// 持久化配置：快捷键、启用开关与热区坐标。
// 每次写入立即落盘并同步发出变更信号，不做任何校验。
class SettingsStore : public QObject
{
    Q_OBJECT

public:
    // settings 为空时使用默认的 QSettings("CursorAnchor", "CursorAnchor")
    explicit SettingsStore(QSettings *settings = nullptr, QObject *parent = nullptr);
    ~SettingsStore();

    static ShortcutDefinition defaultShortcut();
    static QString undefinedHotzoneDescription();

    ShortcutDefinition shortcut() const;
    bool isHotkeyEnabled() const;
    std::optional<QPointF> hotzone() const;
    QString hotzoneDescription() const;

    void setShortcut(const ShortcutDefinition &shortcut);
    void setHotkeyEnabled(bool enabled);
    void setHotzone(const QPointF &point);

    // 为 false 时快捷键固定为默认值，setShortcut() 被忽略
    bool isShortcutConfigurable() const { return m_shortcutConfigurable; }
    void setShortcutConfigurable(bool configurable);

    // 清除全部键，恢复首次运行时的状态
    void resetToDefaults();

signals:
    void shortcutChanged(const ShortcutDefinition &shortcut);
    void hotkeyEnabledChanged(bool enabled);
    void hotzoneChanged();

private:
    ShortcutDefinition storedShortcut() const;

    QSettings *m_settings;
    bool m_shortcutConfigurable;
};

#endif // SETTINGSSTORE_H
