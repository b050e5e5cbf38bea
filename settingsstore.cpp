#include "settingsstore.h"

#include <QDebug>
#include <QSettings>

namespace
{
const QString kEnabledKey = QStringLiteral("isHotkeyEnabled");
const QString kKeyCodeKey = QStringLiteral("hotkeyKeyCode");
const QString kModifiersKey = QStringLiteral("hotkeyModifiers");
const QString kDescriptionKey = QStringLiteral("hotzoneDescription");
const QString kHotzoneXKey = QStringLiteral("hotzoneX");
const QString kHotzoneYKey = QStringLiteral("hotzoneY");
const QString kConfigurableKey = QStringLiteral("shortcutConfigurable");
}

SettingsStore::SettingsStore(QSettings *settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_shortcutConfigurable(true)
{
    if (!m_settings) {
        m_settings = new QSettings("CursorAnchor", "CursorAnchor", this);
    }
    m_shortcutConfigurable = m_settings->value(kConfigurableKey, true).toBool();

    qDebug() << "配置文件:" << m_settings->fileName();
}

SettingsStore::~SettingsStore()
{
}

ShortcutDefinition SettingsStore::defaultShortcut()
{
    ShortcutDefinition shortcut;
    shortcut.keyCode = Qt::Key_C;
    shortcut.modifiers = HotkeyModifier::Control | HotkeyModifier::Option;
    return shortcut;
}

QString SettingsStore::undefinedHotzoneDescription()
{
    return QStringLiteral("未设置");
}

ShortcutDefinition SettingsStore::shortcut() const
{
    if (!m_shortcutConfigurable) {
        return defaultShortcut();
    }
    return storedShortcut();
}

ShortcutDefinition SettingsStore::storedShortcut() const
{
    const ShortcutDefinition defaults = defaultShortcut();

    ShortcutDefinition shortcut;
    shortcut.keyCode = m_settings->value(kKeyCodeKey, defaults.keyCode).toInt();
    shortcut.modifiers = HotkeyModifiers::fromInt(
        m_settings->value(kModifiersKey, defaults.modifiers.toInt()).toUInt());
    return shortcut;
}

bool SettingsStore::isHotkeyEnabled() const
{
    return m_settings->value(kEnabledKey, true).toBool();
}

std::optional<QPointF> SettingsStore::hotzone() const
{
    // 只有两个坐标都存在时热区才算已定义
    if (!m_settings->contains(kHotzoneXKey) || !m_settings->contains(kHotzoneYKey)) {
        return std::nullopt;
    }

    bool okX = false;
    bool okY = false;
    const double x = m_settings->value(kHotzoneXKey).toDouble(&okX);
    const double y = m_settings->value(kHotzoneYKey).toDouble(&okY);
    if (!okX || !okY) {
        qWarning() << "热区坐标无法解析，按未设置处理";
        return std::nullopt;
    }
    return QPointF(x, y);
}

QString SettingsStore::hotzoneDescription() const
{
    return m_settings->value(kDescriptionKey, undefinedHotzoneDescription()).toString();
}

void SettingsStore::setShortcut(const ShortcutDefinition &shortcut)
{
    if (!m_shortcutConfigurable) {
        qDebug() << "快捷键不可配置，忽略写入";
        return;
    }
    if (storedShortcut() == shortcut) {
        return;
    }

    m_settings->setValue(kKeyCodeKey, shortcut.keyCode);
    m_settings->setValue(kModifiersKey, shortcut.modifiers.toInt());
    m_settings->sync();

    emit shortcutChanged(shortcut);
}

void SettingsStore::setHotkeyEnabled(bool enabled)
{
    if (isHotkeyEnabled() == enabled) {
        return;
    }

    m_settings->setValue(kEnabledKey, enabled);
    m_settings->sync();

    emit hotkeyEnabledChanged(enabled);
}

void SettingsStore::setHotzone(const QPointF &point)
{
    const std::optional<QPointF> current = hotzone();
    if (current && *current == point) {
        return;
    }

    m_settings->setValue(kHotzoneXKey, point.x());
    m_settings->setValue(kHotzoneYKey, point.y());
    m_settings->setValue(kDescriptionKey,
                         QStringLiteral("(%1, %2)").arg(qRound(point.x())).arg(qRound(point.y())));
    m_settings->sync();

    emit hotzoneChanged();
}

void SettingsStore::setShortcutConfigurable(bool configurable)
{
    if (m_shortcutConfigurable == configurable) {
        return;
    }

    const ShortcutDefinition before = shortcut();
    m_shortcutConfigurable = configurable;
    const ShortcutDefinition after = shortcut();

    if (before != after) {
        emit shortcutChanged(after);
    }
}

void SettingsStore::resetToDefaults()
{
    const ShortcutDefinition oldShortcut = shortcut();
    const bool oldEnabled = isHotkeyEnabled();
    const bool hadHotzone = hotzone().has_value();

    m_settings->clear();
    m_settings->sync();
    m_shortcutConfigurable = true;

    qInfo() << "配置已恢复默认";

    if (oldShortcut != shortcut()) {
        emit shortcutChanged(shortcut());
    }
    if (oldEnabled != isHotkeyEnabled()) {
        emit hotkeyEnabledChanged(isHotkeyEnabled());
    }
    if (hadHotzone) {
        emit hotzoneChanged();
    }
}
