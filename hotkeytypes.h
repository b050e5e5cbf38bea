#ifndef HOTKEYTYPES_H
#define HOTKEYTYPES_H

#include <QFlags>
#include <QMetaType>

enum class HotkeyModifier : unsigned int {
    NoModifier = 0x0,
    Control    = 0x1,
    Option     = 0x2,
    Shift      = 0x4,
    Command    = 0x8
};
Q_DECLARE_FLAGS(HotkeyModifiers, HotkeyModifier)
Q_DECLARE_OPERATORS_FOR_FLAGS(HotkeyModifiers)

// keyCode 为 Qt::Key 值，0 表示尚未指定按键
struct ShortcutDefinition {
    int keyCode = 0;
    HotkeyModifiers modifiers;

    bool hasKey() const { return keyCode != 0; }
    bool hasModifiers() const { return modifiers != HotkeyModifiers(); }
};

inline bool operator==(const ShortcutDefinition &a, const ShortcutDefinition &b)
{
    return a.keyCode == b.keyCode && a.modifiers == b.modifiers;
}

inline bool operator!=(const ShortcutDefinition &a, const ShortcutDefinition &b)
{
    return !(a == b);
}

enum class HotkeyError {
    NoError,
    RegistrationFailed,    // 系统拒绝该组合（例如已被其他程序占用）
    HandlerInstallFailed   // 注册成功但事件回调安装失败
};

Q_DECLARE_METATYPE(ShortcutDefinition)
Q_DECLARE_METATYPE(HotkeyError)

#endif // HOTKEYTYPES_H
