#ifndef HOTKEYCODEC_H
#define HOTKEYCODEC_H

#include <QString>
#include <Qt>

#include <optional>

#include "hotkeytypes.h"

// 快捷键编码：显示字符串、按键标签以及平台原生的注册表示。
// 全部为无状态的纯函数。
namespace HotkeyCodec
{

// 修饰键符号按 ⌃ ⌥ ⇧ ⌘ 的固定顺序输出，之后是按键标签（若有）
QString encodeForDisplay(const ShortcutDefinition &shortcut);
QString encodeForDisplay(HotkeyModifiers modifiers);

// 解析 encodeForDisplay() 生成的字符串
std::optional<ShortcutDefinition> parseDisplay(const QString &text);

// 仅覆盖字母、数字、常用标点、空格与 Esc，其余按键没有标签
std::optional<QString> keyLabel(int keyCode);
QString keyLabelOrFallback(int keyCode);

quint32 toNativeModifierMask(HotkeyModifiers modifiers);

// 可注册的按键多于有标签的按键（功能键、方向键等）
std::optional<quint32> toNativeKeyCode(int keyCode);

// Shift 产生的上档符号换回基础键，例如 Key_Exclam -> Key_1；其他按键原样返回
int unshiftedKey(int qtKey);

HotkeyModifiers fromQtModifiers(Qt::KeyboardModifiers modifiers);
Qt::KeyboardModifiers toQtModifiers(HotkeyModifiers modifiers);

// 若 qtKey 本身是修饰键，返回对应的修饰位，否则返回空
HotkeyModifiers modifierForKey(int qtKey);

} // namespace HotkeyCodec

#endif // HOTKEYCODEC_H
