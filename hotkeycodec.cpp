#include "hotkeycodec.h"

#include <QStringList>

#ifdef Q_OS_MACOS
#include <Carbon/Carbon.h>
#else
#include <X11/X.h>
#include <X11/keysym.h>
#endif

namespace HotkeyCodec
{

namespace
{

struct KeyLabel {
    int qtKey;
    const char *label;
};

struct NativeKey {
    int qtKey;
    quint32 nativeKey;
};

struct ShiftedKey {
    int shiftedKey;
    int baseKey;
};

const KeyLabel s_labelTable[] = {
    { Qt::Key_A, "A" },
    { Qt::Key_B, "B" },
    { Qt::Key_C, "C" },
    { Qt::Key_D, "D" },
    { Qt::Key_E, "E" },
    { Qt::Key_F, "F" },
    { Qt::Key_G, "G" },
    { Qt::Key_H, "H" },
    { Qt::Key_I, "I" },
    { Qt::Key_J, "J" },
    { Qt::Key_K, "K" },
    { Qt::Key_L, "L" },
    { Qt::Key_M, "M" },
    { Qt::Key_N, "N" },
    { Qt::Key_O, "O" },
    { Qt::Key_P, "P" },
    { Qt::Key_Q, "Q" },
    { Qt::Key_R, "R" },
    { Qt::Key_S, "S" },
    { Qt::Key_T, "T" },
    { Qt::Key_U, "U" },
    { Qt::Key_V, "V" },
    { Qt::Key_W, "W" },
    { Qt::Key_X, "X" },
    { Qt::Key_Y, "Y" },
    { Qt::Key_Z, "Z" },
    { Qt::Key_0, "0" },
    { Qt::Key_1, "1" },
    { Qt::Key_2, "2" },
    { Qt::Key_3, "3" },
    { Qt::Key_4, "4" },
    { Qt::Key_5, "5" },
    { Qt::Key_6, "6" },
    { Qt::Key_7, "7" },
    { Qt::Key_8, "8" },
    { Qt::Key_9, "9" },
    { Qt::Key_Equal, "=" },
    { Qt::Key_Minus, "-" },
    { Qt::Key_BracketRight, "]" },
    { Qt::Key_BracketLeft, "[" },
    { Qt::Key_Apostrophe, "'" },
    { Qt::Key_Semicolon, ";" },
    { Qt::Key_Backslash, "\\" },
    { Qt::Key_Comma, "," },
    { Qt::Key_Slash, "/" },
    { Qt::Key_Period, "." },
    { Qt::Key_QuoteLeft, "`" },
    { Qt::Key_Space, "Space" },
    { Qt::Key_Escape, "Esc" },
};

#ifdef Q_OS_MACOS
// Carbon 虚拟键码
const NativeKey s_nativeKeyTable[] = {
    { Qt::Key_A, kVK_ANSI_A },
    { Qt::Key_B, kVK_ANSI_B },
    { Qt::Key_C, kVK_ANSI_C },
    { Qt::Key_D, kVK_ANSI_D },
    { Qt::Key_E, kVK_ANSI_E },
    { Qt::Key_F, kVK_ANSI_F },
    { Qt::Key_G, kVK_ANSI_G },
    { Qt::Key_H, kVK_ANSI_H },
    { Qt::Key_I, kVK_ANSI_I },
    { Qt::Key_J, kVK_ANSI_J },
    { Qt::Key_K, kVK_ANSI_K },
    { Qt::Key_L, kVK_ANSI_L },
    { Qt::Key_M, kVK_ANSI_M },
    { Qt::Key_N, kVK_ANSI_N },
    { Qt::Key_O, kVK_ANSI_O },
    { Qt::Key_P, kVK_ANSI_P },
    { Qt::Key_Q, kVK_ANSI_Q },
    { Qt::Key_R, kVK_ANSI_R },
    { Qt::Key_S, kVK_ANSI_S },
    { Qt::Key_T, kVK_ANSI_T },
    { Qt::Key_U, kVK_ANSI_U },
    { Qt::Key_V, kVK_ANSI_V },
    { Qt::Key_W, kVK_ANSI_W },
    { Qt::Key_X, kVK_ANSI_X },
    { Qt::Key_Y, kVK_ANSI_Y },
    { Qt::Key_Z, kVK_ANSI_Z },
    { Qt::Key_0, kVK_ANSI_0 },
    { Qt::Key_1, kVK_ANSI_1 },
    { Qt::Key_2, kVK_ANSI_2 },
    { Qt::Key_3, kVK_ANSI_3 },
    { Qt::Key_4, kVK_ANSI_4 },
    { Qt::Key_5, kVK_ANSI_5 },
    { Qt::Key_6, kVK_ANSI_6 },
    { Qt::Key_7, kVK_ANSI_7 },
    { Qt::Key_8, kVK_ANSI_8 },
    { Qt::Key_9, kVK_ANSI_9 },
    { Qt::Key_Equal, kVK_ANSI_Equal },
    { Qt::Key_Minus, kVK_ANSI_Minus },
    { Qt::Key_BracketRight, kVK_ANSI_RightBracket },
    { Qt::Key_BracketLeft, kVK_ANSI_LeftBracket },
    { Qt::Key_Apostrophe, kVK_ANSI_Quote },
    { Qt::Key_Semicolon, kVK_ANSI_Semicolon },
    { Qt::Key_Backslash, kVK_ANSI_Backslash },
    { Qt::Key_Comma, kVK_ANSI_Comma },
    { Qt::Key_Slash, kVK_ANSI_Slash },
    { Qt::Key_Period, kVK_ANSI_Period },
    { Qt::Key_QuoteLeft, kVK_ANSI_Grave },
    { Qt::Key_Space, kVK_Space },
    { Qt::Key_Escape, kVK_Escape },
    // 以下按键没有显示标签，但可以注册
    { Qt::Key_F1, kVK_F1 },
    { Qt::Key_F2, kVK_F2 },
    { Qt::Key_F3, kVK_F3 },
    { Qt::Key_F4, kVK_F4 },
    { Qt::Key_F5, kVK_F5 },
    { Qt::Key_F6, kVK_F6 },
    { Qt::Key_F7, kVK_F7 },
    { Qt::Key_F8, kVK_F8 },
    { Qt::Key_F9, kVK_F9 },
    { Qt::Key_F10, kVK_F10 },
    { Qt::Key_F11, kVK_F11 },
    { Qt::Key_F12, kVK_F12 },
    { Qt::Key_Return, kVK_Return },
    { Qt::Key_Tab, kVK_Tab },
    { Qt::Key_Backspace, kVK_Delete },
    { Qt::Key_Delete, kVK_ForwardDelete },
    { Qt::Key_Home, kVK_Home },
    { Qt::Key_End, kVK_End },
    { Qt::Key_PageUp, kVK_PageUp },
    { Qt::Key_PageDown, kVK_PageDown },
    { Qt::Key_Left, kVK_LeftArrow },
    { Qt::Key_Right, kVK_RightArrow },
    { Qt::Key_Up, kVK_UpArrow },
    { Qt::Key_Down, kVK_DownArrow },
};
#else
// X11 keysym，注册时再换成当前布局的 keycode
const NativeKey s_nativeKeyTable[] = {
    { Qt::Key_A, XK_A },
    { Qt::Key_B, XK_B },
    { Qt::Key_C, XK_C },
    { Qt::Key_D, XK_D },
    { Qt::Key_E, XK_E },
    { Qt::Key_F, XK_F },
    { Qt::Key_G, XK_G },
    { Qt::Key_H, XK_H },
    { Qt::Key_I, XK_I },
    { Qt::Key_J, XK_J },
    { Qt::Key_K, XK_K },
    { Qt::Key_L, XK_L },
    { Qt::Key_M, XK_M },
    { Qt::Key_N, XK_N },
    { Qt::Key_O, XK_O },
    { Qt::Key_P, XK_P },
    { Qt::Key_Q, XK_Q },
    { Qt::Key_R, XK_R },
    { Qt::Key_S, XK_S },
    { Qt::Key_T, XK_T },
    { Qt::Key_U, XK_U },
    { Qt::Key_V, XK_V },
    { Qt::Key_W, XK_W },
    { Qt::Key_X, XK_X },
    { Qt::Key_Y, XK_Y },
    { Qt::Key_Z, XK_Z },
    { Qt::Key_0, XK_0 },
    { Qt::Key_1, XK_1 },
    { Qt::Key_2, XK_2 },
    { Qt::Key_3, XK_3 },
    { Qt::Key_4, XK_4 },
    { Qt::Key_5, XK_5 },
    { Qt::Key_6, XK_6 },
    { Qt::Key_7, XK_7 },
    { Qt::Key_8, XK_8 },
    { Qt::Key_9, XK_9 },
    { Qt::Key_Equal, XK_equal },
    { Qt::Key_Minus, XK_minus },
    { Qt::Key_BracketRight, XK_bracketright },
    { Qt::Key_BracketLeft, XK_bracketleft },
    { Qt::Key_Apostrophe, XK_apostrophe },
    { Qt::Key_Semicolon, XK_semicolon },
    { Qt::Key_Backslash, XK_backslash },
    { Qt::Key_Comma, XK_comma },
    { Qt::Key_Slash, XK_slash },
    { Qt::Key_Period, XK_period },
    { Qt::Key_QuoteLeft, XK_grave },
    { Qt::Key_Space, XK_space },
    { Qt::Key_Escape, XK_Escape },
    // 以下按键没有显示标签，但可以注册
    { Qt::Key_F1, XK_F1 },
    { Qt::Key_F2, XK_F2 },
    { Qt::Key_F3, XK_F3 },
    { Qt::Key_F4, XK_F4 },
    { Qt::Key_F5, XK_F5 },
    { Qt::Key_F6, XK_F6 },
    { Qt::Key_F7, XK_F7 },
    { Qt::Key_F8, XK_F8 },
    { Qt::Key_F9, XK_F9 },
    { Qt::Key_F10, XK_F10 },
    { Qt::Key_F11, XK_F11 },
    { Qt::Key_F12, XK_F12 },
    { Qt::Key_Return, XK_Return },
    { Qt::Key_Tab, XK_Tab },
    { Qt::Key_Backspace, XK_BackSpace },
    { Qt::Key_Delete, XK_Delete },
    { Qt::Key_Home, XK_Home },
    { Qt::Key_End, XK_End },
    { Qt::Key_PageUp, XK_Prior },
    { Qt::Key_PageDown, XK_Next },
    { Qt::Key_Left, XK_Left },
    { Qt::Key_Right, XK_Right },
    { Qt::Key_Up, XK_Up },
    { Qt::Key_Down, XK_Down },
};
#endif

// 按住 Shift 时 Qt 报告的是上档符号（美式布局），录制时换回基础键
const ShiftedKey s_shiftedSymbols[] = {
    { Qt::Key_Exclam, Qt::Key_1 },
    { Qt::Key_At, Qt::Key_2 },
    { Qt::Key_NumberSign, Qt::Key_3 },
    { Qt::Key_Dollar, Qt::Key_4 },
    { Qt::Key_Percent, Qt::Key_5 },
    { Qt::Key_AsciiCircum, Qt::Key_6 },
    { Qt::Key_Ampersand, Qt::Key_7 },
    { Qt::Key_Asterisk, Qt::Key_8 },
    { Qt::Key_ParenLeft, Qt::Key_9 },
    { Qt::Key_ParenRight, Qt::Key_0 },
    { Qt::Key_Underscore, Qt::Key_Minus },
    { Qt::Key_Plus, Qt::Key_Equal },
    { Qt::Key_BraceLeft, Qt::Key_BracketLeft },
    { Qt::Key_BraceRight, Qt::Key_BracketRight },
    { Qt::Key_Bar, Qt::Key_Backslash },
    { Qt::Key_Colon, Qt::Key_Semicolon },
    { Qt::Key_QuoteDbl, Qt::Key_Apostrophe },
    { Qt::Key_Less, Qt::Key_Comma },
    { Qt::Key_Greater, Qt::Key_Period },
    { Qt::Key_Question, Qt::Key_Slash },
    { Qt::Key_AsciiTilde, Qt::Key_QuoteLeft },
    { Qt::Key_Backtab, Qt::Key_Tab },
};

const KeyLabel *findLabel(int qtKey)
{
    for (const KeyLabel &entry : s_labelTable) {
        if (entry.qtKey == qtKey) {
            return &entry;
        }
    }
    return nullptr;
}

const KeyLabel *findByLabel(const QString &label)
{
    for (const KeyLabel &entry : s_labelTable) {
        if (label == QLatin1String(entry.label)) {
            return &entry;
        }
    }
    return nullptr;
}

struct ModifierGlyph {
    HotkeyModifier modifier;
    QChar glyph;
};

// 规范顺序：control, option, shift, command
const ModifierGlyph s_glyphs[] = {
    { HotkeyModifier::Control, QChar(0x2303) },
    { HotkeyModifier::Option,  QChar(0x2325) },
    { HotkeyModifier::Shift,   QChar(0x21E7) },
    { HotkeyModifier::Command, QChar(0x2318) },
};

const QLatin1String s_fallbackPrefix("Key");

QStringList modifierParts(HotkeyModifiers modifiers)
{
    QStringList parts;
    for (const ModifierGlyph &g : s_glyphs) {
        if (modifiers.testFlag(g.modifier)) {
            parts << QString(g.glyph);
        }
    }
    return parts;
}

} // namespace

QString encodeForDisplay(const ShortcutDefinition &shortcut)
{
    QStringList parts = modifierParts(shortcut.modifiers);
    if (shortcut.hasKey()) {
        parts << keyLabelOrFallback(shortcut.keyCode);
    }
    return parts.join(QLatin1Char(' '));
}

QString encodeForDisplay(HotkeyModifiers modifiers)
{
    return modifierParts(modifiers).join(QLatin1Char(' '));
}

std::optional<ShortcutDefinition> parseDisplay(const QString &text)
{
    const QStringList tokens = text.split(QLatin1Char(' '), Qt::SkipEmptyParts);

    ShortcutDefinition result;
    int index = 0;
    for (; index < tokens.size(); ++index) {
        const QString &token = tokens.at(index);
        bool isGlyph = false;
        if (token.size() == 1) {
            for (const ModifierGlyph &g : s_glyphs) {
                if (token.at(0) == g.glyph) {
                    result.modifiers |= g.modifier;
                    isGlyph = true;
                    break;
                }
            }
        }
        if (!isGlyph) {
            break;
        }
    }

    const int remaining = tokens.size() - index;
    if (remaining == 0) {
        return result;
    }

    if (remaining == 1) {
        const KeyLabel *entry = findByLabel(tokens.at(index));
        if (!entry) {
            return std::nullopt;
        }
        result.keyCode = entry->qtKey;
        return result;
    }

    // "Key <code>" 回退形式
    if (remaining == 2 && tokens.at(index) == s_fallbackPrefix) {
        bool ok = false;
        const int code = tokens.at(index + 1).toInt(&ok);
        if (!ok || code == 0) {
            return std::nullopt;
        }
        result.keyCode = code;
        return result;
    }

    return std::nullopt;
}

std::optional<QString> keyLabel(int keyCode)
{
    const KeyLabel *entry = findLabel(keyCode);
    if (!entry) {
        return std::nullopt;
    }
    return QString::fromLatin1(entry->label);
}

QString keyLabelOrFallback(int keyCode)
{
    const std::optional<QString> label = keyLabel(keyCode);
    if (label) {
        return *label;
    }
    return QStringLiteral("%1 %2").arg(s_fallbackPrefix).arg(keyCode);
}

quint32 toNativeModifierMask(HotkeyModifiers modifiers)
{
    quint32 mask = 0;
#ifdef Q_OS_MACOS
    if (modifiers.testFlag(HotkeyModifier::Control)) mask |= controlKey;
    if (modifiers.testFlag(HotkeyModifier::Option))  mask |= optionKey;
    if (modifiers.testFlag(HotkeyModifier::Shift))   mask |= shiftKey;
    if (modifiers.testFlag(HotkeyModifier::Command)) mask |= cmdKey;
#else
    if (modifiers.testFlag(HotkeyModifier::Control)) mask |= ControlMask;
    if (modifiers.testFlag(HotkeyModifier::Option))  mask |= Mod1Mask;
    if (modifiers.testFlag(HotkeyModifier::Shift))   mask |= ShiftMask;
    if (modifiers.testFlag(HotkeyModifier::Command)) mask |= Mod4Mask;
#endif
    return mask;
}

std::optional<quint32> toNativeKeyCode(int keyCode)
{
    for (const NativeKey &entry : s_nativeKeyTable) {
        if (entry.qtKey == keyCode) {
            return entry.nativeKey;
        }
    }
    return std::nullopt;
}

int unshiftedKey(int qtKey)
{
    for (const ShiftedKey &entry : s_shiftedSymbols) {
        if (entry.shiftedKey == qtKey) {
            return entry.baseKey;
        }
    }
    return qtKey;
}

HotkeyModifiers fromQtModifiers(Qt::KeyboardModifiers modifiers)
{
    HotkeyModifiers result;
#ifdef Q_OS_MACOS
    // macOS 上 Qt 把 Command 报告为 ControlModifier，把 Control 报告为 MetaModifier
    if (modifiers & Qt::MetaModifier)    result |= HotkeyModifier::Control;
    if (modifiers & Qt::ControlModifier) result |= HotkeyModifier::Command;
#else
    if (modifiers & Qt::ControlModifier) result |= HotkeyModifier::Control;
    if (modifiers & Qt::MetaModifier)    result |= HotkeyModifier::Command;
#endif
    if (modifiers & Qt::AltModifier)     result |= HotkeyModifier::Option;
    if (modifiers & Qt::ShiftModifier)   result |= HotkeyModifier::Shift;
    return result;
}

Qt::KeyboardModifiers toQtModifiers(HotkeyModifiers modifiers)
{
    Qt::KeyboardModifiers result = Qt::NoModifier;
#ifdef Q_OS_MACOS
    if (modifiers.testFlag(HotkeyModifier::Control)) result |= Qt::MetaModifier;
    if (modifiers.testFlag(HotkeyModifier::Command)) result |= Qt::ControlModifier;
#else
    if (modifiers.testFlag(HotkeyModifier::Control)) result |= Qt::ControlModifier;
    if (modifiers.testFlag(HotkeyModifier::Command)) result |= Qt::MetaModifier;
#endif
    if (modifiers.testFlag(HotkeyModifier::Option))  result |= Qt::AltModifier;
    if (modifiers.testFlag(HotkeyModifier::Shift))   result |= Qt::ShiftModifier;
    return result;
}

HotkeyModifiers modifierForKey(int qtKey)
{
    switch (qtKey) {
    case Qt::Key_Control:
#ifdef Q_OS_MACOS
        return HotkeyModifier::Command;
#else
        return HotkeyModifier::Control;
#endif
    case Qt::Key_Meta:
#ifdef Q_OS_MACOS
        return HotkeyModifier::Control;
#else
        return HotkeyModifier::Command;
#endif
    case Qt::Key_Super_L:
    case Qt::Key_Super_R:
        return HotkeyModifier::Command;
    case Qt::Key_Alt:
    case Qt::Key_AltGr:
        return HotkeyModifier::Option;
    case Qt::Key_Shift:
        return HotkeyModifier::Shift;
    default:
        return HotkeyModifiers();
    }
}

} // namespace HotkeyCodec
