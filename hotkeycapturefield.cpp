#include "hotkeycapturefield.h"
#include "hotkeycodec.h"

#include <QDebug>

HotkeyCaptureField::HotkeyCaptureField(QWidget *parent)
    : QLineEdit(parent)
    , m_recording(false)
{
    setReadOnly(true);
    setAlignment(Qt::AlignCenter);
    setFocusPolicy(Qt::StrongFocus);
    setContextMenuPolicy(Qt::NoContextMenu);
    setPlaceholderText(QStringLiteral("请按下快捷键…"));
}

HotkeyCaptureField::~HotkeyCaptureField()
{
}

void HotkeyCaptureField::setShortcut(const ShortcutDefinition &shortcut)
{
    m_shortcut = shortcut;
    if (!m_recording) {
        setText(HotkeyCodec::encodeForDisplay(m_shortcut));
    }
}

bool HotkeyCaptureField::event(QEvent *event)
{
    if (m_recording) {
        // 录制期间 Tab 与应用内快捷键也要交给录制逻辑
        if (event->type() == QEvent::ShortcutOverride) {
            event->accept();
            return true;
        }
        if (event->type() == QEvent::KeyPress) {
            keyPressEvent(static_cast<QKeyEvent *>(event));
            return true;
        }
    }
    return QLineEdit::event(event);
}

void HotkeyCaptureField::keyPressEvent(QKeyEvent *event)
{
    if (!m_recording) {
        event->ignore();
        return;
    }
    event->accept();

    const int key = event->key();
    const HotkeyModifiers pressedModifier = HotkeyCodec::modifierForKey(key);
    if (pressedModifier != HotkeyModifiers()) {
        m_heldModifiers = HotkeyCodec::fromQtModifiers(event->modifiers()) | pressedModifier;
        updateDisplay();
        return;
    }

    if (key == 0 || key == Qt::Key_unknown) {
        return;
    }

    const HotkeyModifiers modifiers = HotkeyCodec::fromQtModifiers(event->modifiers());
    if (!modifiers) {
        // 没有修饰键的组合不能作为全局快捷键
        qDebug() << "忽略没有修饰键的按键:" << HotkeyCodec::keyLabelOrFallback(key);
        return;
    }

    const int baseKey = modifiers.testFlag(HotkeyModifier::Shift) ? HotkeyCodec::unshiftedKey(key) : key;
    if (!HotkeyCodec::toNativeKeyCode(baseKey)) {
        // 无法注册的按键不接受，继续录制
        qDebug() << "此按键不能用作全局快捷键:" << HotkeyCodec::keyLabelOrFallback(baseKey);
        return;
    }

    ShortcutDefinition captured;
    captured.keyCode = baseKey;
    captured.modifiers = modifiers;

    m_shortcut = captured;
    m_heldModifiers = HotkeyModifiers();
    m_recording = false;
    setText(HotkeyCodec::encodeForDisplay(m_shortcut));

    qDebug() << "录制到快捷键:" << text();
    emit shortcutCaptured(m_shortcut);
    emit recordingFinished();

    clearFocus();
}

void HotkeyCaptureField::keyReleaseEvent(QKeyEvent *event)
{
    if (!m_recording) {
        event->ignore();
        return;
    }
    event->accept();

    const HotkeyModifiers releasedModifier = HotkeyCodec::modifierForKey(event->key());
    if (!releasedModifier) {
        return;
    }

    // 松开事件里的修饰键状态仍包含被松开的键
    m_heldModifiers = HotkeyCodec::fromQtModifiers(event->modifiers()) & ~releasedModifier;
    updateDisplay();
}

void HotkeyCaptureField::focusInEvent(QFocusEvent *event)
{
    QLineEdit::focusInEvent(event);

    m_recording = true;
    m_heldModifiers = HotkeyModifiers();
    clear();
    emit recordingStarted();
}

void HotkeyCaptureField::focusOutEvent(QFocusEvent *event)
{
    QLineEdit::focusOutEvent(event);

    if (m_recording) {
        // 未完成录制，恢复原来的快捷键
        m_recording = false;
        m_heldModifiers = HotkeyModifiers();
        setText(HotkeyCodec::encodeForDisplay(m_shortcut));
        emit recordingFinished();
    }
}

void HotkeyCaptureField::updateDisplay()
{
    setText(HotkeyCodec::encodeForDisplay(m_heldModifiers));
}
