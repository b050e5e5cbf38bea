#ifndef HOTKEYCAPTUREFIELD_H
#define HOTKEYCAPTUREFIELD_H

#include <QLineEdit>
#include <QKeyEvent>
#include <QFocusEvent>

#include "hotkeytypes.h"

// 录制快捷键的输入框。获得焦点后开始录制，实时显示按住的修饰键；
// 至少按住一个修饰键时按下普通键即完成录制并交出焦点。
class HotkeyCaptureField : public QLineEdit
{
    Q_OBJECT

public:
    explicit HotkeyCaptureField(QWidget *parent = nullptr);
    ~HotkeyCaptureField();

    void setShortcut(const ShortcutDefinition &shortcut);
    ShortcutDefinition shortcut() const { return m_shortcut; }

    bool isRecording() const { return m_recording; }
    HotkeyModifiers heldModifiers() const { return m_heldModifiers; }

signals:
    void shortcutCaptured(const ShortcutDefinition &shortcut);
    // 录制期间宿主应暂停全局快捷键，否则当前快捷键会被系统截走
    void recordingStarted();
    void recordingFinished();

protected:
    bool event(QEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void keyReleaseEvent(QKeyEvent *event) override;
    void focusInEvent(QFocusEvent *event) override;
    void focusOutEvent(QFocusEvent *event) override;

private:
    void updateDisplay();

    ShortcutDefinition m_shortcut;
    HotkeyModifiers m_heldModifiers;
    bool m_recording;
};

#endif // HOTKEYCAPTUREFIELD_H
