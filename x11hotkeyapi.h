#ifndef X11HOTKEYAPI_H
#define X11HOTKEYAPI_H

#include <QObject>

#include <vector>

#include "nativehotkeyapi.h"

class QSocketNotifier;
struct _XDisplay;

// 通过独立的 X 连接对根窗口做 XGrabKey，连接的套接字挂在 Qt 事件循环上，
// 因此回调始终在 GUI 线程中触发。
class X11HotkeyApi : public QObject, public NativeHotkeyApi
{
    Q_OBJECT

public:
    explicit X11HotkeyApi(QObject *parent = nullptr);
    ~X11HotkeyApi() override;

    bool registerHotkey(quint32 nativeKey, quint32 nativeModifiers,
                        quint32 signature, quint32 id, Handle *outHandle) override;
    void unregisterHotkey(Handle handle) override;

    bool installHandler(quint32 signature, quint32 id,
                        Callback callback, void *userData, Handle *outHandle) override;
    void removeHandler(Handle handle) override;

    long lastStatus() const override { return m_lastStatus; }

private slots:
    void processEvents();

private:
    struct Grab {
        Handle handle;
        unsigned int keycode;
        unsigned int modifiers;
        quint32 signature;
        quint32 id;
    };

    struct Handler {
        Handle handle;
        quint32 signature;
        quint32 id;
        Callback callback;
        void *userData;
    };

    bool grabKey(unsigned int keycode, unsigned int modifiers);
    void ungrabKey(unsigned int keycode, unsigned int modifiers);

    _XDisplay *m_display;
    QSocketNotifier *m_notifier;
    std::vector<Grab> m_grabs;
    std::vector<Handler> m_handlers;
    Handle m_nextHandle;
    long m_lastStatus;
};

#endif // X11HOTKEYAPI_H
