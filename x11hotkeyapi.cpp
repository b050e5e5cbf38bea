#include "x11hotkeyapi.h"

#include <QAbstractEventDispatcher>
#include <QCoreApplication>
#include <QDebug>
#include <QSocketNotifier>

#include <algorithm>

#include <X11/Xlib.h>
#include <X11/keysym.h>

namespace
{

// NumLock(Mod2) 与 CapsLock 状态不同也要命中同一个快捷键
const unsigned int s_lockVariants[] = { 0, Mod2Mask, LockMask, Mod2Mask | LockMask };
const unsigned int s_relevantModifiers = ShiftMask | ControlMask | Mod1Mask | Mod4Mask;

int s_trappedError = 0;

int trapXError(Display *display, XErrorEvent *event)
{
    Q_UNUSED(display)
    s_trappedError = event->error_code;
    return 0;
}

} // namespace

X11HotkeyApi::X11HotkeyApi(QObject *parent)
    : QObject(parent)
    , m_display(XOpenDisplay(nullptr))
    , m_notifier(nullptr)
    , m_nextHandle(1)
    , m_lastStatus(0)
{
    if (!m_display) {
        qWarning() << "无法连接 X 服务器，全局快捷键不可用";
        return;
    }

    m_notifier = new QSocketNotifier(ConnectionNumber(m_display), QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &X11HotkeyApi::processEvents);

    // XSync 等调用会把事件读进 Xlib 队列而套接字不再可读，事件循环休眠前补一次
    if (QAbstractEventDispatcher *dispatcher = QAbstractEventDispatcher::instance()) {
        connect(dispatcher, &QAbstractEventDispatcher::aboutToBlock, this, &X11HotkeyApi::processEvents);
    }
}

X11HotkeyApi::~X11HotkeyApi()
{
    if (!m_display) {
        return;
    }
    for (const Grab &grab : m_grabs) {
        ungrabKey(grab.keycode, grab.modifiers);
    }
    m_grabs.clear();
    m_handlers.clear();
    XCloseDisplay(m_display);
}

bool X11HotkeyApi::grabKey(unsigned int keycode, unsigned int modifiers)
{
    Window root = DefaultRootWindow(m_display);

    // XGrabKey 的 BadAccess 是异步返回的，需要临时接管错误处理并同步一次
    s_trappedError = 0;
    XErrorHandler previous = XSetErrorHandler(trapXError);
    for (unsigned int lock : s_lockVariants) {
        XGrabKey(m_display, keycode, modifiers | lock, root, True, GrabModeAsync, GrabModeAsync);
    }
    XSync(m_display, False);
    XSetErrorHandler(previous);

    if (s_trappedError != 0) {
        m_lastStatus = s_trappedError;
        ungrabKey(keycode, modifiers);
        return false;
    }
    return true;
}

void X11HotkeyApi::ungrabKey(unsigned int keycode, unsigned int modifiers)
{
    Window root = DefaultRootWindow(m_display);
    for (unsigned int lock : s_lockVariants) {
        XUngrabKey(m_display, keycode, modifiers | lock, root);
    }
    XFlush(m_display);
}

bool X11HotkeyApi::registerHotkey(quint32 nativeKey, quint32 nativeModifiers,
                                  quint32 signature, quint32 id, Handle *outHandle)
{
    if (!m_display) {
        m_lastStatus = BadImplementation;
        return false;
    }

    const KeyCode keycode = XKeysymToKeycode(m_display, static_cast<KeySym>(nativeKey));
    if (keycode == 0) {
        qWarning() << "当前键盘布局中找不到 keysym" << Qt::hex << nativeKey;
        m_lastStatus = BadValue;
        return false;
    }

    if (!grabKey(keycode, nativeModifiers)) {
        return false;
    }

    Grab grab;
    grab.handle = m_nextHandle++;
    grab.keycode = keycode;
    grab.modifiers = nativeModifiers;
    grab.signature = signature;
    grab.id = id;
    m_grabs.push_back(grab);

    m_lastStatus = Success;
    *outHandle = grab.handle;
    return true;
}

void X11HotkeyApi::unregisterHotkey(Handle handle)
{
    auto it = std::find_if(m_grabs.begin(), m_grabs.end(), [handle](const Grab &grab) {
        return grab.handle == handle;
    });
    if (it == m_grabs.end()) {
        return;
    }

    ungrabKey(it->keycode, it->modifiers);
    m_grabs.erase(it);
}

bool X11HotkeyApi::installHandler(quint32 signature, quint32 id,
                                  Callback callback, void *userData, Handle *outHandle)
{
    // 事件经由套接字通知器分发，没有事件循环就无法回调
    if (!m_notifier || !QCoreApplication::instance() || !callback) {
        m_lastStatus = BadImplementation;
        return false;
    }

    Handler handler;
    handler.handle = m_nextHandle++;
    handler.signature = signature;
    handler.id = id;
    handler.callback = callback;
    handler.userData = userData;
    m_handlers.push_back(handler);

    m_lastStatus = Success;
    *outHandle = handler.handle;
    return true;
}

void X11HotkeyApi::removeHandler(Handle handle)
{
    m_handlers.erase(std::remove_if(m_handlers.begin(), m_handlers.end(), [handle](const Handler &handler) {
        return handler.handle == handle;
    }), m_handlers.end());
}

void X11HotkeyApi::processEvents()
{
    if (!m_display) {
        return;
    }
    while (XPending(m_display) > 0) {
        XEvent event;
        XNextEvent(m_display, &event);
        if (event.type != KeyPress) {
            continue;
        }

        const unsigned int state = event.xkey.state & s_relevantModifiers;
        auto grab = std::find_if(m_grabs.begin(), m_grabs.end(), [&event, state](const Grab &g) {
            return g.keycode == event.xkey.keycode && g.modifiers == state;
        });
        if (grab == m_grabs.end()) {
            continue;
        }

        // 回调中可能注销处理器，先拷贝一份再分发
        const quint32 signature = grab->signature;
        const quint32 id = grab->id;
        const std::vector<Handler> handlers = m_handlers;
        for (const Handler &handler : handlers) {
            if (handler.signature == signature && handler.id == id) {
                handler.callback(handler.userData);
            }
        }
    }
}

std::unique_ptr<NativeHotkeyApi> createNativeHotkeyApi()
{
    return std::make_unique<X11HotkeyApi>();
}
