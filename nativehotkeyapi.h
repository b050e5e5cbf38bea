#ifndef NATIVEHOTKEYAPI_H
#define NATIVEHOTKEYAPI_H

#include <QtGlobal>

#include <memory>

// 系统级全局快捷键接口，语义对应 Carbon 的 RegisterEventHotKey /
// InstallEventHandler：先按 (键码, 修饰掩码, 签名, id) 注册快捷键，
// 再为同一签名与 id 安装"快捷键按下"事件回调。
// Linux 下由 X11 的 XGrabKey 与原生事件过滤器实现。
class NativeHotkeyApi
{
public:
    using Handle = quintptr;
    using Callback = void (*)(void *userData);

    static constexpr Handle InvalidHandle = 0;

    virtual ~NativeHotkeyApi() = default;

    // 失败时返回 false，并可通过 lastStatus() 取得系统错误码
    virtual bool registerHotkey(quint32 nativeKey, quint32 nativeModifiers,
                                quint32 signature, quint32 id, Handle *outHandle) = 0;
    virtual void unregisterHotkey(Handle handle) = 0;

    // userData 原样传回 callback，实现方不得持有其所有权
    virtual bool installHandler(quint32 signature, quint32 id,
                                Callback callback, void *userData, Handle *outHandle) = 0;
    virtual void removeHandler(Handle handle) = 0;

    virtual long lastStatus() const = 0;
};

// 当前平台的实现（macOS: Carbon，Linux: X11）
std::unique_ptr<NativeHotkeyApi> createNativeHotkeyApi();

#endif // NATIVEHOTKEYAPI_H
