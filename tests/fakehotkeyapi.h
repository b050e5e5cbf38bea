#ifndef FAKEHOTKEYAPI_H
#define FAKEHOTKEYAPI_H

#include <QList>

#include "nativehotkeyapi.h"

// 记录调用的假实现，可以模拟注册失败与快捷键按下
class FakeHotkeyApi : public NativeHotkeyApi
{
public:
    struct Registration {
        Handle handle;
        quint32 nativeKey;
        quint32 nativeModifiers;
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

    bool registerHotkey(quint32 nativeKey, quint32 nativeModifiers,
                        quint32 signature, quint32 id, Handle *outHandle) override
    {
        ++registerCalls;
        if (failNextRegister) {
            failNextRegister = false;
            m_status = -9878; // eventHotKeyExistsErr
            return false;
        }
        Registration registration { m_nextHandle++, nativeKey, nativeModifiers, signature, id };
        registrations << registration;
        *outHandle = registration.handle;
        m_status = 0;
        return true;
    }

    void unregisterHotkey(Handle handle) override
    {
        ++unregisterCalls;
        for (int i = 0; i < registrations.size(); ++i) {
            if (registrations.at(i).handle == handle) {
                registrations.removeAt(i);
                return;
            }
        }
    }

    bool installHandler(quint32 signature, quint32 id,
                        Callback callback, void *userData, Handle *outHandle) override
    {
        if (failNextInstall) {
            failNextInstall = false;
            m_status = -50; // paramErr
            return false;
        }
        Handler handler { m_nextHandle++, signature, id, callback, userData };
        handlers << handler;
        lastCallback = callback;
        lastUserData = userData;
        *outHandle = handler.handle;
        m_status = 0;
        return true;
    }

    void removeHandler(Handle handle) override
    {
        for (int i = 0; i < handlers.size(); ++i) {
            if (handlers.at(i).handle == handle) {
                handlers.removeAt(i);
                return;
            }
        }
    }

    long lastStatus() const override { return m_status; }

    // 模拟系统派发"快捷键按下"
    void press()
    {
        const QList<Handler> current = handlers;
        for (const Handler &handler : current) {
            handler.callback(handler.userData);
        }
    }

    // 模拟处理器被移除后仍迟到的回调
    void fireStaleCallback()
    {
        if (lastCallback) {
            lastCallback(lastUserData);
        }
    }

    QList<Registration> registrations;
    QList<Handler> handlers;
    int registerCalls = 0;
    int unregisterCalls = 0;
    bool failNextRegister = false;
    bool failNextInstall = false;
    Callback lastCallback = nullptr;
    void *lastUserData = nullptr;

private:
    Handle m_nextHandle = 1;
    long m_status = 0;
};

#endif // FAKEHOTKEYAPI_H
