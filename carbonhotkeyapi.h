#ifndef CARBONHOTKEYAPI_H
#define CARBONHOTKEYAPI_H

#include "nativehotkeyapi.h"

#include <Carbon/Carbon.h>

#include <memory>
#include <vector>

class CarbonHotkeyApi : public NativeHotkeyApi
{
public:
    CarbonHotkeyApi();
    ~CarbonHotkeyApi() override;

    bool registerHotkey(quint32 nativeKey, quint32 nativeModifiers,
                        quint32 signature, quint32 id, Handle *outHandle) override;
    void unregisterHotkey(Handle handle) override;

    bool installHandler(quint32 signature, quint32 id,
                        Callback callback, void *userData, Handle *outHandle) override;
    void removeHandler(Handle handle) override;

    long lastStatus() const override { return m_lastStatus; }

private:
    struct HandlerContext {
        quint32 signature;
        quint32 id;
        Callback callback;
        void *userData;
        EventHandlerRef ref;
    };

    static OSStatus hotKeyHandler(EventHandlerCallRef nextHandler, EventRef theEvent, void *userData);

    std::vector<std::unique_ptr<HandlerContext>> m_handlers;
    OSStatus m_lastStatus;
};

#endif // CARBONHOTKEYAPI_H
