#include "carbonhotkeyapi.h"

#include <QDebug>

#include <algorithm>

OSStatus CarbonHotkeyApi::hotKeyHandler(EventHandlerCallRef nextHandler, EventRef theEvent, void *userData)
{
    Q_UNUSED(nextHandler)

    HandlerContext *context = static_cast<HandlerContext *>(userData);
    if (!context) {
        return eventNotHandledErr;
    }

    EventHotKeyID hotKeyID;
    OSStatus status = GetEventParameter(theEvent, kEventParamDirectObject, typeEventHotKeyID,
                                        NULL, sizeof(hotKeyID), NULL, &hotKeyID);
    if (status != noErr) {
        return status;
    }

    // 只处理本程序签名与 id 的快捷键，其余交给下一个处理器
    if (hotKeyID.signature != context->signature || hotKeyID.id != context->id) {
        return eventNotHandledErr;
    }

    context->callback(context->userData);
    return noErr;
}

CarbonHotkeyApi::CarbonHotkeyApi()
    : m_lastStatus(noErr)
{
}

CarbonHotkeyApi::~CarbonHotkeyApi()
{
    for (const auto &context : m_handlers) {
        RemoveEventHandler(context->ref);
    }
    m_handlers.clear();
}

bool CarbonHotkeyApi::registerHotkey(quint32 nativeKey, quint32 nativeModifiers,
                                     quint32 signature, quint32 id, Handle *outHandle)
{
    EventHotKeyID hotKeyID;
    hotKeyID.signature = signature;
    hotKeyID.id = id;

    EventHotKeyRef hotKeyRef = nullptr;
    m_lastStatus = RegisterEventHotKey(nativeKey, nativeModifiers, hotKeyID,
                                       GetApplicationEventTarget(), 0, &hotKeyRef);
    if (m_lastStatus != noErr || !hotKeyRef) {
        return false;
    }

    *outHandle = reinterpret_cast<Handle>(hotKeyRef);
    return true;
}

void CarbonHotkeyApi::unregisterHotkey(Handle handle)
{
    if (handle == InvalidHandle) {
        return;
    }
    m_lastStatus = UnregisterEventHotKey(reinterpret_cast<EventHotKeyRef>(handle));
    if (m_lastStatus != noErr) {
        qWarning() << "UnregisterEventHotKey 失败，错误码:" << m_lastStatus;
    }
}

bool CarbonHotkeyApi::installHandler(quint32 signature, quint32 id,
                                     Callback callback, void *userData, Handle *outHandle)
{
    auto context = std::make_unique<HandlerContext>();
    context->signature = signature;
    context->id = id;
    context->callback = callback;
    context->userData = userData;
    context->ref = nullptr;

    EventTypeSpec eventType;
    eventType.eventClass = kEventClassKeyboard;
    eventType.eventKind = kEventHotKeyPressed;

    m_lastStatus = InstallEventHandler(GetApplicationEventTarget(), &CarbonHotkeyApi::hotKeyHandler,
                                       1, &eventType, context.get(), &context->ref);
    if (m_lastStatus != noErr) {
        return false;
    }

    *outHandle = reinterpret_cast<Handle>(context.get());
    m_handlers.push_back(std::move(context));
    return true;
}

void CarbonHotkeyApi::removeHandler(Handle handle)
{
    auto it = std::find_if(m_handlers.begin(), m_handlers.end(), [handle](const auto &context) {
        return reinterpret_cast<Handle>(context.get()) == handle;
    });
    if (it == m_handlers.end()) {
        return;
    }

    m_lastStatus = RemoveEventHandler((*it)->ref);
    if (m_lastStatus != noErr) {
        qWarning() << "RemoveEventHandler 失败，错误码:" << m_lastStatus;
    }
    m_handlers.erase(it);
}

std::unique_ptr<NativeHotkeyApi> createNativeHotkeyApi()
{
    return std::make_unique<CarbonHotkeyApi>();
}
