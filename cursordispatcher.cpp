#include "cursordispatcher.h"
#include "settingsstore.h"

#include <QCursor>
#include <QGuiApplication>
#include <QScreen>
#include <QDebug>

void QtCursorDevice::warp(const QPointF &globalPoint)
{
    QCursor::setPos(globalPoint.toPoint());
}

std::optional<QRectF> QtCursorDevice::primaryScreenGeometry() const
{
    QScreen *screen = QGuiApplication::primaryScreen();
    if (!screen) {
        return std::nullopt;
    }
    return QRectF(screen->geometry());
}

CursorDispatcher::CursorDispatcher(SettingsStore *settings,
                                   std::unique_ptr<CursorDevice> device,
                                   QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_device(std::move(device))
{
    if (!m_device) {
        m_device = std::make_unique<QtCursorDevice>();
    }
}

CursorDispatcher::~CursorDispatcher()
{
}

void CursorDispatcher::activate()
{
    if (!m_settings->isHotkeyEnabled()) {
        return;
    }

    QPointF target;
    if (const std::optional<QPointF> hotzone = m_settings->hotzone()) {
        target = *hotzone;
    } else {
        const std::optional<QRectF> primary = m_device->primaryScreenGeometry();
        if (!primary) {
            qWarning() << "无法获取主屏幕信息，光标不移动";
            return;
        }
        target = primary->center();
    }

    qDebug() << "移动光标到:" << target;
    m_device->warp(target);
    emit cursorWarped(target);
}
