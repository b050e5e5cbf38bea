#include "hotzonecapturecontroller.h"
#include "hotzoneoverlay.h"

#include <QGuiApplication>
#include <QScreen>
#include <QDebug>

HotzoneCaptureController::HotzoneCaptureController(QObject *parent)
    : QObject(parent)
    , m_screenProvider(&HotzoneCaptureController::connectedScreens)
{
}

HotzoneCaptureController::~HotzoneCaptureController()
{
    for (const QPointer<HotzoneOverlay> &overlay : m_overlays) {
        delete overlay.data();
    }
    m_overlays.clear();
}

void HotzoneCaptureController::setScreenProvider(ScreenProvider provider)
{
    if (provider) {
        m_screenProvider = std::move(provider);
    } else {
        m_screenProvider = &HotzoneCaptureController::connectedScreens;
    }
}

QList<QRect> HotzoneCaptureController::connectedScreens()
{
    QList<QRect> geometries;
    const QList<QScreen *> screens = QGuiApplication::screens();
    for (QScreen *screen : screens) {
        geometries << screen->geometry();
    }
    return geometries;
}

QList<HotzoneOverlay *> HotzoneCaptureController::overlays() const
{
    QList<HotzoneOverlay *> result;
    for (const QPointer<HotzoneOverlay> &overlay : m_overlays) {
        if (overlay) {
            result << overlay.data();
        }
    }
    return result;
}

void HotzoneCaptureController::start()
{
    // 确保没有残留的旧会话
    closeOverlays();

    const QList<QRect> screens = m_screenProvider();
    if (screens.isEmpty()) {
        qWarning() << "没有可用的显示器，取消热区选择";
        emit cancelled();
        return;
    }

    qDebug() << "启动热区选择，显示器数量:" << screens.size();

    for (const QRect &geometry : screens) {
        HotzoneOverlay *overlay = new HotzoneOverlay(geometry);
        connect(overlay, &HotzoneOverlay::pointClicked, this, &HotzoneCaptureController::onPointClicked);
        connect(overlay, &HotzoneOverlay::escapePressed, this, &HotzoneCaptureController::onEscapePressed);
        m_overlays << overlay;
    }

    for (const QPointer<HotzoneOverlay> &overlay : m_overlays) {
        overlay->show();
    }
}

void HotzoneCaptureController::cancel()
{
    if (!isActive()) {
        return;
    }
    onEscapePressed();
}

void HotzoneCaptureController::onPointClicked(const QPointF &point)
{
    if (!isActive()) {
        return;
    }

    closeOverlays();
    qDebug() << "热区已选择:" << point;
    emit pointSelected(point);
}

void HotzoneCaptureController::onEscapePressed()
{
    if (!isActive()) {
        return;
    }

    closeOverlays();
    qDebug() << "热区选择已取消";
    emit cancelled();
}

void HotzoneCaptureController::closeOverlays()
{
    // 可能在遮罩自身的事件处理中被调用，只能延迟删除
    for (const QPointer<HotzoneOverlay> &overlay : m_overlays) {
        if (overlay) {
            overlay->disconnect(this);
            overlay->hide();
            overlay->deleteLater();
        }
    }
    m_overlays.clear();
}
