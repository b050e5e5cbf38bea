#ifndef HOTZONECAPTURECONTROLLER_H
#define HOTZONECAPTURECONTROLLER_H

#include <QObject>
#include <QList>
#include <QPointF>
#include <QPointer>
#include <QRect>

#include <functional>

class HotzoneOverlay;

// "定义热区"交互：每个显示器一个遮罩，第一次左键点击或 Esc 结束整个会话。
// 同一时间最多只有一个会话。
class HotzoneCaptureController : public QObject
{
    Q_OBJECT

public:
    using ScreenProvider = std::function<QList<QRect>()>;

    explicit HotzoneCaptureController(QObject *parent = nullptr);
    ~HotzoneCaptureController();

    // 默认枚举 QGuiApplication::screens() 的几何
    void setScreenProvider(ScreenProvider provider);

    void start();
    void cancel();

    bool isActive() const { return !m_overlays.isEmpty(); }
    int overlayCount() const { return m_overlays.size(); }
    QList<HotzoneOverlay *> overlays() const;

signals:
    void pointSelected(const QPointF &point);
    void cancelled();

private slots:
    void onPointClicked(const QPointF &point);
    void onEscapePressed();

private:
    static QList<QRect> connectedScreens();
    void closeOverlays();

    ScreenProvider m_screenProvider;
    QList<QPointer<HotzoneOverlay>> m_overlays;
};

#endif // HOTZONECAPTURECONTROLLER_H
