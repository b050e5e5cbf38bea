#ifndef CURSORDISPATCHER_H
#define CURSORDISPATCHER_H

#include <QObject>
#include <QPointF>
#include <QRectF>

#include <memory>
#include <optional>

class SettingsStore;

// 光标与主显示器的系统接口
class CursorDevice
{
public:
    virtual ~CursorDevice() = default;

    virtual void warp(const QPointF &globalPoint) = 0;
    virtual std::optional<QRectF> primaryScreenGeometry() const = 0;
};

// 基于 QCursor / QGuiApplication 的实现
class QtCursorDevice : public CursorDevice
{
public:
    void warp(const QPointF &globalPoint) override;
    std::optional<QRectF> primaryScreenGeometry() const override;
};

// 快捷键触发时把光标移到热区；热区未设置时移到主显示器中心
class CursorDispatcher : public QObject
{
    Q_OBJECT

public:
    explicit CursorDispatcher(SettingsStore *settings,
                              std::unique_ptr<CursorDevice> device = nullptr,
                              QObject *parent = nullptr);
    ~CursorDispatcher();

public slots:
    void activate();

signals:
    void cursorWarped(const QPointF &point);

private:
    SettingsStore *m_settings;
    std::unique_ptr<CursorDevice> m_device;
};

#endif // CURSORDISPATCHER_H
