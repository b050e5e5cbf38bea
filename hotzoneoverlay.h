#ifndef HOTZONEOVERLAY_H
#define HOTZONEOVERLAY_H

#include <QWidget>
#include <QRect>
#include <QPointF>
#include <QMouseEvent>
#include <QPaintEvent>
#include <QKeyEvent>

// 覆盖单个显示器的全屏半透明遮罩，用于拾取热区坐标
class HotzoneOverlay : public QWidget
{
    Q_OBJECT

public:
    explicit HotzoneOverlay(const QRect &screenGeometry, QWidget *parent = nullptr);
    ~HotzoneOverlay();

    QRect screenGeometry() const { return m_screenGeometry; }

signals:
    void pointClicked(const QPointF &globalPoint);
    void escapePressed();

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void showEvent(QShowEvent *event) override;

private:
    QRect m_screenGeometry;
};

#endif // HOTZONEOVERLAY_H
