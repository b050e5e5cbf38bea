#include "hotzoneoverlay.h"
#include <QPainter>
#include <QDebug>

HotzoneOverlay::HotzoneOverlay(const QRect &screenGeometry, QWidget *parent)
    : QWidget(parent)
    , m_screenGeometry(screenGeometry)
{
    // 设置窗口属性
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool);
    setAttribute(Qt::WA_TranslucentBackground);
    setFocusPolicy(Qt::StrongFocus);

    // 覆盖整个显示器
    setGeometry(m_screenGeometry);
    setCursor(Qt::CrossCursor);

    qDebug() << "热区遮罩几何:" << m_screenGeometry;
}

HotzoneOverlay::~HotzoneOverlay()
{
}

void HotzoneOverlay::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event)

    QPainter painter(this);
    painter.fillRect(rect(), QColor(0, 0, 0, 102));

    QFont font = painter.font();
    font.setPointSize(32);
    font.setBold(true);
    painter.setFont(font);
    painter.setPen(QColor(255, 255, 255, 230));
    painter.drawText(rect(), Qt::AlignCenter,
                     QStringLiteral("点击任意位置设置新的热区\n（按 Esc 取消）"));
}

void HotzoneOverlay::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }

    // 窗口管理器不一定把遮罩放在显示器原点，直接取事件的全局坐标
    const QPointF globalPoint = event->globalPosition();
    qDebug() << "热区点击，全局坐标:" << globalPoint;
    emit pointClicked(globalPoint);
}

void HotzoneOverlay::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Escape) {
        emit escapePressed();
        return;
    }
    QWidget::keyPressEvent(event);
}

void HotzoneOverlay::showEvent(QShowEvent *event)
{
    QWidget::showEvent(event);

    // 出现时立即获取键盘焦点，保证 Esc 可用
    raise();
    activateWindow();
    setFocus();
}
