#include "ColorPresetButton.h"
#include "../../objects/TextAnnotation.h"

#include <QPainter>
#include <QMouseEvent>
#include <QPalette>

ColorPresetButton::ColorPresetButton(QWidget* parent)
    : QWidget(parent)
{
    setFixedSize(BUTTON_SIZE, BUTTON_SIZE);
    setCursor(Qt::PointingHandCursor);
    updateToolTip();
}

void ColorPresetButton::setColor(const QColor& color)
{
    if (!color.isValid() || m_color == color) {
        return;
    }
    m_color = color;
    updateToolTip();
    update();
    emit colorChanged(m_color);
}

void ColorPresetButton::setSelected(bool selected)
{
    if (m_selected == selected) {
        return;
    }
    m_selected = selected;
    update();
    emit selectedChanged(m_selected);
}

QSize ColorPresetButton::sizeHint() const
{
    return QSize(BUTTON_SIZE, BUTTON_SIZE);
}

QSize ColorPresetButton::minimumSizeHint() const
{
    return sizeHint();
}

void ColorPresetButton::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    const int ring = m_selected ? RING_WIDTH_SELECTED : RING_WIDTH_NORMAL;
    const qreal half = ring / 2.0;

    QPen pen(ringColor());
    pen.setWidth(ring);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawEllipse(QRectF(half, half, BUTTON_SIZE - ring, BUTTON_SIZE - ring));

    const qreal inset = ring + 1.0;
    painter.setPen(Qt::NoPen);
    painter.setBrush(m_pressed ? m_color.darker(120) : m_color);
    painter.drawEllipse(QRectF(inset, inset, BUTTON_SIZE - 2 * inset, BUTTON_SIZE - 2 * inset));
}

void ColorPresetButton::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_pressed = true;
        update();
    }
    QWidget::mousePressEvent(event);
}

void ColorPresetButton::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_pressed) {
        m_pressed = false;
        update();

        if (rect().contains(event->pos())) {
            // Capture before clicked(): its handler selects this swatch
            const bool wasSelected = m_selected;
            emit clicked();
            if (wasSelected) {
                emit editRequested();
            }
        }
    }
    QWidget::mouseReleaseEvent(event);
}

void ColorPresetButton::leaveEvent(QEvent* event)
{
    m_pressed = false;
    update();
    QWidget::leaveEvent(event);
}

void ColorPresetButton::updateToolTip()
{
    setToolTip(tr("%1 (click to select, click again to edit)")
                   .arg(TextAnnotation::colorToString(m_color)));
}

QColor ColorPresetButton::ringColor() const
{
    const QColor window = palette().color(QPalette::Window);
    const bool dark = window.lightnessF() < 0.5;
    if (m_selected) {
        return dark ? Qt::white : Qt::black;
    }
    return dark ? QColor(100, 100, 100) : QColor(180, 180, 180);
}
