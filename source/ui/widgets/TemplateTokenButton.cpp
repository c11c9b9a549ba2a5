#include "TemplateTokenButton.h"
#include "../ThemeColors.h"

#include <QPainter>
#include <QMouseEvent>

TemplateTokenButton::TemplateTokenButton(const QString& token, QWidget* parent)
    : QWidget(parent)
    , m_token(token)
{
    setMinimumSize(MIN_WIDTH, BUTTON_HEIGHT);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
    setCursor(Qt::PointingHandCursor);
    setToolTip(tr("Insert \"%1\" at the next canvas click").arg(m_token));
}

void TemplateTokenButton::setArmed(bool armed)
{
    if (m_armed != armed) {
        m_armed = armed;
        update();
    }
}

void TemplateTokenButton::setDarkMode(bool darkMode)
{
    if (m_darkMode != darkMode) {
        m_darkMode = darkMode;
        update();
    }
}

QSize TemplateTokenButton::sizeHint() const
{
    return QSize(MIN_WIDTH, BUTTON_HEIGHT);
}

QSize TemplateTokenButton::minimumSizeHint() const
{
    return sizeHint();
}

void TemplateTokenButton::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    QColor fill = m_armed ? ThemeColors::armedFill(m_darkMode) : ThemeColors::panel(m_darkMode);
    if (m_pressed) {
        fill = m_darkMode ? fill.lighter(130) : fill.darker(110);
    }
    const QColor border = m_armed ? ThemeColors::armedBorder(m_darkMode) : ThemeColors::border(m_darkMode);

    QPen pen(border);
    pen.setWidth(m_armed ? 2 : 1);
    painter.setPen(pen);
    painter.setBrush(fill);
    painter.drawRoundedRect(QRectF(rect()).adjusted(1, 1, -1, -1), CORNER_RADIUS, CORNER_RADIUS);

    QFont f = font();
    f.setBold(true);
    f.setPixelSize(16);
    painter.setFont(f);
    painter.setPen(m_armed ? ThemeColors::armedText(m_darkMode) : ThemeColors::textPrimary(m_darkMode));
    painter.drawText(rect(), Qt::AlignCenter, m_token);
}

void TemplateTokenButton::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_pressed = true;
        update();
    }
    QWidget::mousePressEvent(event);
}

void TemplateTokenButton::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_pressed) {
        m_pressed = false;
        update();
        if (rect().contains(event->pos())) {
            emit clicked(m_token);
        }
    }
    QWidget::mouseReleaseEvent(event);
}

void TemplateTokenButton::leaveEvent(QEvent* event)
{
    m_pressed = false;
    update();
    QWidget::leaveEvent(event);
}
