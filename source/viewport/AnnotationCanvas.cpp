// ============================================================================
// AnnotationCanvas - Implementation
// ============================================================================

#include "AnnotationCanvas.h"
#include "../core/BoardState.h"
#include "../ui/ThemeColors.h"

#include <QPainter>
#include <QPaintEvent>
#include <QResizeEvent>
#include <QMouseEvent>
#include <QLineF>

// ===== Constructor & Destructor =====

AnnotationCanvas::AnnotationCanvas(QWidget* parent)
    : QWidget(parent)
{
    setMouseTracking(false);

    // Annotations are placed with mouse or stylus only
    setAttribute(Qt::WA_AcceptTouchEvents, false);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(320, 240);

    setAutoFillBackground(true);
    QPalette pal = palette();
    pal.setColor(QPalette::Window, ThemeColors::canvasBackground());
    setPalette(pal);
}

AnnotationCanvas::~AnnotationCanvas() = default;

void AnnotationCanvas::setBoardState(BoardState* state)
{
    if (m_state == state) {
        return;
    }
    if (m_state) {
        disconnect(m_state, nullptr, this, nullptr);
        disconnect(m_state->store(), nullptr, this, nullptr);
    }

    m_state = state;
    resetPointerState();

    if (m_state) {
        // Any model change is a full repaint; annotation counts are small
        connect(m_state->store(), &AnnotationStore::annotationsChanged, this, [this]() { update(); });
        connect(m_state->store(), &AnnotationStore::selectionChanged, this, [this]() { update(); });
        connect(m_state, &BoardState::displayChanged, this, [this]() { update(); });
        m_state->setViewportSize(QSizeF(size()));
    }

    update();
}

void AnnotationCanvas::setBackgroundImage(const QImage& image)
{
    m_background = image.isNull() ? QPixmap() : QPixmap::fromImage(image);
    resetPointerState();
    update();
}

// ===== Painting =====

void AnnotationCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    if (!m_state || m_background.isNull() || !m_state->hasImage()) {
        // Empty state hint
        painter.setPen(ThemeColors::canvasHint());
        QFont titleFont = font();
        titleFont.setPointSizeF(titleFont.pointSizeF() * 1.6);
        titleFont.setBold(true);
        painter.setFont(titleFont);

        QRectF titleRect = rect().adjusted(0, 0, 0, -24);
        painter.drawText(titleRect, Qt::AlignCenter, tr("Click \"Import Diagram\" to begin"));

        painter.setFont(font());
        QRectF hintRect = rect().adjusted(0, 40, 0, 0);
        painter.drawText(hintRect, Qt::AlignCenter, tr("Supports PNG, JPG, GIF and SVG images"));
        return;
    }

    // ----- Background image -----
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawPixmap(m_state->transform().imageRect(), m_background, QRectF(m_background.rect()));

    // ----- Annotations (list order = paint order) -----
    const QString selected = m_state->store()->selectedId();
    for (const TextAnnotation& a : m_state->store()->annotations()) {
        const bool isDragged = m_dragging && a.id == m_dragId;
        a.render(painter, a.id == selected, isDragged ? m_dragOffset : QPointF());
    }
}

void AnnotationCanvas::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    emit viewportResized(QSizeF(event->size()));
}

// ===== Mouse Input =====

void AnnotationCanvas::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_state || !m_state->hasImage()) {
        event->ignore();
        return;
    }

    m_pointerDown = true;
    m_pressPos = event->position();
    m_dragOffset = QPointF();
    m_dragging = false;
    m_dragId = m_state->store()->annotationAt(m_pressPos);

    if (m_dragId.isEmpty()) {
        emit backgroundPressed();
    } else {
        emit annotationClicked(m_dragId);
    }
    event->accept();
}

void AnnotationCanvas::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_pointerDown || m_dragId.isEmpty()) {
        event->ignore();
        return;
    }

    const QPointF delta = event->position() - m_pressPos;
    if (!m_dragging && QLineF(QPointF(), delta).length() < DRAG_THRESHOLD) {
        event->accept();
        return;
    }

    m_dragging = true;
    m_dragOffset = delta;
    update();
    event->accept();
}

void AnnotationCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_pointerDown) {
        event->ignore();
        return;
    }

    // Copy out before emitting: slots may re-enter and reset pointer state
    const QString id = m_dragId;
    const bool dragged = m_dragging;
    const QPointF offset = m_dragOffset;
    const QPointF releasePos = event->position();
    resetPointerState();

    if (!id.isEmpty()) {
        if (dragged && m_state) {
            if (const TextAnnotation* a = m_state->store()->annotation(id)) {
                emit annotationDragEnded(id, a->position + offset);
            }
        }
    } else {
        emit canvasClicked(releasePos);
    }

    update();
    event->accept();
}

// ===== Private =====

void AnnotationCanvas::resetPointerState()
{
    m_pointerDown = false;
    m_dragId.clear();
    m_dragOffset = QPointF();
    m_dragging = false;
}
