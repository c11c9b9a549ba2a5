// ============================================================================
// TextAnnotation - Implementation
// ============================================================================

#include "TextAnnotation.h"

#include <QPainter>
#include <QPainterPath>
#include <QFontMetricsF>
#include <QDebug>
#include <QtGlobal>

namespace {

// Selection highlight (gold outline + soft glow)
const QColor SELECTION_COLOR(0xFF, 0xD7, 0x00);

constexpr qreal EMPTY_TEXT_WIDTH_FACTOR = 0.6;

} // namespace

QJsonObject TextAnnotation::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["x"] = position.x();
    obj["y"] = position.y();
    obj["text"] = text;
    obj["color"] = colorToString(color);
    obj["fontSize"] = fontSize;
    return obj;
}

TextAnnotation TextAnnotation::fromJson(const QJsonObject& obj, int fallbackFontSize)
{
    TextAnnotation a;

    const QString storedId = obj["id"].toString();
    if (!storedId.isEmpty()) {
        a.id = storedId;
    }
    // else: keep the UUID generated by the constructor

    a.position = QPointF(obj["x"].toDouble(0.0), obj["y"].toDouble(0.0));
    a.text = obj["text"].toString();

    const QString colorStr = obj["color"].toString();
    QColor parsed(colorStr);
    if (parsed.isValid()) {
        a.color = parsed;
    } else if (!colorStr.isEmpty()) {
        qWarning() << "TextAnnotation::fromJson: invalid color" << colorStr
                   << "for" << a.id << "- using red";
    }

    const int size = obj["fontSize"].toInt(0);
    a.fontSize = clampFontSize(size > 0 ? size : fallbackFontSize);

    return a;
}

QFont TextAnnotation::font() const
{
    QFont f;
    f.setPixelSize(fontSize);
    f.setBold(true);
    return f;
}

QRectF TextAnnotation::boundingRect() const
{
    QFontMetricsF fm(font());
    if (text.isEmpty()) {
        return QRectF(position, QSizeF(fontSize * EMPTY_TEXT_WIDTH_FACTOR, fm.height()));
    }
    return QRectF(position, QSizeF(fm.horizontalAdvance(text), fm.height()));
}

void TextAnnotation::render(QPainter& painter, bool selected, const QPointF& offset) const
{
    painter.save();

    const QFont f = font();
    QFontMetricsF fm(f);
    const QPointF baseline = position + offset + QPointF(0, fm.ascent());

    QPainterPath path;
    path.addText(baseline, f, text);

    if (selected) {
        // Glow: a few widening translucent strokes under the glyphs
        for (int i = 3; i >= 1; --i) {
            QColor glow = SELECTION_COLOR;
            glow.setAlpha(50);
            painter.setPen(QPen(glow, 2.0 + i * 3.0, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
            painter.setBrush(Qt::NoBrush);
            painter.drawPath(path);
        }
    }

    painter.setPen(selected ? QPen(SELECTION_COLOR, 2.0) : Qt::NoPen);
    painter.setBrush(color);
    painter.drawPath(path);

    painter.restore();
}

int TextAnnotation::clampFontSize(int size)
{
    return qBound(MIN_FONT_SIZE, size, MAX_FONT_SIZE);
}

QString TextAnnotation::colorToString(const QColor& c)
{
    return c.name(QColor::HexRgb).toUpper();
}
