#pragma once

// ============================================================================
// TextAnnotation - A text glyph placed on the diagram canvas
// ============================================================================
// Part of the ProofBoard annotation model
//
// A TextAnnotation is an opaque piece of text (a vertex label, an angle or
// segment marker, a symbol) positioned by the user on top of the imported
// diagram. Nothing about it is derived from the image content.
//
// Positions are stored in canvas display space (widget pixels), NOT in the
// image's natural resolution. Zooming or re-importing the image does not move
// existing annotations.
// ============================================================================

#include <QString>
#include <QPointF>
#include <QRectF>
#include <QColor>
#include <QFont>
#include <QJsonObject>
#include <QUuid>

class QPainter;

/**
 * @brief A positioned text annotation.
 *
 * The id is assigned once at construction and is the only key used for
 * lookup, selection and mutation.
 */
class TextAnnotation {
public:
    // ===== Properties =====
    QString id;               ///< UUID for tracking (never reused)
    QPointF position;         ///< Top-left of the text box, canvas coordinates
    QString text;             ///< Display string
    QColor color = QColor(0xFF, 0x00, 0x00);  ///< Fill color
    int fontSize = DEFAULT_FONT_SIZE;         ///< Pixel size, [MIN_FONT_SIZE, MAX_FONT_SIZE]

    static constexpr int MIN_FONT_SIZE = 16;
    static constexpr int MAX_FONT_SIZE = 48;
    static constexpr int DEFAULT_FONT_SIZE = 28;

    /**
     * @brief Default constructor.
     * Creates an annotation with a unique ID.
     */
    TextAnnotation() {
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    TextAnnotation(const QPointF& pos, const QString& str, const QColor& c, int size)
        : TextAnnotation()
    {
        position = pos;
        text = str;
        color = c;
        fontSize = clampFontSize(size);
    }

    bool operator==(const TextAnnotation& other) const {
        return id == other.id && position == other.position && text == other.text
            && color == other.color && fontSize == other.fontSize;
    }
    bool operator!=(const TextAnnotation& other) const { return !(*this == other); }

    // ===== Serialization =====

    /**
     * @brief Serialize to JSON.
     * @return {id, x, y, text, color, fontSize}. Color is written as #RRGGBB.
     */
    QJsonObject toJson() const;

    /**
     * @brief Build an annotation from JSON.
     * @param obj JSON object with the keys written by toJson().
     * @param fallbackFontSize Used when the object has no usable fontSize.
     *
     * Missing coordinates default to 0 and an unparsable color falls back
     * to red. A missing id is regenerated (the caller decides what to do
     * with duplicates).
     */
    static TextAnnotation fromJson(const QJsonObject& obj, int fallbackFontSize = DEFAULT_FONT_SIZE);

    // ===== Rendering & Hit Testing =====

    /**
     * @brief The bold font this annotation is drawn with.
     */
    QFont font() const;

    /**
     * @brief Bounding rectangle of the rendered text, in canvas coordinates.
     *
     * Empty text still gets a small box so the annotation stays clickable
     * while it is being edited.
     */
    QRectF boundingRect() const;

    bool containsPoint(const QPointF& pt) const {
        return boundingRect().contains(pt);
    }

    /**
     * @brief Draw the annotation.
     * @param painter Painter in canvas coordinates.
     * @param selected Adds the gold highlight outline when true.
     * @param offset Temporary displacement (live drag preview).
     */
    void render(QPainter& painter, bool selected, const QPointF& offset = QPointF()) const;

    static int clampFontSize(int size);

    /**
     * @brief Canonical color string (#RRGGBB, upper case).
     */
    static QString colorToString(const QColor& c);
};
