#ifndef COLORPRESETBUTTON_H
#define COLORPRESETBUTTON_H

#include <QWidget>
#include <QColor>

/**
 * @brief Round swatch for one annotation color preset.
 *
 * Click behavior:
 * - Click unselected swatch → select it (clicked())
 * - Click selected swatch → ask for a new color (editRequested())
 *
 * The tooltip always shows the preset's hex value.
 */
class ColorPresetButton : public QWidget {
    Q_OBJECT
    Q_PROPERTY(QColor color READ color WRITE setColor NOTIFY colorChanged)
    Q_PROPERTY(bool selected READ isSelected WRITE setSelected NOTIFY selectedChanged)

public:
    explicit ColorPresetButton(QWidget* parent = nullptr);

    QColor color() const { return m_color; }
    void setColor(const QColor& color);

    bool isSelected() const { return m_selected; }
    void setSelected(bool selected);

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override;

signals:
    void clicked();
    void colorChanged(const QColor& color);
    void selectedChanged(bool selected);
    void editRequested();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    void updateToolTip();

    /**
     * @brief Ring color: high contrast when selected, subtle otherwise.
     * Dark mode is read off the window palette luminance.
     */
    QColor ringColor() const;

    QColor m_color = Qt::red;
    bool m_selected = false;
    bool m_pressed = false;

    static constexpr int BUTTON_SIZE = 32;
    static constexpr int RING_WIDTH_NORMAL = 2;
    static constexpr int RING_WIDTH_SELECTED = 3;
};

#endif // COLORPRESETBUTTON_H
