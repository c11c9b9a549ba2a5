#ifndef TEMPLATETOKENBUTTON_H
#define TEMPLATETOKENBUTTON_H

#include <QWidget>
#include <QString>

/**
 * @brief Rounded button showing one geometry template token (A, ∠A, ≅ ...).
 *
 * Visual states:
 * - Idle: panel background with a neutral border
 * - Armed: accent fill and border, meaning the next canvas click places it
 * - Pressed: darkened fill
 *
 * The button does not toggle itself; the owner sets armed from the palette.
 */
class TemplateTokenButton : public QWidget {
    Q_OBJECT
    Q_PROPERTY(bool armed READ isArmed WRITE setArmed)

public:
    explicit TemplateTokenButton(const QString& token, QWidget* parent = nullptr);

    QString token() const { return m_token; }

    bool isArmed() const { return m_armed; }
    void setArmed(bool armed);

    void setDarkMode(bool darkMode);

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override;

signals:
    void clicked(const QString& token);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    QString m_token;
    bool m_armed = false;
    bool m_pressed = false;
    bool m_darkMode = false;

    static constexpr int BUTTON_HEIGHT = 36;
    static constexpr int MIN_WIDTH = 52;
    static constexpr int CORNER_RADIUS = 6;
};

#endif // TEMPLATETOKENBUTTON_H
