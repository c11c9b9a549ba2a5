#ifndef ANNOTATIONSIDEBAR_H
#define ANNOTATIONSIDEBAR_H

// ============================================================================
// AnnotationSidebar - Tools panel for the annotation canvas
// ============================================================================
// Part of the ProofBoard UI
//
// Sections, top to bottom:
// - Import Diagram
// - Template tokens (3-column grid, click to arm, click again to disarm)
// - Color presets (3 swatches, persisted in QSettings)
// - Font size slider
// - Canvas commands (clear, theme, zoom)
// - Selected annotation editor (only while something is selected)
// - Save / Open project
// - Annotation counter
//
// Commands that need a dialog (import, save, open, clear confirmation) are
// forwarded as signals; everything else is applied to BoardState directly.
// ============================================================================

#include <QWidget>
#include <QColor>
#include <QVector>

class BoardState;
class ColorPresetButton;
class TemplateTokenButton;
class QFrame;
class QLabel;
class QLineEdit;
class QPushButton;
class QSlider;
class QVBoxLayout;

class AnnotationSidebar : public QWidget {
    Q_OBJECT

public:
    explicit AnnotationSidebar(QWidget* parent = nullptr);

    /**
     * @brief Attach the state to drive. Not owned.
     *
     * Pushes the selected color preset into the state and syncs every
     * control from it.
     */
    void setBoardState(BoardState* state);

    QColor selectedPresetColor() const;

signals:
    void importRequested();
    void saveRequested();
    void openRequested();
    void clearRequested();

private slots:
    void onTokenClicked(const QString& token);
    void onPendingTokenChanged(const QString& token);
    void onColorPresetClicked(int index);
    void onColorEditRequested(int index);
    void onSelectionChanged();
    void onAnnotationsChanged();
    void onEditTextChanged(const QString& text);
    void onDarkModeChanged(bool dark);

private:
    void setupUI();
    QLabel* addSectionTitle(const QString& title);
    void loadColorPresets();
    void saveColorPresets();
    void selectColorPreset(int index);
    void syncFromState();
    void updateCounter();
    void updateStyle();

    BoardState* m_state = nullptr;
    bool m_darkMode = false;

    QVBoxLayout* m_layout = nullptr;
    QPushButton* m_importButton = nullptr;
    QVector<TemplateTokenButton*> m_tokenButtons;
    QLabel* m_armedHint = nullptr;

    ColorPresetButton* m_colorButtons[3] = {nullptr, nullptr, nullptr};
    int m_selectedColorIndex = 0;

    QSlider* m_fontSlider = nullptr;
    QLabel* m_fontLabel = nullptr;

    QPushButton* m_clearButton = nullptr;
    QPushButton* m_themeButton = nullptr;
    QPushButton* m_zoomInButton = nullptr;
    QPushButton* m_zoomOutButton = nullptr;

    QFrame* m_editBox = nullptr;
    QLineEdit* m_editLine = nullptr;
    QPushButton* m_deleteButton = nullptr;

    QPushButton* m_saveButton = nullptr;
    QPushButton* m_openButton = nullptr;
    QLabel* m_counterLabel = nullptr;

    static constexpr int NUM_PRESETS = 3;
    static constexpr int TOKEN_COLUMNS = 3;
    static constexpr int SIDEBAR_WIDTH = 260;
    static const QColor DEFAULT_COLORS[NUM_PRESETS];

    // QSettings keys
    static const QString SETTINGS_GROUP;
    static const QString KEY_COLOR_PREFIX;
    static const QString KEY_SELECTED_COLOR;
};

#endif // ANNOTATIONSIDEBAR_H
