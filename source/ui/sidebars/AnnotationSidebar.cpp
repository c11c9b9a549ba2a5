// ============================================================================
// AnnotationSidebar Implementation
// ============================================================================

#include "AnnotationSidebar.h"
#include "../widgets/ColorPresetButton.h"
#include "../widgets/TemplateTokenButton.h"
#include "../ThemeColors.h"
#include "../../core/BoardState.h"

#include <QApplication>
#include <QColorDialog>
#include <QFrame>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSettings>
#include <QSignalBlocker>
#include <QSlider>
#include <QVBoxLayout>

const QColor AnnotationSidebar::DEFAULT_COLORS[NUM_PRESETS] = {
    QColor(0xFF, 0x00, 0x00),  // Red
    QColor(0x00, 0x00, 0xFF),  // Blue
    QColor(0x00, 0x00, 0x00)   // Black
};

const QString AnnotationSidebar::SETTINGS_GROUP = "annotationColors";
const QString AnnotationSidebar::KEY_COLOR_PREFIX = "color";
const QString AnnotationSidebar::KEY_SELECTED_COLOR = "selectedColor";

// ============================================================================
// Constructor
// ============================================================================

AnnotationSidebar::AnnotationSidebar(QWidget* parent)
    : QWidget(parent)
{
    m_darkMode = QApplication::palette().color(QPalette::Window).lightness() < 128;

    setupUI();
    loadColorPresets();
    updateStyle();
    syncFromState();
}

// ============================================================================
// Setup
// ============================================================================

void AnnotationSidebar::setupUI()
{
    setFixedWidth(SIDEBAR_WIDTH);
    setAttribute(Qt::WA_StyledBackground, true);
    setObjectName("AnnotationSidebar");

    m_layout = new QVBoxLayout(this);
    m_layout->setContentsMargins(12, 12, 12, 12);
    m_layout->setSpacing(8);

    // ----- Import -----
    m_importButton = new QPushButton(tr("Import Diagram"), this);
    m_importButton->setMinimumHeight(36);
    connect(m_importButton, &QPushButton::clicked, this, &AnnotationSidebar::importRequested);
    m_layout->addWidget(m_importButton);

    // ----- Template tokens -----
    addSectionTitle(tr("Templates"));
    QGridLayout* grid = new QGridLayout();
    grid->setSpacing(4);
    const QStringList& catalog = TemplatePalette::catalog();
    for (int i = 0; i < catalog.size(); ++i) {
        TemplateTokenButton* button = new TemplateTokenButton(catalog[i], this);
        connect(button, &TemplateTokenButton::clicked, this, &AnnotationSidebar::onTokenClicked);
        grid->addWidget(button, i / TOKEN_COLUMNS, i % TOKEN_COLUMNS);
        m_tokenButtons.append(button);
    }
    m_layout->addLayout(grid);

    m_armedHint = new QLabel(this);
    m_armedHint->setWordWrap(true);
    m_armedHint->setVisible(false);
    m_layout->addWidget(m_armedHint);

    // ----- Colors -----
    addSectionTitle(tr("Color"));
    QHBoxLayout* colorRow = new QHBoxLayout();
    colorRow->setSpacing(8);
    for (int i = 0; i < NUM_PRESETS; ++i) {
        m_colorButtons[i] = new ColorPresetButton(this);
        m_colorButtons[i]->setColor(DEFAULT_COLORS[i]);
        connect(m_colorButtons[i], &ColorPresetButton::clicked, this, [this, i]() {
            onColorPresetClicked(i);
        });
        connect(m_colorButtons[i], &ColorPresetButton::editRequested, this, [this, i]() {
            onColorEditRequested(i);
        });
        colorRow->addWidget(m_colorButtons[i]);
    }
    colorRow->addStretch();
    m_layout->addLayout(colorRow);

    // ----- Font size -----
    QHBoxLayout* fontHeader = new QHBoxLayout();
    QLabel* fontTitle = new QLabel(tr("Font Size"), this);
    fontTitle->setStyleSheet("font-weight: bold;");
    m_fontLabel = new QLabel(this);
    fontHeader->addWidget(fontTitle);
    fontHeader->addStretch();
    fontHeader->addWidget(m_fontLabel);
    m_layout->addLayout(fontHeader);

    m_fontSlider = new QSlider(Qt::Horizontal, this);
    m_fontSlider->setRange(TextAnnotation::MIN_FONT_SIZE, TextAnnotation::MAX_FONT_SIZE);
    m_fontSlider->setValue(TextAnnotation::DEFAULT_FONT_SIZE);
    connect(m_fontSlider, &QSlider::valueChanged, this, [this](int value) {
        m_fontLabel->setText(tr("%1px").arg(value));
        if (m_state) {
            m_state->setFontSize(value);
        }
    });
    m_layout->addWidget(m_fontSlider);

    // ----- Canvas commands -----
    QGridLayout* commands = new QGridLayout();
    commands->setSpacing(4);
    m_clearButton = new QPushButton(tr("Clear All"), this);
    m_themeButton = new QPushButton(this);
    m_zoomInButton = new QPushButton(tr("Zoom In"), this);
    m_zoomOutButton = new QPushButton(tr("Zoom Out"), this);
    commands->addWidget(m_clearButton, 0, 0);
    commands->addWidget(m_themeButton, 0, 1);
    commands->addWidget(m_zoomInButton, 1, 0);
    commands->addWidget(m_zoomOutButton, 1, 1);
    m_layout->addLayout(commands);

    connect(m_clearButton, &QPushButton::clicked, this, &AnnotationSidebar::clearRequested);
    connect(m_themeButton, &QPushButton::clicked, this, [this]() {
        if (m_state) m_state->toggleDarkMode();
    });
    connect(m_zoomInButton, &QPushButton::clicked, this, [this]() {
        if (m_state) m_state->zoomIn();
    });
    connect(m_zoomOutButton, &QPushButton::clicked, this, [this]() {
        if (m_state) m_state->zoomOut();
    });

    // ----- Selected annotation -----
    m_editBox = new QFrame(this);
    m_editBox->setObjectName("EditBox");
    QVBoxLayout* editLayout = new QVBoxLayout(m_editBox);
    editLayout->setContentsMargins(8, 8, 8, 8);
    editLayout->setSpacing(6);
    QLabel* editTitle = new QLabel(tr("Selected Annotation"), m_editBox);
    editTitle->setStyleSheet("font-weight: bold;");
    editLayout->addWidget(editTitle);
    m_editLine = new QLineEdit(m_editBox);
    connect(m_editLine, &QLineEdit::textEdited, this, &AnnotationSidebar::onEditTextChanged);
    editLayout->addWidget(m_editLine);
    m_deleteButton = new QPushButton(tr("Delete"), m_editBox);
    m_deleteButton->setObjectName("DeleteButton");
    connect(m_deleteButton, &QPushButton::clicked, this, [this]() {
        if (m_state) m_state->store()->removeSelected();
    });
    editLayout->addWidget(m_deleteButton);
    m_editBox->setVisible(false);
    m_layout->addWidget(m_editBox);

    m_layout->addStretch();

    // ----- Project -----
    QHBoxLayout* projectRow = new QHBoxLayout();
    projectRow->setSpacing(4);
    m_saveButton = new QPushButton(tr("Save"), this);
    m_openButton = new QPushButton(tr("Open"), this);
    connect(m_saveButton, &QPushButton::clicked, this, &AnnotationSidebar::saveRequested);
    connect(m_openButton, &QPushButton::clicked, this, &AnnotationSidebar::openRequested);
    projectRow->addWidget(m_saveButton);
    projectRow->addWidget(m_openButton);
    m_layout->addLayout(projectRow);

    m_counterLabel = new QLabel(this);
    m_counterLabel->setAlignment(Qt::AlignCenter);
    m_layout->addWidget(m_counterLabel);
}

QLabel* AnnotationSidebar::addSectionTitle(const QString& title)
{
    QLabel* label = new QLabel(title, this);
    label->setStyleSheet("font-weight: bold;");
    m_layout->addWidget(label);
    return label;
}

// ============================================================================
// State Connection
// ============================================================================

void AnnotationSidebar::setBoardState(BoardState* state)
{
    if (m_state == state) {
        return;
    }
    if (m_state) {
        disconnect(m_state, nullptr, this, nullptr);
        disconnect(m_state->store(), nullptr, this, nullptr);
        disconnect(m_state->palette(), nullptr, this, nullptr);
    }

    m_state = state;

    if (m_state) {
        connect(m_state->palette(), &TemplatePalette::pendingTokenChanged,
                this, &AnnotationSidebar::onPendingTokenChanged);
        connect(m_state->store(), &AnnotationStore::selectionChanged,
                this, &AnnotationSidebar::onSelectionChanged);
        connect(m_state->store(), &AnnotationStore::annotationsChanged,
                this, &AnnotationSidebar::onAnnotationsChanged);
        connect(m_state, &BoardState::darkModeChanged,
                this, &AnnotationSidebar::onDarkModeChanged);
        connect(m_state, &BoardState::fontSizeChanged, this, [this](int size) {
            QSignalBlocker blocker(m_fontSlider);
            m_fontSlider->setValue(size);
            m_fontLabel->setText(tr("%1px").arg(size));
        });

        m_state->setCurrentColor(selectedPresetColor());
    }

    syncFromState();
}

QColor AnnotationSidebar::selectedPresetColor() const
{
    if (m_selectedColorIndex >= 0 && m_selectedColorIndex < NUM_PRESETS) {
        return m_colorButtons[m_selectedColorIndex]->color();
    }
    return DEFAULT_COLORS[0];
}

void AnnotationSidebar::syncFromState()
{
    const int size = m_state ? m_state->fontSize() : TextAnnotation::DEFAULT_FONT_SIZE;
    {
        QSignalBlocker blocker(m_fontSlider);
        m_fontSlider->setValue(size);
    }
    m_fontLabel->setText(tr("%1px").arg(size));

    onPendingTokenChanged(m_state ? m_state->palette()->pendingToken() : QString());
    onSelectionChanged();
    updateCounter();
    onDarkModeChanged(m_state ? m_state->isDarkMode() : m_darkMode);
}

// ============================================================================
// Templates
// ============================================================================

void AnnotationSidebar::onTokenClicked(const QString& token)
{
    if (m_state) {
        m_state->palette()->arm(token);
    }
}

void AnnotationSidebar::onPendingTokenChanged(const QString& token)
{
    for (TemplateTokenButton* button : m_tokenButtons) {
        button->setArmed(!token.isEmpty() && button->token() == token);
    }

    if (token.isEmpty()) {
        m_armedHint->setVisible(false);
    } else {
        m_armedHint->setText(tr("Click the canvas to add \u201C%1\u201D").arg(token));
        m_armedHint->setVisible(true);
    }
}

// ============================================================================
// Colors
// ============================================================================

void AnnotationSidebar::loadColorPresets()
{
    QSettings settings;
    settings.beginGroup(SETTINGS_GROUP);

    for (int i = 0; i < NUM_PRESETS; ++i) {
        const QString key = KEY_COLOR_PREFIX + QString::number(i + 1);
        const QColor color = settings.value(key, DEFAULT_COLORS[i]).value<QColor>();
        m_colorButtons[i]->setColor(color.isValid() ? color : DEFAULT_COLORS[i]);
    }

    int selected = settings.value(KEY_SELECTED_COLOR, 0).toInt();
    settings.endGroup();

    if (selected < 0 || selected >= NUM_PRESETS) {
        selected = 0;
    }
    selectColorPreset(selected);
}

void AnnotationSidebar::saveColorPresets()
{
    QSettings settings;
    settings.beginGroup(SETTINGS_GROUP);
    for (int i = 0; i < NUM_PRESETS; ++i) {
        settings.setValue(KEY_COLOR_PREFIX + QString::number(i + 1), m_colorButtons[i]->color());
    }
    settings.setValue(KEY_SELECTED_COLOR, m_selectedColorIndex);
    settings.endGroup();
}

void AnnotationSidebar::selectColorPreset(int index)
{
    if (index < 0 || index >= NUM_PRESETS) return;

    for (int i = 0; i < NUM_PRESETS; ++i) {
        m_colorButtons[i]->setSelected(i == index);
    }
    m_selectedColorIndex = index;
}

void AnnotationSidebar::onColorPresetClicked(int index)
{
    if (index < 0 || index >= NUM_PRESETS) return;

    selectColorPreset(index);
    saveColorPresets();
    if (m_state) {
        m_state->setCurrentColor(m_colorButtons[index]->color());
    }
}

void AnnotationSidebar::onColorEditRequested(int index)
{
    if (index < 0 || index >= NUM_PRESETS) return;

    const QColor current = m_colorButtons[index]->color();
    const QColor chosen = QColorDialog::getColor(current, this, tr("Select Annotation Color"));
    if (!chosen.isValid() || chosen == current) {
        return;
    }

    m_colorButtons[index]->setColor(chosen);
    saveColorPresets();
    if (m_state && m_selectedColorIndex == index) {
        m_state->setCurrentColor(chosen);
    }
}

// ============================================================================
// Selection
// ============================================================================

void AnnotationSidebar::onSelectionChanged()
{
    const TextAnnotation* selected = m_state ? m_state->store()->selectedAnnotation() : nullptr;
    m_editBox->setVisible(selected != nullptr);
    if (selected && m_editLine->text() != selected->text) {
        m_editLine->setText(selected->text);
    }
}

void AnnotationSidebar::onAnnotationsChanged()
{
    updateCounter();
    onSelectionChanged();
}

void AnnotationSidebar::onEditTextChanged(const QString& text)
{
    if (m_state && m_state->store()->hasSelection()) {
        m_state->store()->updateText(m_state->store()->selectedId(), text);
    }
}

void AnnotationSidebar::updateCounter()
{
    const int count = m_state ? m_state->store()->count() : 0;
    m_counterLabel->setText(count == 1 ? tr("1 annotation") : tr("%1 annotations").arg(count));
}

// ============================================================================
// Theme
// ============================================================================

void AnnotationSidebar::onDarkModeChanged(bool dark)
{
    m_darkMode = dark;
    m_themeButton->setText(dark ? tr("Light Mode") : tr("Dark Mode"));
    for (TemplateTokenButton* button : m_tokenButtons) {
        button->setDarkMode(dark);
    }
    updateStyle();
}

void AnnotationSidebar::updateStyle()
{
    setStyleSheet(QString(
        "#AnnotationSidebar { background-color: %1; border-right: 1px solid %2; }"
        "#EditBox { background-color: %3; border: 1px solid %4; border-radius: 6px; }"
        "#DeleteButton { color: %5; }"
    ).arg(ThemeColors::panel(m_darkMode).name(),
          ThemeColors::border(m_darkMode).name(),
          ThemeColors::editPanel(m_darkMode).name(),
          ThemeColors::editBorder(m_darkMode).name(),
          ThemeColors::danger().name()));

    m_armedHint->setStyleSheet(QString("color: %1;").arg(ThemeColors::armedText(m_darkMode).name()));
    m_counterLabel->setStyleSheet(QString("color: %1;").arg(ThemeColors::textSecondary(m_darkMode).name()));
}
