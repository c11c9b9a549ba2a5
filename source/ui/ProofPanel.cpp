// ============================================================================
// ProofPanel Implementation
// ============================================================================

#include "ProofPanel.h"
#include "ThemeColors.h"
#include "../core/ProofStepList.h"

#include <QApplication>
#include <QFrame>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QScrollArea>
#include <QScroller>
#include <QVBoxLayout>

// ============================================================================
// ProofStepEntry
// ============================================================================

ProofStepEntry::ProofStepEntry(const QString& stepId, int number, QWidget* parent)
    : QWidget(parent)
    , m_stepId(stepId)
{
    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(4);

    m_numberLabel = new QLabel(this);
    m_numberLabel->setFixedWidth(24);
    layout->addWidget(m_numberLabel);

    QVBoxLayout* fields = new QVBoxLayout();
    fields->setSpacing(2);

    m_becauseEdit = new QLineEdit(this);
    m_becauseEdit->setPlaceholderText(tr("∵ Because"));
    fields->addWidget(m_becauseEdit);

    m_thereforeEdit = new QLineEdit(this);
    m_thereforeEdit->setPlaceholderText(tr("∴ Therefore"));
    fields->addWidget(m_thereforeEdit);
    layout->addLayout(fields, 1);

    m_removeButton = new QPushButton(QStringLiteral("×"), this);
    m_removeButton->setFixedSize(28, 28);
    m_removeButton->setToolTip(tr("Remove step"));
    layout->addWidget(m_removeButton, 0, Qt::AlignTop);

    connect(m_becauseEdit, &QLineEdit::textEdited, this, [this](const QString& text) {
        emit becauseEdited(m_stepId, text);
    });
    connect(m_thereforeEdit, &QLineEdit::textEdited, this, [this](const QString& text) {
        emit thereforeEdited(m_stepId, text);
    });
    connect(m_removeButton, &QPushButton::clicked, this, [this]() {
        emit removeRequested(m_stepId);
    });

    setNumber(number);
}

void ProofStepEntry::setNumber(int number)
{
    m_numberLabel->setText(QStringLiteral("%1.").arg(number));
}

void ProofStepEntry::setTexts(const QString& because, const QString& therefore)
{
    // setText() resets the cursor, so only touch edits whose content differs
    if (m_becauseEdit->text() != because) {
        m_becauseEdit->setText(because);
    }
    if (m_thereforeEdit->text() != therefore) {
        m_thereforeEdit->setText(therefore);
    }
}

// ============================================================================
// ProofPanel
// ============================================================================

ProofPanel::ProofPanel(QWidget* parent)
    : QWidget(parent)
{
    m_darkMode = QApplication::palette().color(QPalette::Window).lightness() < 128;
    setupUI();
    updateStyle();
}

void ProofPanel::setupUI()
{
    setFixedWidth(PANEL_WIDTH);
    setAttribute(Qt::WA_StyledBackground, true);
    setObjectName("ProofPanel");

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(12, 12, 12, 12);
    mainLayout->setSpacing(8);

    QLabel* title = new QLabel(tr("Proof"), this);
    title->setStyleSheet("font-weight: bold; font-size: 16px;");
    mainLayout->addWidget(title);

    m_scrollArea = new QScrollArea(this);
    m_scrollArea->setWidgetResizable(true);
    m_scrollArea->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    m_scrollArea->setFrameShape(QFrame::NoFrame);
    QScroller::grabGesture(m_scrollArea->viewport(), QScroller::TouchGesture);

    m_entryContainer = new QWidget();
    m_entryContainer->setObjectName("ProofEntries");
    m_entryLayout = new QVBoxLayout(m_entryContainer);
    m_entryLayout->setContentsMargins(0, 0, 0, 0);
    m_entryLayout->setSpacing(10);
    m_entryLayout->addStretch();  // Push entries to top

    m_scrollArea->setWidget(m_entryContainer);
    mainLayout->addWidget(m_scrollArea, 1);

    m_addButton = new QPushButton(tr("Add Step"), this);
    m_addButton->setMinimumHeight(32);
    connect(m_addButton, &QPushButton::clicked, this, [this]() {
        if (m_steps) {
            m_steps->append();
        }
    });
    mainLayout->addWidget(m_addButton);
}

void ProofPanel::setProofSteps(ProofStepList* steps)
{
    if (m_steps == steps) {
        return;
    }
    if (m_steps) {
        disconnect(m_steps, nullptr, this, nullptr);
    }

    m_steps = steps;
    if (m_steps) {
        connect(m_steps, &ProofStepList::stepsChanged, this, &ProofPanel::refresh);
    }
    refresh();
}

void ProofPanel::refresh()
{
    if (!m_steps) {
        clearEntries();
        return;
    }

    const QVector<ProofStep>& steps = m_steps->steps();

    // Same ids in the same order: update texts in place
    bool sameShape = steps.size() == m_entries.size();
    for (int i = 0; sameShape && i < steps.size(); ++i) {
        sameShape = steps[i].id == m_entries[i]->stepId();
    }

    if (!sameShape) {
        clearEntries();
        for (int i = 0; i < steps.size(); ++i) {
            ProofStepEntry* entry = new ProofStepEntry(steps[i].id, i + 1, m_entryContainer);
            connect(entry, &ProofStepEntry::becauseEdited, this, [this](const QString& id, const QString& text) {
                if (m_steps) m_steps->setBecause(id, text);
            });
            connect(entry, &ProofStepEntry::thereforeEdited, this, [this](const QString& id, const QString& text) {
                if (m_steps) m_steps->setTherefore(id, text);
            });
            connect(entry, &ProofStepEntry::removeRequested, this, [this](const QString& id) {
                if (m_steps) m_steps->remove(id);
            });

            // Insert before the trailing stretch
            m_entryLayout->insertWidget(m_entryLayout->count() - 1, entry);
            m_entries.append(entry);
        }
    }

    for (int i = 0; i < steps.size(); ++i) {
        m_entries[i]->setNumber(i + 1);
        m_entries[i]->setTexts(steps[i].because, steps[i].therefore);
    }
}

void ProofPanel::clearEntries()
{
    // deleteLater: an entry may be the sender of the signal that got us here
    for (ProofStepEntry* entry : m_entries) {
        m_entryLayout->removeWidget(entry);
        entry->hide();
        entry->deleteLater();
    }
    m_entries.clear();
}

void ProofPanel::setDarkMode(bool darkMode)
{
    if (m_darkMode != darkMode) {
        m_darkMode = darkMode;
        updateStyle();
    }
}

void ProofPanel::updateStyle()
{
    setStyleSheet(QString(
        "#ProofPanel { background-color: %1; border-left: 1px solid %2; }"
    ).arg(ThemeColors::panel(m_darkMode).name(), ThemeColors::border(m_darkMode).name()));

    m_entryContainer->setStyleSheet(QString("#ProofEntries { background-color: %1; }")
                                        .arg(ThemeColors::panel(m_darkMode).name()));
}
