#ifndef PROOFPANEL_H
#define PROOFPANEL_H

// ============================================================================
// ProofPanel - Editable two-column proof (∵ because / ∴ therefore)
// ============================================================================
// Part of the ProofBoard UI
//
// One ProofStepEntry per step in the attached ProofStepList. Edits are
// written straight through to the list. When the list changes from outside
// (load, add, remove) the entries are reconciled by id so a line edit that
// has focus keeps its cursor.
// ============================================================================

#include <QWidget>
#include <QString>
#include <QVector>

class ProofStepList;
class QLabel;
class QLineEdit;
class QPushButton;
class QScrollArea;
class QVBoxLayout;

/**
 * @brief One row of the proof: step number, two line edits, remove button.
 */
class ProofStepEntry : public QWidget {
    Q_OBJECT

public:
    ProofStepEntry(const QString& stepId, int number, QWidget* parent = nullptr);

    QString stepId() const { return m_stepId; }

    void setNumber(int number);
    void setTexts(const QString& because, const QString& therefore);

signals:
    void becauseEdited(const QString& stepId, const QString& text);
    void thereforeEdited(const QString& stepId, const QString& text);
    void removeRequested(const QString& stepId);

private:
    QString m_stepId;
    QLabel* m_numberLabel = nullptr;
    QLineEdit* m_becauseEdit = nullptr;
    QLineEdit* m_thereforeEdit = nullptr;
    QPushButton* m_removeButton = nullptr;
};

class ProofPanel : public QWidget {
    Q_OBJECT

public:
    explicit ProofPanel(QWidget* parent = nullptr);

    /**
     * @brief Attach the list to edit. Not owned.
     */
    void setProofSteps(ProofStepList* steps);

    int entryCount() const { return m_entries.size(); }

    void setDarkMode(bool darkMode);

private slots:
    void refresh();

private:
    void setupUI();
    void clearEntries();
    void updateStyle();

    ProofStepList* m_steps = nullptr;
    bool m_darkMode = false;

    QScrollArea* m_scrollArea = nullptr;
    QWidget* m_entryContainer = nullptr;
    QVBoxLayout* m_entryLayout = nullptr;
    QPushButton* m_addButton = nullptr;
    QVector<ProofStepEntry*> m_entries;

    static constexpr int PANEL_WIDTH = 320;
};

#endif // PROOFPANEL_H
