#pragma once

// ============================================================================
// ProofStepList - Free-text "because / therefore" scratchpad
// ============================================================================
// Steps are not checked for logical validity; both fields may be empty.
// ============================================================================

#include <QObject>
#include <QString>
#include <QVector>
#include <QJsonObject>

/**
 * @brief One proof step: a justification ("because") and a conclusion ("therefore").
 */
struct ProofStep {
    QString id;
    QString because;
    QString therefore;

    bool operator==(const ProofStep& other) const {
        return id == other.id && because == other.because && therefore == other.therefore;
    }
    bool operator!=(const ProofStep& other) const { return !(*this == other); }

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["id"] = id;
        obj["because"] = because;
        obj["therefore"] = therefore;
        return obj;
    }

    static ProofStep fromJson(const QJsonObject& obj) {
        ProofStep step;
        step.id = obj["id"].toString();
        step.because = obj["because"].toString();
        step.therefore = obj["therefore"].toString();
        return step;
    }
};

class ProofStepList : public QObject {
    Q_OBJECT

public:
    explicit ProofStepList(QObject* parent = nullptr);

    const QVector<ProofStep>& steps() const { return m_steps; }
    int count() const { return m_steps.size(); }
    bool isEmpty() const { return m_steps.isEmpty(); }
    const ProofStep* step(const QString& id) const;

    /**
     * @brief Append a blank step.
     * @return The new step's id: one past the largest numeric id in the list.
     */
    QString append();

    bool remove(const QString& id);
    bool setBecause(const QString& id, const QString& text);
    bool setTherefore(const QString& id, const QString& text);

    void replaceAll(const QVector<ProofStep>& steps);

    /**
     * @brief Append one blank step if the list is empty.
     * @return True if a step was added.
     */
    bool ensureSeeded();

signals:
    void stepsChanged();

private:
    int indexOf(const QString& id) const;
    QString nextId() const;

    QVector<ProofStep> m_steps;
};
