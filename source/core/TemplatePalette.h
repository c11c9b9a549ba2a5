#pragma once

// ============================================================================
// TemplatePalette - Quick-insert text tokens and the armed token
// ============================================================================
// Part of the ProofBoard annotation model
//
// The catalog is fixed. The only state is the pending ("armed") token that
// the next canvas click will insert.
// ============================================================================

#include <QObject>
#include <QString>
#include <QStringList>

class TemplatePalette : public QObject {
    Q_OBJECT

public:
    explicit TemplatePalette(QObject* parent = nullptr);

    /**
     * @brief The fixed list of quick-insert tokens, in display order.
     */
    static const QStringList& catalog();

    QString pendingToken() const { return m_pendingToken; }
    bool isArmed() const { return !m_pendingToken.isEmpty(); }

    /**
     * @brief Arm a token.
     *
     * Arming the token that is already armed disarms it (toggle);
     * arming a different token replaces it.
     */
    void arm(const QString& token);

    void disarm();

    /**
     * @brief Consume the pending token.
     * @return The token that was armed (empty if none). The palette is disarmed.
     */
    QString take();

signals:
    void pendingTokenChanged(const QString& token);

private:
    void setPendingToken(const QString& token);

    QString m_pendingToken;
};
