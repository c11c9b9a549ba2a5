#include "TemplatePalette.h"

TemplatePalette::TemplatePalette(QObject* parent)
    : QObject(parent)
{
}

const QStringList& TemplatePalette::catalog()
{
    // Vertex labels, segments, angle/triangle markers, degrees, relations
    static const QStringList tokens = {
        QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C"), QStringLiteral("D"),
        QStringLiteral("AB"), QStringLiteral("BC"), QStringLiteral("AC"),
        QStringLiteral("∠___"), QStringLiteral("∠A"), QStringLiteral("∠B"),
        QStringLiteral("△ABC"), QStringLiteral("△___"),
        QStringLiteral("___°"), QStringLiteral("90°"),
        QStringLiteral("≅"), QStringLiteral("⊥"), QStringLiteral("∥")
    };
    return tokens;
}

void TemplatePalette::arm(const QString& token)
{
    setPendingToken(token == m_pendingToken ? QString() : token);
}

void TemplatePalette::disarm()
{
    setPendingToken(QString());
}

QString TemplatePalette::take()
{
    const QString token = m_pendingToken;
    disarm();
    return token;
}

void TemplatePalette::setPendingToken(const QString& token)
{
    if (m_pendingToken == token) {
        return;
    }
    m_pendingToken = token;
    emit pendingTokenChanged(m_pendingToken);
}
