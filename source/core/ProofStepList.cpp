#include "ProofStepList.h"

ProofStepList::ProofStepList(QObject* parent)
    : QObject(parent)
{
}

const ProofStep* ProofStepList::step(const QString& id) const
{
    const int idx = indexOf(id);
    return idx >= 0 ? &m_steps[idx] : nullptr;
}

QString ProofStepList::append()
{
    ProofStep s;
    s.id = nextId();
    m_steps.append(s);
    emit stepsChanged();
    return s.id;
}

bool ProofStepList::remove(const QString& id)
{
    const int idx = indexOf(id);
    if (idx < 0) {
        return false;
    }
    m_steps.removeAt(idx);
    emit stepsChanged();
    return true;
}

bool ProofStepList::setBecause(const QString& id, const QString& text)
{
    const int idx = indexOf(id);
    if (idx < 0) {
        return false;
    }
    if (m_steps[idx].because != text) {
        m_steps[idx].because = text;
        emit stepsChanged();
    }
    return true;
}

bool ProofStepList::setTherefore(const QString& id, const QString& text)
{
    const int idx = indexOf(id);
    if (idx < 0) {
        return false;
    }
    if (m_steps[idx].therefore != text) {
        m_steps[idx].therefore = text;
        emit stepsChanged();
    }
    return true;
}

void ProofStepList::replaceAll(const QVector<ProofStep>& steps)
{
    m_steps = steps;
    emit stepsChanged();
}

bool ProofStepList::ensureSeeded()
{
    if (!m_steps.isEmpty()) {
        return false;
    }
    append();
    return true;
}

int ProofStepList::indexOf(const QString& id) const
{
    for (int i = 0; i < m_steps.size(); ++i) {
        if (m_steps[i].id == id) {
            return i;
        }
    }
    return -1;
}

QString ProofStepList::nextId() const
{
    // Ids loaded from files may be arbitrary strings; only numeric ones count
    qlonglong maxId = 0;
    for (const ProofStep& s : m_steps) {
        bool ok = false;
        const qlonglong n = s.id.toLongLong(&ok);
        if (ok && n > maxId) {
            maxId = n;
        }
    }
    return QString::number(maxId + 1);
}
