// ============================================================================
// ProjectDocument - Implementation
// ============================================================================

#include "ProjectDocument.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSet>
#include <QUuid>
#include <QDebug>

namespace {

const QString KEY_IMAGE_PATH = QStringLiteral("imagePath");
const QString KEY_ANNOTATIONS = QStringLiteral("annotations");
const QString KEY_PROOF_STEPS = QStringLiteral("proofSteps");
const QString KEY_FONT_SIZE = QStringLiteral("fontSize");
const QString KEY_DARK_MODE = QStringLiteral("isDarkMode");

void fail(QString* errorString, const QString& message)
{
    qWarning() << "ProjectDocument::fromJson:" << message;
    if (errorString) {
        *errorString = message;
    }
}

} // namespace

// =========================================================================
// Serialization
// =========================================================================

QJsonObject ProjectDocument::toJson() const
{
    QJsonObject obj;

    if (!imagePath.isEmpty()) {
        obj[KEY_IMAGE_PATH] = imagePath;
    }

    QJsonArray annotationArray;
    for (const TextAnnotation& a : annotations) {
        annotationArray.append(a.toJson());
    }
    obj[KEY_ANNOTATIONS] = annotationArray;

    QJsonArray stepArray;
    for (const ProofStep& s : proofSteps) {
        stepArray.append(s.toJson());
    }
    obj[KEY_PROOF_STEPS] = stepArray;

    obj[KEY_FONT_SIZE] = fontSize;
    obj[KEY_DARK_MODE] = darkMode;

    return obj;
}

std::unique_ptr<ProjectDocument> ProjectDocument::fromJson(const QJsonObject& obj,
                                                           QString* errorString)
{
    auto doc = std::make_unique<ProjectDocument>();

    // ----- Image reference (unresolved) -----
    if (obj.contains(KEY_IMAGE_PATH)) {
        const QJsonValue v = obj[KEY_IMAGE_PATH];
        if (v.isString()) {
            doc->imagePath = v.toString();
        } else if (!v.isNull()) {
            fail(errorString, QStringLiteral("\"imagePath\" is not a string"));
            return nullptr;
        }
    }

    // ----- Preferences -----
    // Zero or non-numeric font sizes fall back to the default
    const int storedFontSize = obj[KEY_FONT_SIZE].toInt(0);
    doc->fontSize = storedFontSize > 0
        ? TextAnnotation::clampFontSize(storedFontSize)
        : TextAnnotation::DEFAULT_FONT_SIZE;
    doc->darkMode = obj[KEY_DARK_MODE].toBool(false);

    // ----- Annotations -----
    if (obj.contains(KEY_ANNOTATIONS)) {
        const QJsonValue v = obj[KEY_ANNOTATIONS];
        if (!v.isArray()) {
            fail(errorString, QStringLiteral("\"annotations\" is not an array"));
            return nullptr;
        }

        QSet<QString> seenIds;
        const QJsonArray array = v.toArray();
        doc->annotations.reserve(array.size());

        for (const QJsonValue& item : array) {
            if (!item.isObject()) {
                fail(errorString, QStringLiteral("annotation entry is not an object"));
                return nullptr;
            }
            TextAnnotation a = TextAnnotation::fromJson(item.toObject(), doc->fontSize);
            if (seenIds.contains(a.id)) {
                const QString oldId = a.id;
                while (seenIds.contains(a.id)) {
                    a.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
                }
                qWarning() << "ProjectDocument::fromJson: duplicate annotation id" << oldId
                           << "reassigned to" << a.id;
            }
            seenIds.insert(a.id);
            doc->annotations.append(a);
        }
    }

    // ----- Proof steps -----
    if (obj.contains(KEY_PROOF_STEPS)) {
        const QJsonValue v = obj[KEY_PROOF_STEPS];
        if (!v.isArray()) {
            fail(errorString, QStringLiteral("\"proofSteps\" is not an array"));
            return nullptr;
        }

        const QJsonArray array = v.toArray();
        doc->proofSteps.reserve(array.size());

        for (const QJsonValue& item : array) {
            if (!item.isObject()) {
                fail(errorString, QStringLiteral("proof step entry is not an object"));
                return nullptr;
            }
            doc->proofSteps.append(ProofStep::fromJson(item.toObject()));
        }

        // Missing or repeated step ids get fresh numeric ids past the largest one
        qlonglong maxId = 0;
        for (const ProofStep& step : doc->proofSteps) {
            bool ok = false;
            const qlonglong n = step.id.toLongLong(&ok);
            if (ok && n > maxId) {
                maxId = n;
            }
        }

        QSet<QString> seenStepIds;
        for (ProofStep& step : doc->proofSteps) {
            if (step.id.isEmpty() || seenStepIds.contains(step.id)) {
                const QString oldId = step.id;
                step.id = QString::number(++maxId);
                qWarning() << "ProjectDocument::fromJson: missing or duplicate proof step id" << oldId
                           << "reassigned to" << step.id;
            }
            seenStepIds.insert(step.id);
        }
    }

    return doc;
}

// =========================================================================
// ProjectSerializer
// =========================================================================

namespace ProjectSerializer {

QByteArray serialize(const ProjectDocument& doc)
{
    return QJsonDocument(doc.toJson()).toJson(QJsonDocument::Indented);
}

std::unique_ptr<ProjectDocument> deserialize(const QByteArray& data, QString* errorString)
{
    QJsonParseError parseError;
    QJsonDocument jsonDoc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        const QString message = QStringLiteral("JSON parse error at offset %1: %2")
            .arg(parseError.offset).arg(parseError.errorString());
        qWarning() << "ProjectSerializer::deserialize:" << message;
        if (errorString) {
            *errorString = message;
        }
        return nullptr;
    }

    if (!jsonDoc.isObject()) {
        const QString message = QStringLiteral("project root is not a JSON object");
        qWarning() << "ProjectSerializer::deserialize:" << message;
        if (errorString) {
            *errorString = message;
        }
        return nullptr;
    }

    return ProjectDocument::fromJson(jsonDoc.object(), errorString);
}

} // namespace ProjectSerializer
