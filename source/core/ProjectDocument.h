#pragma once

// ============================================================================
// ProjectDocument - Persisted form of one annotation session
// ============================================================================
// Part of the ProofBoard annotation model
//
// File format (.proof or .json, interchangeable):
//   {
//     "imagePath":   "/path/to/diagram.png",     (optional)
//     "annotations": [{id, x, y, text, color, fontSize}, ...],
//     "proofSteps":  [{id, because, therefore}, ...],
//     "fontSize":    28,
//     "isDarkMode":  false
//   }
//
// The document only stores a reference to the image. Resolving it to pixels
// is the caller's job (see ProjectManager::loadImage()).
// ============================================================================

#include "ProofStepList.h"
#include "../objects/TextAnnotation.h"

#include <QString>
#include <QVector>
#include <QByteArray>
#include <QJsonObject>
#include <memory>

/**
 * @brief Complete persisted state: image reference, annotations, proof, preferences.
 */
struct ProjectDocument {
    QString imagePath;                       ///< Empty = no background image
    QVector<TextAnnotation> annotations;     ///< Insertion order
    QVector<ProofStep> proofSteps;
    int fontSize = TextAnnotation::DEFAULT_FONT_SIZE;  ///< Default for new annotations
    bool darkMode = false;

    bool hasImage() const { return !imagePath.isEmpty(); }

    bool operator==(const ProjectDocument& other) const {
        return imagePath == other.imagePath && annotations == other.annotations
            && proofSteps == other.proofSteps && fontSize == other.fontSize
            && darkMode == other.darkMode;
    }
    bool operator!=(const ProjectDocument& other) const { return !(*this == other); }

    QJsonObject toJson() const;

    /**
     * @brief Build a document from a parsed JSON object.
     * @param obj Root object of the project file.
     * @param errorString Receives a description on failure (may be nullptr).
     * @return The document, or nullptr if the structure is invalid.
     *
     * Missing optional fields get their defaults. Annotations without an id,
     * or with an id already used earlier in the file, receive a fresh id.
     */
    static std::unique_ptr<ProjectDocument> fromJson(const QJsonObject& obj,
                                                     QString* errorString = nullptr);
};

/**
 * @brief Text encoding of ProjectDocument.
 */
namespace ProjectSerializer {

/**
 * @brief Encode a document as indented JSON.
 */
QByteArray serialize(const ProjectDocument& doc);

/**
 * @brief Parse a project file.
 * @param data Raw file contents.
 * @param errorString Receives a description on failure (may be nullptr).
 * @return The document, or nullptr on any structural failure. Nothing is
 *         partially applied: callers either get a whole document or none.
 */
std::unique_ptr<ProjectDocument> deserialize(const QByteArray& data,
                                             QString* errorString = nullptr);

} // namespace ProjectSerializer
