#pragma once

// ============================================================================
// ProjectDocumentTests - Unit tests for project (de)serialization
// ============================================================================
// Part of the ProofBoard document architecture
//
// Tests:
// - Round trip of annotations, proof steps and preferences
// - Defaults for missing or invalid fields
// - Malformed input is rejected without a partial document
// - Duplicate annotation and proof step ids are reassigned on load
// - Image path resolution relative to the project file
// - Opening a project is all-or-nothing for BoardState
// ============================================================================

#include "ProjectDocument.h"
#include "ProjectManager.h"
#include "BoardState.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QImage>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>
#include <QTemporaryDir>

namespace ProjectDocumentTests {

inline ProjectDocument makeSampleDocument()
{
    ProjectDocument doc;
    doc.imagePath = QStringLiteral("/home/user/diagrams/triangle.png");
    doc.annotations.append(TextAnnotation(QPointF(120, 80), QStringLiteral("∠A"), QColor(0, 0, 255), 28));
    doc.annotations.append(TextAnnotation(QPointF(33.5, 210.25), QStringLiteral("△ABC"), QColor(0, 0, 0), 40));
    doc.proofSteps.append(ProofStep{ QStringLiteral("1"), QStringLiteral("AB = AC"), QStringLiteral("△ABC is isosceles") });
    doc.proofSteps.append(ProofStep{ QStringLiteral("2"), QString(), QStringLiteral("∠B = ∠C") });
    doc.fontSize = 36;
    doc.darkMode = true;
    return doc;
}

inline bool testRoundTrip()
{
    qDebug() << "=== Test: Serialization Round Trip ===";
    bool success = true;

    const ProjectDocument original = makeSampleDocument();
    const QByteArray data = ProjectSerializer::serialize(original);

    QString error;
    std::unique_ptr<ProjectDocument> loaded = ProjectSerializer::deserialize(data, &error);
    if (!loaded) {
        qDebug() << "FAIL: deserialize returned nullptr:" << error;
        return false;
    }

    if (*loaded != original) {
        qDebug() << "FAIL: round trip changed the document";
        success = false;
    }

    // Wire format details
    const QJsonObject root = QJsonDocument::fromJson(data).object();
    const QJsonObject first = root["annotations"].toArray().first().toObject();
    if (first["color"].toString() != QStringLiteral("#0000FF")) {
        qDebug() << "FAIL: color should be written as #0000FF, got" << first["color"].toString();
        success = false;
    }
    if (first["x"].toDouble() != 120 || first["y"].toDouble() != 80) {
        qDebug() << "FAIL: position should be written as x/y";
        success = false;
    }
    if (root["isDarkMode"].toBool() != true || root["fontSize"].toInt() != 36) {
        qDebug() << "FAIL: preferences not written under isDarkMode/fontSize";
        success = false;
    }
    qDebug() << "  - Round trip: OK";

    // No image: the key is omitted entirely
    {
        ProjectDocument noImage;
        const QJsonObject obj = QJsonDocument::fromJson(ProjectSerializer::serialize(noImage)).object();
        if (obj.contains("imagePath")) {
            qDebug() << "FAIL: imagePath should be omitted when empty";
            success = false;
        }
        qDebug() << "  - Omitted imagePath: OK";
    }

    return success;
}

inline bool testDefaults()
{
    qDebug() << "=== Test: Defaults ===";
    bool success = true;

    // The minimal document
    {
        const QByteArray data = R"({"annotations":[],"proofSteps":[],"fontSize":28,"isDarkMode":false})";
        auto doc = ProjectSerializer::deserialize(data);
        if (!doc) {
            qDebug() << "FAIL: minimal document rejected";
            return false;
        }
        if (!doc->annotations.isEmpty() || !doc->proofSteps.isEmpty() || doc->fontSize != 28
            || doc->darkMode || doc->hasImage()) {
            qDebug() << "FAIL: minimal document fields mismatch";
            success = false;
        }
        qDebug() << "  - Minimal document: OK";
    }

    // Everything missing
    {
        auto doc = ProjectSerializer::deserialize("{}");
        if (!doc || *doc != ProjectDocument()) {
            qDebug() << "FAIL: empty object should give a default document";
            success = false;
        }
        qDebug() << "  - Empty object: OK";
    }

    // Zero / non-numeric / out-of-range font sizes
    {
        auto zero = ProjectSerializer::deserialize(R"({"fontSize":0})");
        auto text = ProjectSerializer::deserialize(R"({"fontSize":"big"})");
        auto huge = ProjectSerializer::deserialize(R"({"fontSize":500})");
        if (!zero || zero->fontSize != 28 || !text || text->fontSize != 28) {
            qDebug() << "FAIL: zero or non-numeric fontSize should fall back to 28";
            success = false;
        }
        if (!huge || huge->fontSize != TextAnnotation::MAX_FONT_SIZE) {
            qDebug() << "FAIL: oversized fontSize should clamp to 48";
            success = false;
        }
        qDebug() << "  - Font size fallback: OK";
    }

    // Annotation fields fall back individually
    {
        auto doc = ProjectSerializer::deserialize(
            R"({"fontSize":20,"annotations":[{"text":"AB","color":"not-a-color"}]})");
        if (!doc || doc->annotations.size() != 1) {
            qDebug() << "FAIL: annotation with missing fields should still load";
            return false;
        }
        const TextAnnotation& a = doc->annotations.first();
        if (a.id.isEmpty() || a.position != QPointF(0, 0) || a.color != QColor(255, 0, 0)
            || a.fontSize != 20) {
            qDebug() << "FAIL: missing annotation fields should get defaults"
                     << a.id << a.position << a.color << a.fontSize;
            success = false;
        }
        qDebug() << "  - Annotation field defaults: OK";
    }

    return success;
}

inline bool testMalformed()
{
    qDebug() << "=== Test: Malformed Input ===";
    bool success = true;

    const QByteArray cases[] = {
        "",
        "not json",
        "[1, 2, 3]",
        R"({"annotations": {}})",
        R"({"annotations": [42]})",
        R"({"proofSteps": "none"})",
        R"({"imagePath": 7})"
    };

    for (const QByteArray& data : cases) {
        QString error;
        auto doc = ProjectSerializer::deserialize(data, &error);
        if (doc) {
            qDebug() << "FAIL: malformed input accepted:" << data;
            success = false;
        } else if (error.isEmpty()) {
            qDebug() << "FAIL: no error message for" << data;
            success = false;
        }
    }
    qDebug() << "  - Malformed rejected: OK";

    return success;
}

inline bool testDuplicateIds()
{
    qDebug() << "=== Test: Duplicate Ids ===";
    bool success = true;

    auto doc = ProjectSerializer::deserialize(R"({"annotations":[
        {"id":"same","x":1,"y":1,"text":"A","color":"#FF0000","fontSize":28},
        {"id":"same","x":2,"y":2,"text":"B","color":"#FF0000","fontSize":28},
        {"id":"other","x":3,"y":3,"text":"C","color":"#FF0000","fontSize":28}
    ]})");

    if (!doc || doc->annotations.size() != 3) {
        qDebug() << "FAIL: document with duplicate ids should load";
        return false;
    }

    QSet<QString> ids;
    for (const TextAnnotation& a : doc->annotations) {
        ids.insert(a.id);
    }
    if (ids.size() != 3) {
        qDebug() << "FAIL: ids should be unique after load";
        success = false;
    }
    if (doc->annotations[0].id != QStringLiteral("same") || doc->annotations[2].id != QStringLiteral("other")) {
        qDebug() << "FAIL: the first occurrence and unique ids should be kept";
        success = false;
    }
    if (doc->annotations[1].text != QStringLiteral("B")) {
        qDebug() << "FAIL: order should be preserved";
        success = false;
    }
    qDebug() << "  - Duplicate ids reassigned: OK";

    auto stepsDoc = ProjectSerializer::deserialize(R"({"proofSteps":[
        {"because":"a"},
        {"because":"b"},
        {"id":"3","because":"c"},
        {"id":"3","because":"d"}
    ]})");

    if (!stepsDoc || stepsDoc->proofSteps.size() != 4) {
        qDebug() << "FAIL: document with missing step ids should load";
        return false;
    }

    const QStringList expectedIds = { QStringLiteral("4"), QStringLiteral("5"),
                                      QStringLiteral("3"), QStringLiteral("6") };
    for (int i = 0; i < expectedIds.size(); ++i) {
        if (stepsDoc->proofSteps[i].id != expectedIds[i]) {
            qDebug() << "FAIL: step" << i << "id should be" << expectedIds[i]
                     << "got" << stepsDoc->proofSteps[i].id;
            success = false;
        }
    }

    // Editing the second step must not touch the first
    ProofStepList steps;
    steps.replaceAll(stepsDoc->proofSteps);
    steps.setBecause(stepsDoc->proofSteps[1].id, QStringLiteral("x"));
    if (steps.steps()[0].because != QStringLiteral("a") || steps.steps()[1].because != QStringLiteral("x")) {
        qDebug() << "FAIL: edit should reach only the step it was made on";
        success = false;
    }
    steps.remove(stepsDoc->proofSteps[1].id);
    if (steps.count() != 3 || steps.steps()[0].because != QStringLiteral("a")) {
        qDebug() << "FAIL: remove should delete only the step it was made on";
        success = false;
    }
    qDebug() << "  - Missing and duplicate step ids reassigned: OK";

    return success;
}

inline bool testFileIo()
{
    qDebug() << "=== Test: Project File I/O ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: cannot create temporary directory";
        return false;
    }

    ProjectManager manager;
    const ProjectDocument original = makeSampleDocument();
    const QString path = dir.filePath(QStringLiteral("proof.proof"));

    if (!manager.saveProject(original, path)) {
        qDebug() << "FAIL: saveProject failed:" << manager.lastError();
        return false;
    }

    auto loaded = manager.loadProject(path);
    if (!loaded || *loaded != original) {
        qDebug() << "FAIL: saved project did not load back unchanged";
        success = false;
    }
    qDebug() << "  - Save and load: OK";

    if (manager.loadProject(dir.filePath(QStringLiteral("missing.proof")))
        || manager.lastError().isEmpty()) {
        qDebug() << "FAIL: missing project should fail with an error";
        success = false;
    }
    if (!manager.loadImage(dir.filePath(QStringLiteral("missing.png"))).isNull()
        || manager.lastError().isEmpty()) {
        qDebug() << "FAIL: missing image should fail with an error";
        success = false;
    }
    qDebug() << "  - Missing files: OK";

    // Extension and path helpers
    if (ProjectManager::ensureProjectExtension("/tmp/a") != QStringLiteral("/tmp/a.proof")
        || ProjectManager::ensureProjectExtension("/tmp/a.json") != QStringLiteral("/tmp/a.json")
        || ProjectManager::ensureProjectExtension("/tmp/a.PROOF") != QStringLiteral("/tmp/a.PROOF")) {
        qDebug() << "FAIL: ensureProjectExtension mismatch";
        success = false;
    }
    const QString resolved = ProjectManager::resolveImagePath(QStringLiteral("img/d.png"), path);
    if (resolved != QDir::cleanPath(dir.path() + QStringLiteral("/img/d.png"))) {
        qDebug() << "FAIL: relative image path should resolve next to the project, got" << resolved;
        success = false;
    }
    if (ProjectManager::resolveImagePath(QStringLiteral("/abs/d.png"), path) != QStringLiteral("/abs/d.png")) {
        qDebug() << "FAIL: absolute image path should be unchanged";
        success = false;
    }
    qDebug() << "  - Path helpers: OK";

    return success;
}

inline bool writeFile(const QString& path, const QByteArray& data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(data) == data.size();
}

inline bool testOpenProject()
{
    qDebug() << "=== Test: Open Project Into Board ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: cannot create temporary directory";
        return false;
    }

    ProjectManager manager;
    int loadedSignals = 0;
    QObject::connect(&manager, &ProjectManager::projectLoaded, [&loadedSignals]() { ++loadedSignals; });

    BoardState state;
    state.setViewportSize(QSizeF(800, 600));
    state.applyDocument(makeSampleDocument(), QSize(800, 600));
    const ProjectDocument before = state.toDocument();

    // Project that points at a diagram that does not exist
    const QString brokenPath = dir.filePath(QStringLiteral("broken.proof"));
    if (!writeFile(brokenPath, R"({"imagePath":"missing.png","annotations":[
            {"id":"n1","x":5,"y":5,"text":"∠B","color":"#000000","fontSize":20}],
            "fontSize":20})")) {
        qDebug() << "FAIL: cannot write test project";
        return false;
    }

    QImage image;
    if (manager.openProject(brokenPath, &state, &image)) {
        qDebug() << "FAIL: project with a missing diagram should not open";
        success = false;
    }
    if (manager.lastError().isEmpty()) {
        qDebug() << "FAIL: failed open should report an error";
        success = false;
    }
    if (state.toDocument() != before) {
        qDebug() << "FAIL: failed open must leave the board unchanged";
        success = false;
    }
    if (loadedSignals != 0) {
        qDebug() << "FAIL: projectLoaded should not fire for a failed open";
        success = false;
    }

    // Malformed file
    const QString badJsonPath = dir.filePath(QStringLiteral("bad.proof"));
    if (!writeFile(badJsonPath, "{ not json")) {
        qDebug() << "FAIL: cannot write test project";
        return false;
    }
    if (manager.openProject(badJsonPath, &state) || state.toDocument() != before) {
        qDebug() << "FAIL: malformed project must fail and leave the board unchanged";
        success = false;
    }
    qDebug() << "  - Failed open applies nothing: OK";

    // Project with a relative diagram next to it
    QImage diagram(40, 30, QImage::Format_RGB32);
    diagram.fill(Qt::white);
    if (!diagram.save(dir.filePath(QStringLiteral("diagram.png")))) {
        qDebug() << "FAIL: cannot write test diagram";
        return false;
    }
    const QString goodPath = dir.filePath(QStringLiteral("good.proof"));
    if (!writeFile(goodPath, R"({"imagePath":"diagram.png","annotations":[
            {"id":"n1","x":5,"y":5,"text":"∠B","color":"#000000","fontSize":20}]})")) {
        qDebug() << "FAIL: cannot write test project";
        return false;
    }

    if (!manager.openProject(goodPath, &state, &image)) {
        qDebug() << "FAIL: valid project should open:" << manager.lastError();
        return false;
    }
    if (image.size() != QSize(40, 30)) {
        qDebug() << "FAIL: decoded diagram should be returned, got" << image.size();
        success = false;
    }
    if (state.imagePath() != QDir::cleanPath(dir.filePath(QStringLiteral("diagram.png")))) {
        qDebug() << "FAIL: relative diagram should resolve next to the project, got" << state.imagePath();
        success = false;
    }
    if (state.store()->count() != 1 || !state.store()->contains(QStringLiteral("n1"))) {
        qDebug() << "FAIL: annotations should be replaced by the project's";
        success = false;
    }
    if (state.proofSteps()->count() != 1) {
        qDebug() << "FAIL: proof list should be seeded after open";
        success = false;
    }
    if (loadedSignals != 1) {
        qDebug() << "FAIL: projectLoaded should fire once, got" << loadedSignals;
        success = false;
    }
    qDebug() << "  - Successful open applies project: OK";

    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Project Serializer Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testRoundTrip();
    qDebug() << "";

    allPass &= testDefaults();
    qDebug() << "";

    allPass &= testMalformed();
    qDebug() << "";

    allPass &= testDuplicateIds();
    qDebug() << "";

    allPass &= testFileIo();
    qDebug() << "";

    allPass &= testOpenProject();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL PROJECT SERIALIZER TESTS PASSED!";
    } else {
        qDebug() << "SOME PROJECT SERIALIZER TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace ProjectDocumentTests
