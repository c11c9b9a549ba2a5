#ifndef TEMPLATEPALETTETESTS_H
#define TEMPLATEPALETTETESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "TemplatePalette.h"
#include "ProofStepList.h"
#include "AnnotationStore.h"

/**
 * Signal-level tests for the palette, the proof step list and the store.
 * Run with: proofboard --test-palette
 */
class TemplatePaletteTests : public QObject {
    Q_OBJECT

private slots:
    void testCatalog() {
        const QStringList& tokens = TemplatePalette::catalog();
        QCOMPARE(tokens.size(), 17);
        QCOMPARE(tokens.first(), QStringLiteral("A"));
        QCOMPARE(tokens.last(), QStringLiteral("∥"));
        QVERIFY(tokens.contains(QStringLiteral("∠A")));
        QVERIFY(tokens.contains(QStringLiteral("△ABC")));
        QVERIFY(tokens.contains(QStringLiteral("90°")));
    }

    void testArmToggle() {
        TemplatePalette palette;
        QSignalSpy spy(&palette, &TemplatePalette::pendingTokenChanged);

        QVERIFY(!palette.isArmed());

        palette.arm(QStringLiteral("∠A"));
        QVERIFY(palette.isArmed());
        QCOMPARE(palette.pendingToken(), QStringLiteral("∠A"));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.takeFirst().at(0).toString(), QStringLiteral("∠A"));

        // Same token again disarms
        palette.arm(QStringLiteral("∠A"));
        QVERIFY(!palette.isArmed());
        QCOMPARE(spy.count(), 1);
        QVERIFY(spy.takeFirst().at(0).toString().isEmpty());
    }

    void testArmReplace() {
        TemplatePalette palette;
        palette.arm(QStringLiteral("A"));
        palette.arm(QStringLiteral("≅"));
        QCOMPARE(palette.pendingToken(), QStringLiteral("≅"));
    }

    void testTake() {
        TemplatePalette palette;
        QCOMPARE(palette.take(), QString());

        palette.arm(QStringLiteral("⊥"));
        QSignalSpy spy(&palette, &TemplatePalette::pendingTokenChanged);
        QCOMPARE(palette.take(), QStringLiteral("⊥"));
        QVERIFY(!palette.isArmed());
        QCOMPARE(spy.count(), 1);

        // Disarming twice is silent
        palette.disarm();
        QCOMPARE(spy.count(), 1);
    }

    void testProofStepIds() {
        ProofStepList list;
        QSignalSpy spy(&list, &ProofStepList::stepsChanged);

        QVERIFY(list.ensureSeeded());
        QVERIFY(!list.ensureSeeded());
        QCOMPARE(list.count(), 1);
        QCOMPARE(list.steps().first().id, QStringLiteral("1"));

        const QString second = list.append();
        const QString third = list.append();
        QCOMPARE(second, QStringLiteral("2"));
        QCOMPARE(third, QStringLiteral("3"));

        // Removing a middle step never causes an id to be reused
        QVERIFY(list.remove(second));
        QCOMPARE(list.append(), QStringLiteral("4"));
        QCOMPARE(spy.count(), 5);
    }

    void testProofStepEdits() {
        ProofStepList list;
        list.ensureSeeded();
        const QString id = list.steps().first().id;

        QSignalSpy spy(&list, &ProofStepList::stepsChanged);
        QVERIFY(list.setBecause(id, QStringLiteral("AB = AC")));
        QVERIFY(list.setTherefore(id, QStringLiteral("∠B = ∠C")));
        QCOMPARE(spy.count(), 2);

        // Unchanged text is not a change
        QVERIFY(list.setBecause(id, QStringLiteral("AB = AC")));
        QCOMPARE(spy.count(), 2);

        QVERIFY(!list.setBecause(QStringLiteral("99"), QStringLiteral("x")));
        QVERIFY(!list.remove(QStringLiteral("99")));

        const ProofStep* step = list.step(id);
        QVERIFY(step);
        QCOMPARE(step->because, QStringLiteral("AB = AC"));
        QCOMPARE(step->therefore, QStringLiteral("∠B = ∠C"));
    }

    void testProofStepIdsAfterLoad() {
        ProofStepList list;
        QVector<ProofStep> loaded;
        loaded.append(ProofStep{ QStringLiteral("7"), QString(), QString() });
        loaded.append(ProofStep{ QStringLiteral("custom"), QString(), QString() });
        list.replaceAll(loaded);
        QCOMPARE(list.append(), QStringLiteral("8"));
    }

    void testStoreSignals() {
        AnnotationStore store;
        QSignalSpy changed(&store, &AnnotationStore::annotationsChanged);
        QSignalSpy selection(&store, &AnnotationStore::selectionChanged);

        const QString id = store.insert(QPointF(1, 2), QStringLiteral("AB"), Qt::red, 28);
        QCOMPARE(changed.count(), 1);
        QCOMPARE(selection.count(), 1);
        QCOMPARE(selection.takeFirst().at(0).toString(), id);

        // Moving to the same place is not a change
        store.move(id, QPointF(1, 2));
        QCOMPARE(changed.count(), 1);

        store.remove(id);
        QCOMPARE(changed.count(), 2);
        QCOMPARE(selection.count(), 1);
        QVERIFY(selection.takeFirst().at(0).toString().isEmpty());

        // Clearing an empty store is silent
        store.clear();
        QCOMPARE(changed.count(), 2);
    }
};

#endif // TEMPLATEPALETTETESTS_H
