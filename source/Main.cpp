// ============================================================================
// ProofBoard - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QTranslator>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QTest>

#include "MainWindow.h"

// Test includes
#include "core/CanvasTransformTests.h"
#include "core/AnnotationStoreTests.h"
#include "core/ProjectDocumentTests.h"
#include "core/BoardStateTests.h"
#include "core/TemplatePaletteTests.h"
#include "ui/AnnotationWidgetTests.h"

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QApplication& app, QTranslator& translator)
{
    QSettings settings;
    const bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    const QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/proofboard/translations",
        "/usr/local/share/proofboard/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "proofboard/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "transform") {
        success = CanvasTransformTests::runAllTests();
    } else if (testType == "store") {
        success = AnnotationStoreTests::runAllTests();
    } else if (testType == "serializer") {
        success = ProjectDocumentTests::runAllTests();
    } else if (testType == "board") {
        success = BoardStateTests::runAllTests();
    } else if (testType == "palette") {
        TemplatePaletteTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "widgets") {
        AnnotationWidgetTests tests;
        return QTest::qExec(&tests);
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("ProofBoard");
    app.setApplicationName("App");

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--test-transform") {
            testToRun = "transform";
        } else if (arg == "--test-store") {
            testToRun = "store";
        } else if (arg == "--test-serializer") {
            testToRun = "serializer";
        } else if (arg == "--test-board") {
            testToRun = "board";
        } else if (arg == "--test-palette") {
            testToRun = "palette";
        } else if (arg == "--test-widgets") {
            testToRun = "widgets";
        } else if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Launch Application ==========
    MainWindow w;
    w.show();

    if (!inputFile.isEmpty() && !w.openProjectFile(inputFile)) {
        qWarning() << "main: could not open" << inputFile << "- starting an empty session";
    }

    return app.exec();
}
