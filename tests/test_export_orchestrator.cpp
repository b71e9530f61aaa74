#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <sstream>

#include "core/export_orchestrator.hpp"
#include "core/name_resolver.hpp"
#include "core/package_grouper.hpp"
#include "core/record_normalizer.hpp"
#include "scripted_exporter.hpp"

using drvkeep::BackupSession;
using drvkeep::ExportFailureKind;
using drvkeep::ExportOutcome;
using drvkeep::ExportStatus;
using drvkeep::testing::rawRecord;
using drvkeep::testing::ScriptedExporter;

class ExportOrchestratorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testEveryPackageGetsOneOutcome();
    void testFailureDoesNotStopRun();
    void testUnknownInfIsSkipped();
    void testInfSharedAcrossClassesExportedOnce();
    void testDryRunCallsNothing();
    void testCancellationSkipsRemaining();
    void testFilesystemErrorClassification();
    void testUnpublishedInfSkippedInLiveAndDryRun();
    void testVerboseListsPackageMembers();

private:
    BackupSession makeSession(const std::vector<drvkeep::RawDriverRecord> &raws,
                              bool dryRun, const QString &subdir) const;

    QTemporaryDir m_tempDir;
    QByteArray m_prevLogDir;
};

void ExportOrchestratorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevLogDir = qgetenv("DRVKEEP_LOG_DIR");
    qputenv("DRVKEEP_LOG_DIR", QString(m_tempDir.path() + "/logs").toUtf8());
}

void ExportOrchestratorTests::cleanupTestCase()
{
    if (m_prevLogDir.isEmpty()) {
        qunsetenv("DRVKEEP_LOG_DIR");
    } else {
        qputenv("DRVKEEP_LOG_DIR", m_prevLogDir);
    }
}

BackupSession ExportOrchestratorTests::makeSession(
    const std::vector<drvkeep::RawDriverRecord> &raws, bool dryRun, const QString &subdir) const
{
    BackupSession session;
    session.id = "20240101_000000";
    session.dryRun = dryRun;
    session.outputRoot = std::filesystem::path(m_tempDir.path().toStdString());
    session.backupDir = session.outputRoot / subdir.toStdString();
    session.buckets = drvkeep::groupPackages(drvkeep::RecordNormalizer().normalizeAll(raws).records);
    drvkeep::NameResolver resolver;
    resolver.resolve(session.buckets);
    return session;
}

void ExportOrchestratorTests::testEveryPackageGetsOneOutcome()
{
    BackupSession session = makeSession({
        rawRecord("NVIDIA GeForce RTX 3080", "Display", "oem1.inf"),
        rawRecord("NVIDIA Audio", "Display", "oem1.inf"),
        rawRecord("Intel Ethernet", "Net", "oem7.inf"),
    }, false, QStringLiteral("every"));

    ScriptedExporter exporter;
    drvkeep::ExportOrchestrator orchestrator(exporter);
    orchestrator.run(session);

    QCOMPARE(exporter.calls.size(), std::size_t(2));
    QCOMPARE(exporter.callsFor("oem1.inf"), std::size_t(1));
    QCOMPARE(session.counters.packagesExported, std::size_t(2));
    for (const auto &bucket : session.buckets) {
        for (const auto &package : bucket.packages) {
            QVERIFY(package.outcome.has_value());
            QCOMPARE(package.outcome->status, ExportStatus::Success);
        }
    }

    const auto destination = exporter.calls[0].destination;
    QVERIFY(std::filesystem::is_directory(destination));
    QCOMPARE(QString::fromStdString(destination.filename().u8string()),
             QStringLiteral("NVIDIA GeForce RTX 3080_1.0.0.0 Package"));
    QCOMPARE(QString::fromStdString(destination.parent_path().filename().u8string()),
             QStringLiteral("Display"));
}

void ExportOrchestratorTests::testFailureDoesNotStopRun()
{
    BackupSession session = makeSession({
        rawRecord("First", "Net", "oem2.inf"),
        rawRecord("Second", "Net", "oem3.inf"),
    }, false, QStringLiteral("failure"));

    ScriptedExporter exporter;
    exporter.script["oem2.inf"] = ExportOutcome::failed(ExportFailureKind::PermissionDenied,
                                                        "pnputil exit code 5");
    std::ostringstream console;
    drvkeep::ExportOrchestrator orchestrator(exporter, &console);
    orchestrator.run(session);

    QCOMPARE(exporter.calls.size(), std::size_t(2));
    QCOMPARE(session.counters.exportFailures, std::size_t(1));
    QCOMPARE(session.counters.packagesExported, std::size_t(1));

    const auto &packages = session.buckets[0].packages;
    QCOMPARE(packages[0].outcome->status, ExportStatus::Failed);
    QCOMPARE(packages[0].outcome->failureKind, ExportFailureKind::PermissionDenied);
    QCOMPARE(packages[1].outcome->status, ExportStatus::Success);

    const QString text = QString::fromStdString(console.str());
    QVERIFY(text.contains(QStringLiteral("Failed to export oem2.inf")));
    QVERIFY(text.contains(QStringLiteral("Try running as Administrator")));
}

void ExportOrchestratorTests::testUnknownInfIsSkipped()
{
    auto raw = rawRecord("Mystery", "System", "");
    BackupSession session = makeSession({raw}, false, QStringLiteral("unknown"));

    ScriptedExporter exporter;
    drvkeep::ExportOrchestrator orchestrator(exporter);
    orchestrator.run(session);

    QVERIFY(exporter.calls.empty());
    const auto &outcome = *session.buckets[0].packages[0].outcome;
    QCOMPARE(outcome.status, ExportStatus::Skipped);
    QCOMPARE(QString::fromStdString(outcome.detail), QStringLiteral("definition file unknown"));
    QCOMPARE(session.counters.packagesSkipped, std::size_t(1));
}

void ExportOrchestratorTests::testInfSharedAcrossClassesExportedOnce()
{
    BackupSession session = makeSession({
        rawRecord("Realtek Audio", "MEDIA", "oem4.inf"),
        rawRecord("Realtek Effects", "SoftwareComponent", "oem4.inf"),
    }, false, QStringLiteral("shared"));

    ScriptedExporter exporter;
    drvkeep::ExportOrchestrator orchestrator(exporter);
    orchestrator.run(session);

    QCOMPARE(exporter.callsFor("oem4.inf"), std::size_t(1));
    QCOMPARE(session.buckets[0].packages[0].outcome->status, ExportStatus::Success);
    const auto &second = *session.buckets[1].packages[0].outcome;
    QCOMPARE(second.status, ExportStatus::Skipped);
    QVERIFY(QString::fromStdString(second.detail)
                .contains(QStringLiteral("MEDIA/Realtek Audio_1.0.0.0 Package")));
}

void ExportOrchestratorTests::testDryRunCallsNothing()
{
    BackupSession session = makeSession({
        rawRecord("GPU", "Display", "oem1.inf"),
        rawRecord("NIC", "Net", "oem2.inf"),
    }, true, QStringLiteral("dry"));

    ScriptedExporter exporter;
    drvkeep::ExportOrchestrator orchestrator(exporter);
    orchestrator.run(session);

    QVERIFY(exporter.calls.empty());
    QVERIFY(!std::filesystem::exists(session.backupDir));
    QCOMPARE(session.counters.packagesExported, std::size_t(2));
    for (const auto &bucket : session.buckets) {
        QCOMPARE(bucket.packages[0].outcome->status, ExportStatus::Success);
        QCOMPARE(bucket.packages[0].outcome->fileCount, std::size_t(0));
    }
}

void ExportOrchestratorTests::testCancellationSkipsRemaining()
{
    BackupSession session = makeSession({
        rawRecord("A", "Net", "oem1.inf"),
        rawRecord("B", "Net", "oem2.inf"),
        rawRecord("C", "Net", "oem3.inf"),
    }, false, QStringLiteral("cancel"));

    ScriptedExporter exporter;
    drvkeep::ExportOrchestrator orchestrator(exporter);
    orchestrator.setCancellationCheck([&exporter] { return exporter.calls.size() >= 1; });
    orchestrator.run(session);

    QVERIFY(session.interrupted);
    QCOMPARE(exporter.calls.size(), std::size_t(1));
    const auto &packages = session.buckets[0].packages;
    QCOMPARE(packages[0].outcome->status, ExportStatus::Success);
    QCOMPARE(packages[1].outcome->status, ExportStatus::Skipped);
    QCOMPARE(QString::fromStdString(packages[2].outcome->detail), QStringLiteral("run interrupted"));
    QCOMPARE(session.counters.packagesSkipped, std::size_t(2));
}

void ExportOrchestratorTests::testFilesystemErrorClassification()
{
    QCOMPARE(drvkeep::classifyFilesystemError(
                 std::make_error_code(std::errc::permission_denied)),
             ExportFailureKind::PermissionDenied);
    QCOMPARE(drvkeep::classifyFilesystemError(
                 std::make_error_code(std::errc::filename_too_long)),
             ExportFailureKind::PathTooLong);
    QCOMPARE(drvkeep::classifyFilesystemError(
                 std::make_error_code(std::errc::no_such_file_or_directory)),
             ExportFailureKind::NotFound);
    QCOMPARE(drvkeep::classifyFilesystemError(
                 std::make_error_code(std::errc::no_space_on_device)),
             ExportFailureKind::Other);
}

void ExportOrchestratorTests::testUnpublishedInfSkippedInLiveAndDryRun()
{
    const std::vector<drvkeep::RawDriverRecord> batch = {
        rawRecord("Intel Ethernet", "Net", "e1i63x64.inf", "Intel"),
        rawRecord("Intel Wireless", "Net", "oem8.inf", "Intel"),
    };

    for (const bool dryRun : {false, true}) {
        BackupSession session = makeSession(batch, dryRun,
                                            dryRun ? QStringLiteral("inbox-dry")
                                                   : QStringLiteral("inbox-live"));
        ScriptedExporter exporter;
        exporter.unpublished.insert("e1i63x64.inf");
        std::ostringstream console;
        drvkeep::ExportOrchestrator orchestrator(exporter, &console);
        orchestrator.run(session);

        QCOMPARE(exporter.callsFor("e1i63x64.inf"), std::size_t(0));
        QCOMPARE(session.counters.exportFailures, std::size_t(0));
        QCOMPARE(session.counters.packagesSkipped, std::size_t(1));
        QCOMPARE(session.counters.packagesExported, std::size_t(1));

        const auto &inbox = *session.buckets[0].packages[0].outcome;
        QCOMPARE(inbox.status, ExportStatus::Skipped);
        QCOMPARE(QString::fromStdString(inbox.detail),
                 QStringLiteral("not a published driver-store package"));
        QVERIFY(!QString::fromStdString(console.str()).contains(QStringLiteral("Failed to export")));
    }
}

void ExportOrchestratorTests::testVerboseListsPackageMembers()
{
    BackupSession session = makeSession({
        rawRecord("RTX 3080", "Display", "oem1.inf", "NVIDIA", "v1"),
        rawRecord("RTX 3070", "Display", "oem1.inf", "NVIDIA", "v1"),
    }, true, QStringLiteral("verbose"));

    ScriptedExporter exporter;
    std::ostringstream console;
    drvkeep::ExportOrchestrator orchestrator(exporter, &console, true);
    orchestrator.run(session);

    const QString text = QString::fromStdString(console.str());
    QVERIFY(text.contains(QStringLiteral("Number of devices in this package: 2")));
    QVERIFY(text.contains(QStringLiteral("1. Device: RTX 3080")));
    QVERIFY(text.contains(QStringLiteral("2. Device: RTX 3070")));
    QVERIFY(text.contains(QStringLiteral("INF: oem1.inf")));
    QVERIFY(text.contains(QStringLiteral("Provider: NVIDIA")));
    QVERIFY(text.contains(QStringLiteral("Version: v1")));
    QVERIFY(text.contains(QStringLiteral("Hardware ID: ")));
}

QTEST_MAIN(ExportOrchestratorTests)
#include "test_export_orchestrator.moc"
