#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <filesystem>
#include <sstream>

#include "common/csv_utils.hpp"
#include "core/backup_runner.hpp"
#include "core/report_writer.hpp"
#include "scripted_exporter.hpp"

using drvkeep::BackupError;
using drvkeep::BackupOptions;
using drvkeep::BackupRunner;
using drvkeep::ExportStatus;
using drvkeep::ReportWriter;
using drvkeep::testing::FixedDriverSource;
using drvkeep::testing::rawRecord;
using drvkeep::testing::ScriptedExporter;

namespace {

// 2024-03-01 12:30:45 UTC
const std::chrono::system_clock::time_point kStartedAt{std::chrono::seconds(1709296245)};

std::string readFile(const std::filesystem::path &path)
{
    QFile file(QString::fromStdString(path.u8string()));
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll().toStdString();
}

std::size_t countEntries(const std::filesystem::path &root)
{
    if (!std::filesystem::exists(root)) {
        return 0;
    }
    std::size_t count = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(root);
         it != std::filesystem::recursive_directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

} // namespace

class BackupRunnerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testThreeGpusShareOnePackage();
    void testEqualNamesDifferentInfs();
    void testOsVendorExcludedEverywhere();
    void testDryRunWritesNothingAndMatchesLivePlan();
    void testExistingBackupDirGetsSuffix();
    void testNothingToExport();
    void testInterruptedRunStillReports();
    void testPrivilegeRequired();
    void testEnumerationFailure();
    void testOutputRootIsAFile();
    void testUnreadableBackupDirIsReported();

private:
    std::filesystem::path outputRoot(const QString &name) const;
    BackupOptions optionsFor(const QString &name, bool dryRun = false) const;
    void prepare(BackupRunner &runner) const;

    QTemporaryDir m_tempDir;
    QByteArray m_prevLogDir;
};

void BackupRunnerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevLogDir = qgetenv("DRVKEEP_LOG_DIR");
    qputenv("DRVKEEP_LOG_DIR", QString(m_tempDir.path() + "/logs").toUtf8());
}

void BackupRunnerTests::cleanupTestCase()
{
    if (m_prevLogDir.isEmpty()) {
        qunsetenv("DRVKEEP_LOG_DIR");
    } else {
        qputenv("DRVKEEP_LOG_DIR", m_prevLogDir);
    }
}

std::filesystem::path BackupRunnerTests::outputRoot(const QString &name) const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / name.toStdString();
}

BackupOptions BackupRunnerTests::optionsFor(const QString &name, bool dryRun) const
{
    BackupOptions options;
    options.outputRoot = outputRoot(name);
    options.dryRun = dryRun;
    return options;
}

void BackupRunnerTests::prepare(BackupRunner &runner) const
{
    runner.setPrivilegeCheck([] { return true; });
    runner.setClock([] { return kStartedAt; });
}

void BackupRunnerTests::testThreeGpusShareOnePackage()
{
    FixedDriverSource source({
        rawRecord("Generic volume", "Volume", "volume.inf", "Microsoft"),
        rawRecord("RTX 3080", "Display", "oem1.inf", "NVIDIA", "v1"),
        rawRecord("RTX 3070", "Display", "oem1.inf", "NVIDIA", "v1"),
        rawRecord("RTX 3060", "Display", "oem1.inf", "NVIDIA", "v1"),
    });
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    prepare(runner);

    const auto result = runner.backup(optionsFor(QStringLiteral("gpu")));
    QVERIFY(result.success);
    QCOMPARE(QString::fromStdString(result.sessionId), QStringLiteral("20240301_123045"));
    QCOMPARE(result.backupDir, outputRoot(QStringLiteral("gpu")) / "drivers_20240301_123045");
    QCOMPARE(result.packagesTotal, std::size_t(1));
    QCOMPARE(result.counters.recordsSeen, std::size_t(4));
    QCOMPARE(result.counters.recordsExcluded, std::size_t(1));
    QCOMPARE(result.counters.packagesExported, std::size_t(1));

    QCOMPARE(exporter.calls.size(), std::size_t(1));
    QCOMPARE(QString::fromStdString(exporter.calls[0].definitionFile), QStringLiteral("oem1.inf"));

    const auto packageDir = result.backupDir / "Display" / "RTX 3080_v1 Package";
    QCOMPARE(exporter.calls[0].destination, packageDir);
    QCOMPARE(runner.session().buckets[0].packages[0].records.size(), std::size_t(3));

    const auto rows = drvkeep::parseCsv(readFile(packageDir / ReportWriter::kPackageCsvName));
    QCOMPARE(rows.size(), std::size_t(4));
    QCOMPARE(QString::fromStdString(rows[3][0]), QStringLiteral("RTX 3060"));
    QVERIFY(std::filesystem::exists(result.backupDir / ReportWriter::kMasterCsvName));
    QVERIFY(std::filesystem::exists(result.backupDir / ReportWriter::kSummaryName));
}

void BackupRunnerTests::testEqualNamesDifferentInfs()
{
    FixedDriverSource source({
        rawRecord("Generic USB Hub", "USB", "oem2.inf"),
        rawRecord("Generic USB Hub", "USB", "oem3.inf"),
    });
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    prepare(runner);

    const auto result = runner.backup(optionsFor(QStringLiteral("hubs")));
    QCOMPARE(result.counters.packagesExported, std::size_t(2));
    QCOMPARE(exporter.callsFor("oem2.inf"), std::size_t(1));
    QCOMPARE(exporter.callsFor("oem3.inf"), std::size_t(1));
    QVERIFY(exporter.calls[0].destination != exporter.calls[1].destination);

    const auto &packages = runner.session().buckets[0].packages;
    QCOMPARE(QString::fromStdString(packages[0].folderName),
             QStringLiteral("Generic USB Hub_1.0.0.0 Package"));
    QCOMPARE(QString::fromStdString(packages[1].folderName),
             QStringLiteral("Generic USB Hub_1.0.0.0 Package (2)"));
}

void BackupRunnerTests::testOsVendorExcludedEverywhere()
{
    FixedDriverSource source({
        rawRecord("Microsoft Basic Display", "Display", "basicdisplay.inf", "Microsoft"),
        rawRecord("Intel Ethernet", "Net", "oem5.inf", "Intel"),
        rawRecord("WAN Miniport", "Net", "netrasa.inf", "Microsoft Corporation"),
    });
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    prepare(runner);

    const auto result = runner.backup(optionsFor(QStringLiteral("vendor")));
    QCOMPARE(result.counters.recordsExcluded, std::size_t(2));
    QCOMPARE(exporter.calls.size(), std::size_t(1));

    const QString master = QString::fromStdString(
        readFile(result.backupDir / ReportWriter::kMasterCsvName));
    const QString summary = QString::fromStdString(
        readFile(result.backupDir / ReportWriter::kSummaryName));
    QVERIFY(master.contains(QStringLiteral("Intel Ethernet")));
    QVERIFY(!master.contains(QStringLiteral("Microsoft")));
    QVERIFY(!summary.contains(QStringLiteral("Microsoft")));
    QVERIFY(!std::filesystem::exists(result.backupDir / "Display"));
}

void BackupRunnerTests::testDryRunWritesNothingAndMatchesLivePlan()
{
    const std::vector<drvkeep::RawDriverRecord> batch = {
        rawRecord("NVIDIA GeForce RTX 3080", "Display", "oem1.inf"),
        rawRecord("NVIDIA Audio", "Display", "oem1.inf"),
        rawRecord("Generic USB Hub", "USB", "oem2.inf"),
        rawRecord("Generic USB Hub", "USB", "oem3.inf"),
        rawRecord("Mystery", "System", ""),
    };

    FixedDriverSource drySource(batch);
    ScriptedExporter dryExporter;
    std::ostringstream console;
    BackupRunner dryRunner(drySource, dryExporter, &console);
    prepare(dryRunner);
    const auto dryResult = dryRunner.backup(optionsFor(QStringLiteral("plan"), true));

    QVERIFY(dryResult.success);
    QVERIFY(dryResult.dryRun);
    QVERIFY(dryExporter.calls.empty());
    QCOMPARE(countEntries(outputRoot(QStringLiteral("plan"))), std::size_t(0));
    QVERIFY(!std::filesystem::exists(outputRoot(QStringLiteral("plan"))));
    QVERIFY(QString::fromStdString(console.str())
                .contains(QStringLiteral("=== USB (2 packages) ===")));

    FixedDriverSource liveSource(batch);
    ScriptedExporter liveExporter;
    BackupRunner liveRunner(liveSource, liveExporter);
    prepare(liveRunner);
    liveRunner.backup(optionsFor(QStringLiteral("live")));

    const auto &planned = dryRunner.session().buckets;
    const auto &actual = liveRunner.session().buckets;
    QCOMPARE(planned.size(), actual.size());
    for (std::size_t i = 0; i < planned.size(); ++i) {
        QCOMPARE(planned[i].classSegment, actual[i].classSegment);
        QCOMPARE(planned[i].packages.size(), actual[i].packages.size());
        for (std::size_t j = 0; j < planned[i].packages.size(); ++j) {
            const auto &p = planned[i].packages[j];
            const auto &a = actual[i].packages[j];
            QCOMPARE(p.folderName, a.folderName);
            QCOMPARE(p.records.size(), a.records.size());
            QCOMPARE(p.outcome->status, a.outcome->status);
        }
    }
}

void BackupRunnerTests::testExistingBackupDirGetsSuffix()
{
    const auto root = outputRoot(QStringLiteral("suffix"));
    std::filesystem::create_directories(root / "drivers_20240301_123045");

    FixedDriverSource source({rawRecord("GPU", "Display", "oem1.inf")});
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    prepare(runner);

    const auto result = runner.backup(optionsFor(QStringLiteral("suffix")));
    QCOMPARE(result.backupDir, root / "drivers_20240301_123045_2");
    QCOMPARE(countEntries(root / "drivers_20240301_123045"), std::size_t(0));
}

void BackupRunnerTests::testNothingToExport()
{
    FixedDriverSource source({rawRecord("Volume", "Volume", "volume.inf", "Microsoft")});
    ScriptedExporter exporter;
    std::ostringstream console;
    BackupRunner runner(source, exporter, &console);
    prepare(runner);

    const auto result = runner.backup(optionsFor(QStringLiteral("empty")));
    QVERIFY(result.success);
    QCOMPARE(result.packagesTotal, std::size_t(0));
    QVERIFY(exporter.calls.empty());
    QVERIFY(QString::fromStdString(console.str())
                .contains(QStringLiteral("No third-party drivers found to export.")));
}

void BackupRunnerTests::testInterruptedRunStillReports()
{
    FixedDriverSource source({
        rawRecord("A", "Net", "oem1.inf"),
        rawRecord("B", "Net", "oem2.inf"),
    });
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    prepare(runner);
    runner.setCancellationCheck([&exporter] { return !exporter.calls.empty(); });

    const auto result = runner.backup(optionsFor(QStringLiteral("interrupted")));
    QVERIFY(result.interrupted);
    QCOMPARE(result.counters.packagesExported, std::size_t(1));
    QCOMPARE(result.counters.packagesSkipped, std::size_t(1));

    const QString summary = QString::fromStdString(
        readFile(result.backupDir / ReportWriter::kSummaryName));
    QVERIFY(summary.contains(QStringLiteral("Run was interrupted")));
    QVERIFY(summary.contains(QStringLiteral("skipped, run interrupted")));

    QVERIFY(std::filesystem::exists(
        result.backupDir / "Net" / "A_1.0.0.0 Package" / ReportWriter::kPackageCsvName));
    QVERIFY(!std::filesystem::exists(result.backupDir / "Net" / "B_1.0.0.0 Package"));
}

void BackupRunnerTests::testPrivilegeRequired()
{
    FixedDriverSource source({rawRecord("GPU", "Display", "oem1.inf")});
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    runner.setPrivilegeCheck([] { return false; });

    bool thrown = false;
    try {
        runner.backup(optionsFor(QStringLiteral("privilege")));
    } catch (const BackupError &ex) {
        thrown = true;
        QCOMPARE(ex.stage(), BackupError::Stage::Privilege);
        QVERIFY(!ex.hint().empty());
    }
    QVERIFY(thrown);
    QCOMPARE(source.enumerations, 0);
    QVERIFY(!std::filesystem::exists(outputRoot(QStringLiteral("privilege"))));

    // Dry runs from a saved list do not need elevation.
    BackupOptions options = optionsFor(QStringLiteral("privilege"), true);
    options.requirePrivilege = false;
    QVERIFY(runner.backup(options).success);
}

void BackupRunnerTests::testEnumerationFailure()
{
    FixedDriverSource source;
    source.failure = "WMI unavailable";
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    prepare(runner);

    bool thrown = false;
    try {
        runner.backup(optionsFor(QStringLiteral("enumeration")));
    } catch (const BackupError &ex) {
        thrown = true;
        QCOMPARE(ex.stage(), BackupError::Stage::Enumeration);
        QVERIFY(QString::fromUtf8(ex.what()).contains(QStringLiteral("WMI unavailable")));
    }
    QVERIFY(thrown);
    QVERIFY(exporter.calls.empty());
}

void BackupRunnerTests::testOutputRootIsAFile()
{
    const auto root = outputRoot(QStringLiteral("file-root"));
    QFile file(QString::fromStdString(root.u8string()));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("not a directory");
    file.close();

    FixedDriverSource source({rawRecord("GPU", "Display", "oem1.inf")});
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    prepare(runner);

    bool thrown = false;
    try {
        runner.backup(optionsFor(QStringLiteral("file-root")));
    } catch (const BackupError &ex) {
        thrown = true;
        QCOMPARE(ex.stage(), BackupError::Stage::OutputRoot);
        QCOMPARE(QString::fromStdString(drvkeep::toStageString(ex.stage())),
                 QStringLiteral("output"));
    }
    QVERIFY(thrown);
    QCOMPARE(source.enumerations, 0);
}

void BackupRunnerTests::testUnreadableBackupDirIsReported()
{
#ifdef Q_OS_WIN
    QSKIP("needs a POSIX symlink loop");
#else
    const auto root = outputRoot(QStringLiteral("loop-root"));
    std::filesystem::create_directories(root);
    // A link to itself cannot be stat'ed (ELOOP).
    std::filesystem::create_symlink("drivers_20240301_123045", root / "drivers_20240301_123045");

    FixedDriverSource source({rawRecord("GPU", "Display", "oem1.inf")});
    ScriptedExporter exporter;
    BackupRunner runner(source, exporter);
    prepare(runner);

    bool thrown = false;
    try {
        runner.backup(optionsFor(QStringLiteral("loop-root")));
    } catch (const BackupError &ex) {
        thrown = true;
        QCOMPARE(ex.stage(), BackupError::Stage::OutputRoot);
        QVERIFY(QString::fromUtf8(ex.what()).contains(QStringLiteral("drivers_20240301_123045")));
    }
    QVERIFY(thrown);
    QVERIFY(exporter.calls.empty());
#endif
}

QTEST_MAIN(BackupRunnerTests)
#include "test_backup_runner.moc"
