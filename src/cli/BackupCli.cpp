#include "cli/BackupCli.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <QCommandLineOption>
#include <QCommandLineParser>

#include "common/drvkeep_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/backup_runner.hpp"
#include "system/cim_driver_source.hpp"
#include "system/json_file_driver_source.hpp"
#include "system/pnputil_exporter.hpp"
#include "system/recording_driver_source.hpp"

namespace drvkeep {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  drvkeep [backup] [-o DIR] [-v] [-d] [--input FILE] [--save-records FILE]\n"
        "          [--exclude-provider NAME]... [--format text|json]\n"
        "          [--pnputil PATH] [--trace]\n"
        "  drvkeep --version\n"
        "  drvkeep --help\n");
}

std::filesystem::path toPath(const QString &value)
{
    return std::filesystem::u8path(value.toStdString());
}

void renderText(const BackupResult &result)
{
    if (result.dryRun) {
        std::cout << "Dry run completed. " << result.packagesTotal
                  << " driver packages would be exported.\n";
        return;
    }

    std::cout << "\nDriver backup process completed!\n";
    std::cout << "Successfully exported: " << result.counters.packagesExported
              << " driver packages\n";
    if (result.counters.exportFailures > 0) {
        std::cout << "Failed to export: " << result.counters.exportFailures
                  << " drivers\n";
    }
    if (result.counters.packagesSkipped > 0) {
        std::cout << "Skipped: " << result.counters.packagesSkipped
                  << " driver packages\n";
    }
    if (result.interrupted) {
        std::cout << "Run interrupted; remaining packages were skipped.\n";
    }
    if (!result.backupDir.empty()) {
        std::cout << "Backup location: " << result.backupDir.u8string() << "\n";
    }
}

void renderJson(const BackupResult &result)
{
    nlohmann::json payload = result;
    payload["version"] = DRVKEEP_VERSION;
    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

} // namespace

void BackupCli::setCancellationCheck(std::function<bool()> check)
{
    m_cancelled = std::move(check);
}

int BackupCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QCommandLineParser parser;
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Backup root directory."),
                                          QStringLiteral("dir"),
                                          QStringLiteral("driver_backup"));
    const QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Print per-package progress."));
    const QCommandLineOption dryRunOption({QStringLiteral("d"), QStringLiteral("dry-run")},
                                          QStringLiteral("Plan the backup without writing."));
    const QCommandLineOption inputOption(QStringLiteral("input"),
                                         QStringLiteral("Read the driver list from a JSON file."),
                                         QStringLiteral("file"));
    const QCommandLineOption saveOption(QStringLiteral("save-records"),
                                        QStringLiteral("Save the enumerated driver list as JSON."),
                                        QStringLiteral("file"));
    const QCommandLineOption excludeOption(QStringLiteral("exclude-provider"),
                                           QStringLiteral("Skip drivers from this vendor."),
                                           QStringLiteral("name"));
    const QCommandLineOption formatOption(QStringLiteral("format"),
                                          QStringLiteral("Result format: text or json."),
                                          QStringLiteral("format"),
                                          QStringLiteral("text"));
    const QCommandLineOption pnputilOption(QStringLiteral("pnputil"),
                                           QStringLiteral("Path of the pnputil program."),
                                           QStringLiteral("path"));
    const QCommandLineOption versionOption(QStringLiteral("version"),
                                           QStringLiteral("Print the version."));
    const QCommandLineOption helpOption({QStringLiteral("h"), QStringLiteral("help")},
                                        QStringLiteral("Print usage."));
    parser.addOptions({outputOption, verboseOption, dryRunOption, inputOption,
                       saveOption, excludeOption, formatOption, pnputilOption,
                       versionOption, helpOption});

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << "\n"
                  << usageText().toStdString();
        return kExitFailure;
    }
    if (parser.isSet(helpOption)) {
        std::cout << usageText().toStdString();
        return kExitOk;
    }
    if (parser.isSet(versionOption)) {
        std::cout << "drvkeep " << DRVKEEP_VERSION << "\n";
        return kExitOk;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1
        || (positional.size() == 1 && positional.front() != QStringLiteral("backup"))) {
        std::cerr << usageText().toStdString();
        return kExitFailure;
    }

    const QString format = parser.value(formatOption).toLower();
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitFailure;
    }
    const bool jsonOutput = format == QStringLiteral("json");

    BackupOptions options;
    options.outputRoot = toPath(parser.value(outputOption));
    options.verbose = parser.isSet(verboseOption);
    options.dryRun = parser.isSet(dryRunOption);
    const QString input = parser.value(inputOption);
    options.requirePrivilege = input.isEmpty() || !options.dryRun;
    if (parser.isSet(excludeOption)) {
        // Explicit vendors replace the default list.
        options.excludedProviders.clear();
        for (const QString &name : parser.values(excludeOption)) {
            options.excludedProviders.push_back(name.toStdString());
        }
    }

    DKLOG_INFO(QStringLiteral("BackupCli"),
               QStringLiteral("run"),
               QStringLiteral("backup_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"dryRun", options.dryRun},
                               {"verbose", options.verbose},
                               {"input", input.toStdString()},
                               {"format", format.toStdString()}}));

    std::unique_ptr<DriverSource> systemSource;
    if (input.isEmpty()) {
        systemSource = std::make_unique<CimDriverSource>();
    } else {
        systemSource = std::make_unique<JsonFileDriverSource>(toPath(input));
    }
    DriverSource *source = systemSource.get();
    std::optional<RecordingDriverSource> recording;
    if (parser.isSet(saveOption)) {
        recording.emplace(*systemSource, toPath(parser.value(saveOption)));
        source = &*recording;
    }
    PnpUtilExporter exporter(parser.value(pnputilOption));

    // Progress goes to stderr when stdout carries the JSON result.
    std::ostream &console = jsonOutput ? std::cerr : std::cout;
    if (options.verbose) {
        console << "Driver Export Tool\n"
                << "==================\n"
                << "Output directory: " << options.outputRoot.u8string() << "\n"
                << "Dry run: " << (options.dryRun ? "true" : "false") << "\n\n";
    }

    BackupRunner runner(*source, exporter, &console);
    if (m_cancelled) {
        runner.setCancellationCheck(m_cancelled);
    }

    BackupResult result;
    try {
        result = runner.backup(options);
    } catch (const BackupError &ex) {
        DKLOG_ERROR(QStringLiteral("BackupCli"),
                    QStringLiteral("run"),
                    QStringLiteral("backup_failed"),
                    QStringLiteral("user_invocation"),
                    QString::fromStdString(toStageString(ex.stage())),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        std::cerr << "error (" << toStageString(ex.stage()) << "): " << ex.what() << "\n";
        const std::string hint = ex.hint();
        if (!hint.empty()) {
            std::cerr << "  -> " << hint << "\n";
        }
        return kExitFailure;
    }

    if (jsonOutput) {
        renderJson(result);
    } else {
        renderText(result);
    }
    return result.interrupted ? kExitInterrupted : kExitOk;
}

} // namespace drvkeep
