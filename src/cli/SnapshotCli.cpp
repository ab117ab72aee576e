#include "cli/SnapshotCli.hpp"

#include <iostream>
#include <memory>
#include <utility>

#include <QCommandLineOption>
#include <QCommandLineParser>

#include "collector/manager_detector.hpp"
#include "collector/snapshot_pipeline.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace pkgsnap {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage: pkgsnap [options] [filename]\n"
        "\n"
        "Record the packages installed on this host, with host metadata.\n"
        "\n"
        "Options:\n"
        "  --help        Show this help message and exit.\n"
        "  --json        Save output in JSON format.\n"
        "  --gzip        Compress the output file using gzip.\n"
        "  --detailed    Include package descriptions and dependencies.\n"
        "  --test        Show what would be written without writing files.\n"
        "  --no-validate Skip re-reading the written file.\n"
        "  --trace       Enable verbose trace logging.\n"
        "  [filename]    Output file name. Defaults to\n"
        "                packages_<YYYY-MM-DD_HH-MM-SS>.<ext>.\n");
}

std::unique_ptr<ManagerDetector> makeDetector(const RunConfig &config)
{
    if (config.forcedManager.has_value()) {
        return std::make_unique<FixedManagerDetector>(*config.forcedManager);
    }
    return std::make_unique<HostManagerDetector>();
}

void printTestReport(const PipelineResult &result, const PipelineOptions &options)
{
    std::cout << "Test mode: no files will be written.\n";
    std::cout << "Package manager: " << toKindString(result.packageManager) << "\n";
    std::cout << "Packages found: " << result.packageCount << "\n";
    std::cout << "Output file: " << result.outputPath.toStdString() << "\n";
    std::cout << "Format: " << toFormatString(options.format)
              << (options.compressed ? " (gzip)" : "") << "\n";
    std::cout << "Detailed: " << (options.detailed ? "yes" : "no") << "\n\n";
    std::cout << "Preview:\n" << result.preview;
    std::cout.flush();
}

} // namespace

SnapshotCli::SnapshotCli(RunConfig config)
    : m_config(std::move(config))
{
}

void SnapshotCli::setCommandRunner(CommandRunner *runner)
{
    m_runner = runner;
}

int SnapshotCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    if (args.isEmpty()) {
        args.push_back(QStringLiteral("pkgsnap"));
    }

    return runSnapshot(args);
}

bool SnapshotCli::requestsTestMode(const QStringList &args)
{
    for (const QString &arg : args) {
        if (arg == QStringLiteral("--")) {
            break;
        }
        if (arg == QStringLiteral("--test") || arg == QStringLiteral("-test")) {
            return true;
        }
    }
    return false;
}

int SnapshotCli::runSnapshot(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    const QCommandLineOption helpOption(QStringList() << "help" << "h");
    const QCommandLineOption jsonOption(QStringList() << "json");
    const QCommandLineOption gzipOption(QStringList() << "gzip");
    const QCommandLineOption detailedOption(QStringList() << "detailed");
    const QCommandLineOption testOption(QStringList() << "test");
    const QCommandLineOption noValidateOption(QStringList() << "no-validate");
    parser.addOptions({helpOption, jsonOption, gzipOption, detailedOption, testOption,
                       noValidateOption});
    parser.addPositionalArgument(QStringLiteral("filename"),
                                 QStringLiteral("Output file name."),
                                 QStringLiteral("[filename]"));

    if (!parser.parse(args)) {
        std::cerr << "Error: " << parser.errorText().toStdString() << std::endl;
        return 1;
    }

    if (parser.isSet(helpOption)) {
        std::cout << usageText().toStdString();
        return 0;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        std::cerr << "Error: Only one filename can be specified." << std::endl;
        return 1;
    }

    PipelineOptions options;
    options.format = parser.isSet(jsonOption) ? OutputFormat::Json : OutputFormat::Text;
    options.compressed = parser.isSet(gzipOption);
    options.detailed = parser.isSet(detailedOption);
    options.dryRun = parser.isSet(testOption);
    options.validate = !parser.isSet(noValidateOption);
    options.outputPath = positional.isEmpty() ? QString() : positional.front();

    if (options.dryRun) {
        logging::setFileLoggingEnabled(false);
    }

    PKGSNAP_LOG_INFO(QStringLiteral("SnapshotCli"),
                     QStringLiteral("runSnapshot"),
                     QStringLiteral("snapshot_cli_start"),
                     QStringLiteral("user_invocation"),
                     QStringLiteral("cli"),
                     pkgsnap::logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"format", toFormatString(options.format)},
                                    {"compressed", options.compressed},
                                    {"detailed", options.detailed},
                                    {"dryRun", options.dryRun},
                                    {"commandTimeoutMs", m_config.commandTimeout.count()}});

    std::unique_ptr<ProcessCommandRunner> ownedRunner;
    CommandRunner *runner = m_runner;
    if (!runner) {
        ownedRunner = std::make_unique<ProcessCommandRunner>(m_config.commandTimeout);
        runner = ownedRunner.get();
    }
    const std::unique_ptr<ManagerDetector> detector = makeDetector(m_config);

    bool progressShown = false;
    const ProgressCallback progress = [&progressShown](std::size_t processed,
                                                       std::size_t total) {
        progressShown = true;
        std::cerr << "\rFetching details: " << processed << "/" << total << std::flush;
    };

    try {
        const SnapshotPipeline pipeline(*detector, *runner);
        const PipelineResult result = pipeline.run(options, progress);
        if (progressShown) {
            std::cerr << std::endl;
        }

        if (options.dryRun) {
            printTestReport(result, options);
            return 0;
        }

        if (options.validate && !result.validated) {
            std::cerr << "Error: Validation failed for "
                      << result.outputPath.toStdString() << std::endl;
            return 1;
        }

        std::cout << "Successfully saved package list to "
                  << result.outputPath.toStdString() << std::endl;
        return 0;
    } catch (const SnapshotError &ex) {
        if (progressShown) {
            std::cerr << std::endl;
        }
        PKGSNAP_LOG_ERROR(QStringLiteral("SnapshotCli"),
                          QStringLiteral("runSnapshot"),
                          QStringLiteral("snapshot_run_failed"),
                          QStringLiteral("user_invocation"),
                          QStringLiteral("cli"),
                          pkgsnap::logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"error", ex.what()}});
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        if (progressShown) {
            std::cerr << std::endl;
        }
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

} // namespace pkgsnap
