#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <cstdio>
#include "AppConstants.h"
#include "ExportConfig.h"
#include "ExportEstimator.h"
#include "ExportPaths.h"
#include "ExportRequestIO.h"
#include "ExportService.h"

namespace {

void printJson(FILE* stream, const QJsonObject& obj) {
    const QByteArray line = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    fprintf(stream, "%s\n", line.constData());
    fflush(stream);
}

int failWith(const ExportError& error) {
    printJson(stdout, ExportRequestIO::resultToJson(ExportResult::failed(error)));
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Exports a multi-clip timeline to a single MP4 file.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("request", "Export request JSON file.");

    QCommandLineOption configOption({"c", "config"}, "Load settings from a JSON config file.", "file");
    QCommandLineOption ffmpegOption("ffmpeg", "Path to the ffmpeg executable.", "path");
    QCommandLineOption scratchOption("scratch-dir", "Directory for temporary files.", "dir");
    QCommandLineOption timeoutOption("timeout", "Per-invocation tool timeout in milliseconds.", "ms");
    QCommandLineOption estimateOption("estimate", "Print the time and size estimate and exit.");
    QCommandLineOption overwriteOption("overwrite", "Replace the output file if it exists.");
    QCommandLineOption cleanupOption("cleanup-stale", "Remove leftovers of crashed exports from the scratch directory first.");
    QCommandLineOption quietOption({"q", "quiet"}, "Do not print progress events.");
    parser.addOptions({configOption, ffmpegOption, scratchOption, timeoutOption,
                       estimateOption, overwriteOption, cleanupOption, quietOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(2);
    }

    ExportConfig config = ExportConfig::defaults();
    if (parser.isSet(configOption)) {
        QString error;
        if (!ExportConfig::load(parser.value(configOption), config, &error)) {
            return failWith(ExportError::io(error));
        }
    }
    if (parser.isSet(ffmpegOption)) config.ffmpegPath = parser.value(ffmpegOption);
    if (parser.isSet(scratchOption)) config.scratchDir = parser.value(scratchOption);
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        const int ms = parser.value(timeoutOption).toInt(&ok);
        if (!ok) {
            return failWith(ExportError::validation(
                QString("Invalid timeout '%1'").arg(parser.value(timeoutOption))));
        }
        config.toolTimeoutMs = ms;
    }

    ExportRequest request;
    QString error;
    if (!ExportRequestIO::loadRequest(positional.first(), request, &error)) {
        return failWith(ExportError::validation(error));
    }

    if (parser.isSet(estimateOption)) {
        printJson(stdout, ExportRequestIO::estimateToJson(
                              ExportEstimator::estimate(request.clips, request.settings)));
        return 0;
    }

    const QString outputPath = ExportPaths::buildOutputPath(request.outputDir, request.filename);
    if (!parser.isSet(overwriteOption)) {
        const QStringList problems = ExportPaths::validateOutputPath(outputPath);
        if (!problems.isEmpty()) {
            return failWith(ExportError::validation(problems.join("; ")));
        }
    }

    if (parser.isSet(cleanupOption)) {
        ExportPaths::cleanupStaleScratchFiles(config.scratchDir,
                                              ExportPaths::staleScratchAge(config.toolTimeoutMs));
    }

    ExportService service(config);
    if (!parser.isSet(quietOption)) {
        QObject::connect(&service, &ExportService::progress, &service,
                         [](const QString&, const ExportProgress& p) {
                             printJson(stderr, ExportRequestIO::progressToJson(p));
                         },
                         Qt::DirectConnection);
    }

    const QString jobId = service.startExport(request);
    service.waitForFinished(jobId);

    const std::optional<ExportResult> result = service.result(jobId);
    if (!result) {
        return failWith(ExportError::io("Export finished without a result"));
    }
    printJson(stdout, ExportRequestIO::resultToJson(*result));
    return result->success ? 0 : 1;
}
