// opencopy: copies files with progress, native bulk copy when available and
// cooperative cancellation on SIGINT/SIGTERM.
#include "CopySettings.hpp"
#include "TaskPlanner.hpp"
#include "TerminalRenderer.hpp"
#include "opencopy/CancellationToken.hpp"
#include "opencopy/CopyOrchestrator.hpp"
#include "opencopy/RuntimeLogging.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include <csignal>
#include <cstdio>
#include <unistd.h>
Q_LOGGING_CATEGORY(ocCli, "opencopy.cli")

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitPartial = 2;
constexpr int kExitCancelled = 130;

opencopy::CancellationToken* g_cancel = nullptr;

extern "C" void onInterrupt(int) {
    if (g_cancel)
        g_cancel->request();
}

void installInterruptHandlers(opencopy::CancellationToken& token) {
    g_cancel = &token;
    struct sigaction sa {};
    sa.sa_handler = onInterrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0)
        qCWarning(ocCli) << "Could not install SIGINT handler";
    if (::sigaction(SIGTERM, &sa, nullptr) != 0)
        qCWarning(ocCli) << "Could not install SIGTERM handler";
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("OpenCopy"));
    QCoreApplication::setApplicationName(QStringLiteral("OpenCopy"));
    QCoreApplication::setApplicationVersion(QStringLiteral(OPENCOPY_VERSION));

    const opencopy::DebugLogging debugLogging = opencopy::debugLoggingFromEnv();
    if (debugLogging.enabled())
        QLoggingCategory::setFilterRules(
            QString::fromStdString(debugLogging.filterRules()));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Copy files with progress and safe cancellation."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("sources"),
                                 QStringLiteral("Files or folders to copy."),
                                 QStringLiteral("<source>..."));
    parser.addPositionalArgument(QStringLiteral("destination"),
                                 QStringLiteral("Target file or folder."));
    const QCommandLineOption forceOpt(
        {QStringLiteral("f"), QStringLiteral("force")},
        QStringLiteral("Overwrite existing destination files."));
    const QCommandLineOption recurseOpt(
        {QStringLiteral("r"), QStringLiteral("recurse")},
        QStringLiteral("Copy folders recursively."));
    const QCommandLineOption streamedOpt(
        QStringLiteral("streamed"),
        QStringLiteral("Use the buffered copy loop instead of the native primitive."));
    const QCommandLineOption nativeOpt(
        QStringLiteral("native"),
        QStringLiteral("Prefer the native copy primitive (default)."));
    const QCommandLineOption passthruOpt(
        QStringLiteral("passthru"),
        QStringLiteral("Print each copied destination file to stdout."));
    const QCommandLineOption includeOpt(
        QStringLiteral("include"),
        QStringLiteral("Only copy file names matching <pattern> (repeatable)."),
        QStringLiteral("pattern"));
    const QCommandLineOption excludeOpt(
        QStringLiteral("exclude"),
        QStringLiteral("Skip file names matching <pattern> (repeatable)."),
        QStringLiteral("pattern"));
    const QCommandLineOption bufferOpt(
        QStringLiteral("buffer-kib"),
        QStringLiteral("Streamed copy buffer size in KiB."),
        QStringLiteral("n"));
    const QCommandLineOption quietOpt(
        {QStringLiteral("q"), QStringLiteral("quiet")},
        QStringLiteral("Do not draw progress."));
    const QCommandLineOption saveOpt(
        QStringLiteral("save-defaults"),
        QStringLiteral("Store the effective options as new defaults."));
    parser.addOptions({forceOpt, recurseOpt, streamedOpt, nativeOpt,
                       passthruOpt, includeOpt, excludeOpt, bufferOpt,
                       quietOpt, saveOpt});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() < 2) {
        qCCritical(ocCli) << "Expected at least one source and a destination";
        parser.showHelp(kExitFatal);
    }

    QSettings settings;
    opencopy::CopyOptions opt = CopySettings::load(settings);
    if (parser.isSet(forceOpt))
        opt.overwrite = true;
    if (parser.isSet(streamedOpt))
        opt.backend = opencopy::BackendPreference::Streamed;
    if (parser.isSet(nativeOpt))
        opt.backend = opencopy::BackendPreference::Native;
    opt.passthrough = parser.isSet(passthruOpt);
    if (parser.isSet(bufferOpt)) {
        bool ok = false;
        const int kib = parser.value(bufferOpt).toInt(&ok);
        if (!ok || kib <= 0) {
            qCCritical(ocCli) << "Invalid --buffer-kib value"
                              << parser.value(bufferOpt);
            return kExitFatal;
        }
        opt.bufferSize = std::size_t(kib) * 1024;
    }
    if (parser.isSet(saveOpt))
        CopySettings::store(settings, opt);

    PlanOptions planOpt;
    planOpt.recurse = parser.isSet(recurseOpt);
    planOpt.include = parser.values(includeOpt);
    planOpt.exclude = parser.values(excludeOpt);

    QStringList sources = args;
    const QString destination = sources.takeLast();
    std::vector<opencopy::FileTask> tasks;
    QStringList skipped;
    QString planErr;
    if (!TaskPlanner(planOpt).plan(sources, destination, tasks, skipped,
                                   planErr)) {
        qCCritical(ocCli).noquote() << planErr;
        return kExitFatal;
    }
    for (const QString& s : skipped)
        qCInfo(ocCli).noquote() << "Not copied (filtered or folder without -r):"
                                << s;

    opencopy::CancellationToken cancel;
    installInterruptHandlers(cancel);

    TerminalRenderer renderer(::isatty(STDERR_FILENO) == 1,
                              parser.isSet(quietOpt));
    opencopy::CopyOrchestrator orchestrator(opt, cancel, &renderer, &renderer);

    opencopy::CopyReport report;
    std::string err;
    const bool ok = orchestrator.run(tasks, report, err);
    g_cancel = nullptr;
    if (!ok) {
        qCCritical(ocCli).noquote() << QString::fromStdString(err);
        return kExitFatal;
    }

    if (opt.passthrough) {
        QTextStream out(stdout, QIODevice::WriteOnly);
        for (const opencopy::CopiedFile& f : report.copiedFiles)
            out << QString::fromStdString(f.path) << '\n';
    }

    if (report.cancelled)
        return kExitCancelled;
    if (report.filesFailed > 0)
        return kExitPartial;
    return kExitOk;
}
