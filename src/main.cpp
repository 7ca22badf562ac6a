#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QMutex>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>

extern "C" {
#include <libavutil/log.h>
}

#include "core/Settings.h"
#include "core/audio/AudioInspector.h"
#include "core/conversion/ConversionController.h"

static std::atomic<bool> s_interruptRequested{false};

// SIGINT: only flips a flag, the event loop turns it into a cancel request
static void interruptHandler(int sig)
{
    (void)sig;
    s_interruptRequested.store(true);
}

// ── Logging ──────────────────────────────────────────────────────────
static QFile s_logFile;

static void installLogHandler(const QString& logPath, bool verbose)
{
    if (!logPath.isEmpty()) {
        s_logFile.setFileName(logPath);
        if (!s_logFile.open(QIODevice::WriteOnly | QIODevice::Append))
            fprintf(stderr, "Cannot open log file %s\n", qPrintable(logPath));
    }

    static bool s_verbose = false;
    s_verbose = verbose;

    qInstallMessageHandler([](QtMsgType type, const QMessageLogContext&, const QString& msg) {
        static QMutex mtx;
        QMutexLocker lock(&mtx);
        QString line = QStringLiteral("[%1] %2\n")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")), msg);
        QByteArray utf8 = line.toUtf8();
        if (s_logFile.isOpen()) {
            s_logFile.write(utf8);
            s_logFile.flush();
        }
        if (s_verbose || type != QtDebugMsg)
            fprintf(stderr, "%s", utf8.constData());
    });
}

static int runInspect(const QString& path)
{
    ConversionError error;
    auto descriptor = AudioInspector::inspect(path, &error);
    if (!descriptor) {
        fprintf(stderr, "Error reading audio info: %s\n", qPrintable(error.message));
        return 1;
    }
    printf("%s\n", qPrintable(AudioInspector::summary(*descriptor)));
    return 0;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("MonoConverter");
    app.setApplicationName("monoconvert");
    app.setApplicationVersion(APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Convert an audio file to a mono 16-bit PCM WAV next to it."));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption inspectOption(QStringLiteral("inspect"),
        QStringLiteral("Print channel count, sample rate, bit depth and duration, then exit."));
    QCommandLineOption suffixOption(QStringLiteral("suffix"),
        QStringLiteral("Output file name suffix (default from settings, \"_mono\")."),
        QStringLiteral("suffix"));
    QCommandLineOption intervalOption(QStringLiteral("progress-interval"),
        QStringLiteral("Packets between progress reports."), QStringLiteral("packets"));
    QCommandLineOption logOption(QStringLiteral("log-file"),
        QStringLiteral("Append log output to this file."), QStringLiteral("path"));
    QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Print debug log lines to stderr."));
    parser.addOptions({inspectOption, suffixOption, intervalOption, logOption, verboseOption});
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("Input audio file."));
    parser.process(app);

    auto* settings = Settings::instance();
    const QString logPath = parser.isSet(logOption) ? parser.value(logOption)
                                                    : settings->logFile();
    installLogHandler(logPath, parser.isSet(verboseOption));
    av_log_set_level(AV_LOG_ERROR);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1)
        parser.showHelp(1);
    const QString inputPath = args.first();

    qDebug() << "=== monoconvert" << APP_VERSION << "===" << "PID:"
             << QCoreApplication::applicationPid();

    if (parser.isSet(inspectOption))
        return runInspect(inputPath);

    ConversionJob::Options options = ConversionJob::defaultOptions();
    if (parser.isSet(suffixOption))
        options.outputSuffix = parser.value(suffixOption);
    if (parser.isSet(intervalOption)) {
        bool ok = false;
        int packets = parser.value(intervalOption).toInt(&ok);
        if (!ok || packets < 1) {
            fprintf(stderr, "Invalid --progress-interval: %s\n",
                    qPrintable(parser.value(intervalOption)));
            return 1;
        }
        options.progressInterval = packets;
    }

    ConversionController controller;
    int exitCode = 1;

    QObject::connect(&controller, &ConversionController::conversionProgress,
                     [](const QString& message, double) {
        printf("%s\n", qPrintable(message));
        fflush(stdout);
    });
    QObject::connect(&controller, &ConversionController::conversionFinished,
                     &app, [&exitCode](const ConversionResult& result) {
        if (result.success) {
            printf("Converted to mono: %s\n", qPrintable(result.outputPath));
            exitCode = 0;
        } else {
            fprintf(stderr, "Error: %s\n", qPrintable(result.error.message));
            exitCode = result.error.kind == ConversionError::Cancelled ? 130 : 1;
        }
        QCoreApplication::quit();
    });

    std::signal(SIGINT, interruptHandler);
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &controller, [&controller]() {
        if (s_interruptRequested.exchange(false))
            controller.cancelConversion();
    });
    interruptPoll.start(100);

    if (!controller.startConversion(inputPath, options))
        return 1;

    app.exec();
    return exitCode;
}
