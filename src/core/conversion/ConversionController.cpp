#include "ConversionController.h"
#include "../audio/AudioInspector.h"

#include <QDebug>
#include <QtConcurrent>

ConversionController::ConversionController(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<ConversionResult>();
}

ConversionController::~ConversionController()
{
    if (m_activeJob)
        m_activeJob->requestCancel();
    m_future.waitForFinished();
}

QSharedPointer<ConversionJob> ConversionController::startConversion(const QString& inputPath)
{
    return startConversion(inputPath, ConversionJob::defaultOptions());
}

QSharedPointer<ConversionJob> ConversionController::startConversion(
    const QString& inputPath, const ConversionJob::Options& options)
{
    if (m_activeJob) {
        qWarning() << "[ConversionController] Busy with" << m_activeJob->inputPath()
                   << "rejecting" << inputPath;
        return {};
    }

    // deleteLater: the last reference may be dropped on a pool thread
    QSharedPointer<ConversionJob> job(new ConversionJob(inputPath, options),
                                      &QObject::deleteLater);

    connect(job.data(), &ConversionJob::progressChanged,
            this, &ConversionController::conversionProgress);

    ConversionJob* raw = job.data();
    connect(raw, &ConversionJob::finished, this, [this, raw](const ConversionResult& result) {
        if (m_activeJob.data() == raw)
            m_activeJob.reset();
        emit conversionFinished(result);
    });

    // The previous task may still be returning after its finished() arrived
    m_future.waitForFinished();

    m_activeJob = job;
    emit conversionStarted(job->inputPath(), job->outputPath());

    m_future = QtConcurrent::run([job]() {
        job->run();
    });
    return job;
}

void ConversionController::cancelConversion()
{
    if (!m_activeJob)
        return;
    qDebug() << "[ConversionController] Cancel requested for" << m_activeJob->inputPath();
    m_activeJob->requestCancel();
}

std::optional<AudioTrackDescriptor> ConversionController::inspectAudio(
    const QString& inputPath, ConversionError* error) const
{
    return AudioInspector::inspect(inputPath, error);
}
