#pragma once

#include <QFuture>
#include <QObject>
#include <QSharedPointer>
#include <optional>
#include "ConversionJob.h"
#include "../audio/AudioFormat.h"

// Entry point for hosts (console, GUI). Owns at most one running job and
// relays its notifications on the thread the controller lives in.
class ConversionController : public QObject {
    Q_OBJECT

public:
    explicit ConversionController(QObject* parent = nullptr);
    ~ConversionController() override;

    // Returns immediately. Null when another job is still running.
    QSharedPointer<ConversionJob> startConversion(const QString& inputPath);
    QSharedPointer<ConversionJob> startConversion(const QString& inputPath,
                                                  const ConversionJob::Options& options);

    // Idempotent; no effect when idle.
    void cancelConversion();

    bool isBusy() const { return !m_activeJob.isNull(); }
    QSharedPointer<ConversionJob> activeJob() const { return m_activeJob; }

    std::optional<AudioTrackDescriptor> inspectAudio(const QString& inputPath,
                                                     ConversionError* error = nullptr) const;

signals:
    void conversionStarted(const QString& inputPath, const QString& outputPath);
    void conversionProgress(const QString& message, double percent);
    void conversionFinished(const ConversionResult& result);

private:
    QSharedPointer<ConversionJob> m_activeJob;
    QFuture<void> m_future;
};
