#pragma once

#include <QObject>
#include <QMutex>
#include <QString>
#include <atomic>
#include "../audio/ConversionError.h"

class AudioDecoder;
class WaveWriter;

// One file-to-mono conversion. All job state (cancel flag, byte counter,
// state machine) lives here, so a handle only ever affects its own run.
//
// run() executes synchronously on the calling thread, normally a pool
// thread. Notifications are queued to the thread this object lives in:
// progress is coalesced (only the most recent pending message is
// delivered), finished() is always delivered exactly once.
class ConversionJob : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Opening,
        Probing,
        Decoding,
        Finalizing,
        Succeeded,
        Failed,
        Cancelled
    };
    Q_ENUM(State)

    struct Options {
        QString outputSuffix = QStringLiteral("_mono");
        int     progressInterval = 100;
        bool    removePartialOnFailure = false;
    };

    explicit ConversionJob(const QString& inputPath, const Options& options,
                           QObject* parent = nullptr);
    ~ConversionJob() override;

    // Options populated from Settings
    static Options defaultOptions();

    // <dir>/<base><suffix>.wav; never equal to inputPath for a non-empty suffix
    static QString outputPathFor(const QString& inputPath, const QString& suffix);

    QString inputPath() const { return m_inputPath; }
    QString outputPath() const { return m_outputPath; }

    State state() const { return m_state.load(std::memory_order_acquire); }
    bool isFinished() const;

    quint64 bytesRead() const { return m_bytesRead.load(std::memory_order_relaxed); }
    quint64 totalBytes() const { return m_totalBytes.load(std::memory_order_relaxed); }
    int packetCount() const { return m_packetCount.load(std::memory_order_relaxed); }

    // Safe from any thread; takes effect at the next packet boundary.
    void requestCancel();
    bool isCancelRequested() const { return m_cancelRequested.load(std::memory_order_acquire); }

    ConversionResult run();

    static QString stateName(State state);

signals:
    void progressChanged(const QString& message, double percent);
    void finished(const ConversionResult& result);

private:
    void setState(State state);
    bool drainDecoder(AudioDecoder& decoder, WaveWriter& writer, ConversionError* error);
    void postProgress(const QString& message, double percent);
    void postFinished(const ConversionResult& result);

    const QString m_inputPath;
    const QString m_outputPath;
    const Options m_options;

    std::atomic<bool>    m_cancelRequested{false};
    std::atomic<quint64> m_bytesRead{0};
    std::atomic<quint64> m_totalBytes{0};
    std::atomic<int>     m_packetCount{0};
    std::atomic<State>   m_state{State::Idle};

    // Latest undelivered progress message
    QMutex  m_progressMutex;
    QString m_pendingMessage;
    double  m_pendingPercent = -1.0;
    bool    m_progressQueued = false;
};
