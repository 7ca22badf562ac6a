#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // ── Conversion ───────────────────────────────────────────────────
    // Appended to the input's base name: "song.flac" -> "song_mono.wav"
    QString outputSuffix() const;
    void setOutputSuffix(const QString& suffix);

    // Packets between two progress notifications
    int progressInterval() const;
    void setProgressInterval(int packets);

    // Delete the partial output when a job fails for a reason other than
    // cancellation (cancelled jobs always clean up)
    bool removePartialOnFailure() const;
    void setRemovePartialOnFailure(bool enabled);

    // ── General ──────────────────────────────────────────────────────
    QString logFile() const;
    void setLogFile(const QString& path);

    // Drop every stored value, falling back to defaults
    void resetToDefaults();

    static QString settingsPath();

    static constexpr int kDefaultProgressInterval = 100;

signals:
    void conversionSettingsChanged();

private:
    explicit Settings(QObject* parent = nullptr);
    QSettings m_settings;
};
