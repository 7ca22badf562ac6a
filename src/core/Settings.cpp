#include "Settings.h"
#include <QDebug>
#include <QDir>
#include <QStandardPaths>

// ── Settings INI path ───────────────────────────────────────────────
// <GenericDataLocation>/MonoConverter/settings.ini
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/MonoConverter"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings(settingsPath(), QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── Conversion ──────────────────────────────────────────────────────
QString Settings::outputSuffix() const
{
    QString suffix = m_settings.value(QStringLiteral("conversion/outputSuffix"),
                                      QStringLiteral("_mono")).toString();
    // An empty suffix would make "x.wav" convert onto itself
    return suffix.isEmpty() ? QStringLiteral("_mono") : suffix;
}

void Settings::setOutputSuffix(const QString& suffix)
{
    m_settings.setValue(QStringLiteral("conversion/outputSuffix"), suffix);
    emit conversionSettingsChanged();
}

int Settings::progressInterval() const
{
    int packets = m_settings.value(QStringLiteral("conversion/progressInterval"),
                                   kDefaultProgressInterval).toInt();
    return qMax(1, packets);
}

void Settings::setProgressInterval(int packets)
{
    m_settings.setValue(QStringLiteral("conversion/progressInterval"), packets);
    emit conversionSettingsChanged();
}

bool Settings::removePartialOnFailure() const
{
    return m_settings.value(QStringLiteral("conversion/removePartialOnFailure"), false).toBool();
}

void Settings::setRemovePartialOnFailure(bool enabled)
{
    m_settings.setValue(QStringLiteral("conversion/removePartialOnFailure"), enabled);
    emit conversionSettingsChanged();
}

// ── General ─────────────────────────────────────────────────────────
QString Settings::logFile() const
{
    return m_settings.value(QStringLiteral("general/logFile")).toString();
}

void Settings::setLogFile(const QString& path)
{
    m_settings.setValue(QStringLiteral("general/logFile"), path);
}

void Settings::resetToDefaults()
{
    m_settings.clear();
    emit conversionSettingsChanged();
}
