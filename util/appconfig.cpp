#include "appconfig.h"
#include "namingpattern.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

const QString AppConfig::DEFAULT_MERGE_FILE_NAME = QStringLiteral("merged.pdf");

AppConfig::AppConfig()
    : m_settings(QSettings::IniFormat, QSettings::UserScope,
                 QCoreApplication::organizationName(),
                 QCoreApplication::applicationName())
{
    loadDefaults();
    load();
}

AppConfig::~AppConfig()
{
    save();
}

AppConfig& AppConfig::instance()
{
    static AppConfig instance;
    return instance;
}

void AppConfig::loadDefaults()
{
    // 用户偏好默认值
    m_lastOutputFolder.clear();
    m_lastMergeOutputPath.clear();
    m_debugMode = false;
}

void AppConfig::load()
{
    m_lastOutputFolder = m_settings.value("Split/LastOutputFolder", m_lastOutputFolder).toString();
    m_lastMergeOutputPath = m_settings.value("Merge/LastOutputPath", m_lastMergeOutputPath).toString();
    m_debugMode = m_settings.value("Debug/Enabled", m_debugMode).toBool();
}

void AppConfig::save()
{
    m_settings.setValue("Split/LastOutputFolder", m_lastOutputFolder);
    m_settings.setValue("Merge/LastOutputPath", m_lastMergeOutputPath);
    m_settings.setValue("Debug/Enabled", m_debugMode);

    m_settings.sync();
}

void AppConfig::resetToDefaults()
{
    m_settings.clear();
    loadDefaults();
    save();
}

QString AppConfig::defaultFileNamePattern(const QString& sourcePath) const
{
    QString baseName = QFileInfo(sourcePath).completeBaseName();
    if (baseName.isEmpty()) {
        baseName = QStringLiteral("split");
    }
    return baseName + "_" + NamingPattern::PLACEHOLDER + ".pdf";
}

QString AppConfig::defaultMergeOutputPath(const QString& firstSourcePath) const
{
    QString dirPath = QFileInfo(firstSourcePath).absolutePath();
    return QDir(dirPath).filePath(DEFAULT_MERGE_FILE_NAME);
}

void AppConfig::setLastOutputFolder(const QString& folder)
{
    m_lastOutputFolder = folder;
}

void AppConfig::setLastMergeOutputPath(const QString& path)
{
    m_lastMergeOutputPath = path;
}

void AppConfig::setDebugMode(bool enabled)
{
    m_debugMode = enabled;
}
