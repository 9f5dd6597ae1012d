#include "ini_settings.hpp"

#include "core/utils/logging.hpp"

#include <QFile>
#include <QSettings>

IniSettings::IniSettings(const QString& fileName, const QString& defaultFileName)
    : settings(new QSettings(fileName, QSettings::IniFormat))
{
    if (defaultFileName.isEmpty())
        return;

    if (const QFile file(defaultFileName); file.exists())
        defaultSettings.reset(new QSettings(defaultFileName, QSettings::IniFormat));
    else
        qCWarning(lcConfig) << "Default configuration file" << defaultFileName << "is missing";
}

IniSettings::~IniSettings() = default;

QVariant IniSettings::get(const QString& key) const
{
    if (settings->contains(key))
        return settings->value(key);

    if (!defaultSettings.isNull() && defaultSettings->contains(key))
    {
        qCDebug(lcConfig) << "Key" << key << "missing from" << settings->fileName() << "- using default";
        return defaultSettings->value(key);
    }

    return {};
}

void IniSettings::Set(const QString& key, const QVariant& value)
{
    settings->setValue(key, value);
}

bool IniSettings::contains(const QString& key) const
{
    return settings->contains(key) || (!defaultSettings.isNull() && defaultSettings->contains(key));
}

QStringList IniSettings::groups() const
{
    QStringList groups = settings->childGroups();

    if (!defaultSettings.isNull())
    {
        for (const QString& group : defaultSettings->childGroups())
        {
            if (!groups.contains(group))
                groups.append(group);
        }
    }

    return groups;
}

QStringList IniSettings::keysInGroup(const QString& group) const
{
    settings->beginGroup(group);
    QStringList keys = settings->childKeys();
    settings->endGroup();

    if (!defaultSettings.isNull())
    {
        defaultSettings->beginGroup(group);
        for (const QString& key : defaultSettings->childKeys())
        {
            if (!keys.contains(key))
                keys.append(key);
        }
        defaultSettings->endGroup();
    }

    return keys;
}

QString IniSettings::fileName() const
{
    return settings->fileName();
}
