#pragma once

#include "settings.hpp"

#include <QScopedPointer>

class QSettings;
class QString;

//!
//! \brief Settings stored in an INI file, backed by an optional read-only file of defaults.
//! \details Keys missing from the user file are looked up in the defaults file. Writes only ever go to the user file.
//!
class IniSettings final : public Settings
{
public:
    explicit IniSettings(const QString& fileName, const QString& defaultFileName = "");
    ~IniSettings() override;

    [[nodiscard]] QVariant get(const QString& key) const override;
    void Set(const QString& key, const QVariant& value) override;

    [[nodiscard]] bool contains(const QString& key) const override;
    [[nodiscard]] QStringList groups() const override;
    [[nodiscard]] QStringList keysInGroup(const QString& group) const override;
    [[nodiscard]] QString fileName() const override;

private:
    QScopedPointer<QSettings> settings;
    QScopedPointer<QSettings> defaultSettings;
};
