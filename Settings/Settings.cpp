
#include "Settings.h"
#include "Util/Environment.h"

#include <QSettings>
#include <QStandardPaths>
#include <QtDebug>

namespace Settings {

namespace {

const auto DEFAULT_MATCH_COLOR       = QLatin1String("01;31");
const auto DEFAULT_FILE_NAME_COLOR   = QLatin1String("35");
const auto DEFAULT_LINE_NUMBER_COLOR = QLatin1String("32");
const auto DEFAULT_SEPARATOR_COLOR   = QLatin1String("36");

/**
 * @brief Returns the configuration directory.
 *
 * @return The path to the configuration directory.
 *
 * @note If the environment variable `REGREP_HOME` is set,
 * it will be used as the configuration directory.
 */
QString ConfigDirectory() {
	const QString regrep_home = GetEnvironmentVariable("REGREP_HOME");
	if (!regrep_home.isEmpty()) {
		return regrep_home;
	}

	static const QString configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
	static const auto dirname      = QStringLiteral("%1/regrep").arg(configDir);
	return dirname;
}

/**
 * @brief Reads an SGR parameter string, rejecting anything but digits and ';'.
 */
QString ReadSgr(QSettings &settings, const QString &key, const QString &defaultValue) {
	const QString value = settings.value(key, defaultValue).toString();

	for (QChar ch : value) {
		if (!ch.isDigit() && ch != QLatin1Char(';')) {
			qWarning("Invalid value for %s, using the default", qPrintable(key));
			return defaultValue;
		}
	}

	return value;
}

}

ColorMode color;
QString matchColor;
QString fileNameColor;
QString lineNumberColor;
QString separatorColor;
bool lineNumbers;

/**
 * @brief Gets the path of the configuration file.
 *
 * @return The path to the configuration file.
 */
QString ConfigFile() {
	return QStringLiteral("%1/regrep.ini").arg(ConfigDirectory());
}

/**
 * @brief Restores every setting to its built-in default.
 */
void Reset() {
	color           = ColorMode::Auto;
	matchColor      = DEFAULT_MATCH_COLOR;
	fileNameColor   = DEFAULT_FILE_NAME_COLOR;
	lineNumberColor = DEFAULT_LINE_NUMBER_COLOR;
	separatorColor  = DEFAULT_SEPARATOR_COLOR;
	lineNumbers     = false;
}

/**
 * @brief Loads the user preferences from the configuration file.
 * A missing file leaves every setting at its default. Safe to call again
 * after the configuration file changes.
 */
void Load() {

	Reset();

	const QString filename = ConfigFile();
	QSettings settings(filename, QSettings::IniFormat);

	if (settings.status() != QSettings::NoError) {
		qWarning("Could not read %s, using defaults", qPrintable(filename));
		return;
	}

	bool ok;
	const QString mode = settings.value(QLatin1String("regrep.color"), ToString(ColorMode::Auto)).toString();
	color              = ColorModeFromString(mode, &ok);
	if (!ok) {
		qWarning("Invalid value for regrep.color: %s", qPrintable(mode));
	}

	matchColor      = ReadSgr(settings, QLatin1String("regrep.matchColor"), DEFAULT_MATCH_COLOR);
	fileNameColor   = ReadSgr(settings, QLatin1String("regrep.fileNameColor"), DEFAULT_FILE_NAME_COLOR);
	lineNumberColor = ReadSgr(settings, QLatin1String("regrep.lineNumberColor"), DEFAULT_LINE_NUMBER_COLOR);
	separatorColor  = ReadSgr(settings, QLatin1String("regrep.separatorColor"), DEFAULT_SEPARATOR_COLOR);
	lineNumbers     = settings.value(QLatin1String("regrep.lineNumbers"), false).toBool();
}

}
