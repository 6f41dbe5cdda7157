
#ifndef COLOR_MODE_H_
#define COLOR_MODE_H_

#include <QLatin1String>
#include <QString>
#include <QtDebug>

enum class ColorMode : int {
	Auto   = 0,
	Always = 1,
	Never  = 2,
};

/**
 * @brief Parses a color mode as written in the configuration file or on
 * the command line.
 *
 * @param value One of "auto", "always" or "never".
 * @param ok Set to `false` if `value` is not a valid mode.
 * @return The mode, or ColorMode::Auto if `value` is not valid.
 */
inline ColorMode ColorModeFromString(const QString &value, bool *ok = nullptr) {

	if (ok) {
		*ok = true;
	}

	if (value == QLatin1String("auto")) {
		return ColorMode::Auto;
	}

	if (value == QLatin1String("always")) {
		return ColorMode::Always;
	}

	if (value == QLatin1String("never")) {
		return ColorMode::Never;
	}

	if (ok) {
		*ok = false;
	}

	return ColorMode::Auto;
}

inline QLatin1String ToString(ColorMode mode) {

	switch (mode) {
	case ColorMode::Auto:
		return QLatin1String("auto");
	case ColorMode::Always:
		return QLatin1String("always");
	case ColorMode::Never:
		return QLatin1String("never");
	}

	Q_UNREACHABLE();
}

#endif
