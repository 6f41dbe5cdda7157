
#include "Util/Environment.h"

#include <QByteArray>

/**
 * @brief Get an environment variable's value.
 *
 * @param name The name of the environment variable to retrieve.
 * @return The value of the environment variable, or QString() if it is not set.
 */
QString GetEnvironmentVariable(const char *name) {
	const QByteArray value = qgetenv(name);
	if (value.isNull()) {
		return QString();
	}

	return QString::fromLocal8Bit(value);
}
