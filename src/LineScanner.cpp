
#include "LineScanner.h"

#include <QByteArray>
#include <QIODevice>

#include <gsl/gsl_util>

/**
 * @brief Constructs a scanner over an open, readable device.
 *
 * @param device The device to read. It is not owned by the scanner.
 */
LineScanner::LineScanner(QIODevice *device)
	: device_(device) {
}

/**
 * @brief Reads the next line.
 *
 * @return The line without its "\n" or "\r\n" terminator, or an empty
 * optional at the end of the input.
 */
std::optional<std::string> LineScanner::nextLine() {

	const QByteArray line = device_->readLine();
	if (line.isEmpty()) {
		return {};
	}

	auto length = line.size();
	if (line.endsWith('\n')) {
		--length;
		if (length > 0 && line[length - 1] == '\r') {
			--length;
		}
	}

	++lineNumber_;
	return std::string(line.constData(), gsl::narrow_cast<size_t>(length));
}

/**
 * @brief Returns the 1-based number of the line last returned by nextLine.
 */
size_t LineScanner::lineNumber() const noexcept {
	return lineNumber_;
}
