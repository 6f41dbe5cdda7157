
#ifndef OPTIONS_H_
#define OPTIONS_H_

#include "ColorMode.h"

#include <QString>
#include <QStringList>

#include <exception>
#include <optional>
#include <string>

struct Options {
	QString pattern;
	QStringList files;

	bool ignoreCase       = false;
	bool invert           = false;
	bool lineNumbers      = false;
	bool count            = false;
	bool filesWithMatches = false;
	bool onlyMatching     = false;
	bool quiet            = false;
	bool recursive        = false;
	bool dump             = false;
	bool version          = false;
	bool help             = false;

	std::optional<bool> withFileName; // -H or -h, otherwise decided by the file count
	std::optional<ColorMode> color;   // --color, otherwise the configured mode
};

class UsageError final : public std::exception {
public:
	explicit UsageError(const char *fmt, ...);

public:
	const char *what() const noexcept override;

private:
	std::string error_;
};

Options ParseArguments(const QStringList &args);

extern const char CommandLineHelp[];

#endif
