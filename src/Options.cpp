
#include "Options.h"
#include "Util/Raise.h"

#include <QtGlobal>

#include <cstdarg>
#include <cstdio>

const char CommandLineHelp[] =
	"Usage: regrep [-E|-e pattern] [-i] [-v] [-n] [-c] [-l] [-o] [-q] [-r] [-H|-h]\n"
	"              [--color[=WHEN]] [--dump] [-V|--version] [--help] [--]\n"
	"              [pattern] [file...]\n"
	"\n"
	"  -E, -e PATTERN  use PATTERN as the regular expression\n"
	"  -i              ignore case distinctions in literals and classes\n"
	"  -v              select non-matching lines\n"
	"  -n              prefix each line with its line number\n"
	"  -c              print only a count of selected lines per file\n"
	"  -l              print only the names of files with selected lines\n"
	"  -o              print only the matched parts of a line\n"
	"  -q              print nothing, stop at the first selected line\n"
	"  -r              search directories recursively\n"
	"  -H, -h          always or never print file names\n"
	"  --color[=WHEN]  highlight matches; WHEN is always, never or auto\n"
	"  --dump          print the parsed pattern and compiled program\n"
	"  -V, --version   print version information\n"
	"      --help      print this help\n";

namespace {

/**
 * @brief Applies one single letter flag that takes no argument.
 *
 * @return `false` if `flag` is not such a flag.
 */
bool ApplyFlag(Options &options, QChar flag) {
	switch (flag.toLatin1()) {
	case 'i':
		options.ignoreCase = true;
		return true;
	case 'v':
		options.invert = true;
		return true;
	case 'n':
		options.lineNumbers = true;
		return true;
	case 'c':
		options.count = true;
		return true;
	case 'l':
		options.filesWithMatches = true;
		return true;
	case 'o':
		options.onlyMatching = true;
		return true;
	case 'q':
		options.quiet = true;
		return true;
	case 'r':
		options.recursive = true;
		return true;
	case 'H':
		options.withFileName = true;
		return true;
	case 'h':
		options.withFileName = false;
		return true;
	case 'V':
		options.version = true;
		return true;
	default:
		return false;
	}
}

/**
 * @brief Gets the index of the next argument parameter.
 *
 * @param args The command line arguments.
 * @param argIndex The current argument index.
 * @return The next argument index.
 */
int getArgumentParameter(const QStringList &args, int argIndex) {
	if (argIndex + 1 >= args.size()) {
		Raise<UsageError>("%s requires an argument", qPrintable(args[argIndex]));
	}

	return ++argIndex;
}

}

/**
 * @brief UsageError constructor.
 *
 * @param fmt Format string for the error message.
 * @param ... Variable arguments for the format string.
 */
UsageError::UsageError(const char *fmt, ...) {
	char buf[1024];
	va_list ap;
	va_start(ap, fmt);
	QT_WARNING_PUSH
	QT_WARNING_DISABLE_GCC("-Wformat-nonliteral")
	QT_WARNING_DISABLE_CLANG("-Wformat-nonliteral")
	vsnprintf(buf, sizeof(buf), fmt, ap);
	QT_WARNING_POP
	va_end(ap);
	error_ = buf;
}

const char *UsageError::what() const noexcept {
	return error_.c_str();
}

/*----------------------------------------------------------------------*
 * ParseArguments
 *
 * Interprets the command line, not including the program name. Single
 * letter flags may be grouped ("-in"). Within a group, -e and -E take the
 * rest of the group as the pattern, or the next argument if nothing
 * follows them. Without -e/-E the first operand is the pattern.
 *
 * Throws UsageError on an unknown option or a missing pattern.
 *----------------------------------------------------------------------*/
Options ParseArguments(const QStringList &args) {

	Options options;
	bool havePattern = false;
	bool opts        = true;

	for (int i = 0; i < args.size(); ++i) {
		const QString &arg = args[i];

		if (opts && arg == QLatin1String("--")) {
			opts = false;
		} else if (opts && arg == QLatin1String("--help")) {
			options.help = true;
		} else if (opts && arg == QLatin1String("--version")) {
			options.version = true;
		} else if (opts && arg == QLatin1String("--dump")) {
			options.dump = true;
		} else if (opts && arg == QLatin1String("--color")) {
			options.color = ColorMode::Auto;
		} else if (opts && arg.startsWith(QLatin1String("--color="))) {
			const QString when = arg.mid(8);

			bool ok;
			options.color = ColorModeFromString(when, &ok);
			if (!ok) {
				Raise<UsageError>("invalid argument '%s' for --color", qPrintable(when));
			}
		} else if (opts && arg.startsWith(QLatin1String("--"))) {
			Raise<UsageError>("unrecognized option '%s'", qPrintable(arg));
		} else if (opts && arg.size() > 1 && arg.startsWith(QLatin1Char('-'))) {
			for (int j = 1; j < arg.size(); ++j) {
				const QChar flag = arg[j];

				if (flag == QLatin1Char('e') || flag == QLatin1Char('E')) {
					if (j + 1 < arg.size()) {
						options.pattern = arg.mid(j + 1);
					} else {
						i               = getArgumentParameter(args, i);
						options.pattern = args[i];
					}
					havePattern = true;
					break;
				}

				if (!ApplyFlag(options, flag)) {
					Raise<UsageError>("invalid option -- '%c'", flag.toLatin1());
				}
			}
		} else if (!havePattern) {
			options.pattern = arg;
			havePattern     = true;
		} else {
			options.files.push_back(arg);
		}
	}

	if (!havePattern && !options.help && !options.version) {
		Raise<UsageError>("no pattern given");
	}

	return options;
}
