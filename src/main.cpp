
#include "Decompile.h"
#include "Grep.h"
#include "Options.h"
#include "Regex.h"
#include "Settings.h"
#include "Util/System.h"
#include "Util/version.h"

#include <QCoreApplication>
#include <QFile>
#include <QStringList>
#include <QtDebug>

#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

namespace {

/**
 * @brief Writes `text` and a newline to stdout, including any embedded NUL bytes.
 */
void PrintLine(const std::string &text) {
	fwrite(text.data(), 1, text.size(), stdout);
	fputc('\n', stdout);
}

/**
 * @brief Custom message handler for Qt logging.
 *
 * @param type The type of the message (debug, warning, info, critical, fatal).
 * @param context The context of the message, including file, function, and line number.
 * @param msg The message to log.
 */
void MessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg) {

	Q_UNUSED(context);

	switch (type) {
	case QtDebugMsg:
#ifndef NDEBUG
		fprintf(stderr, "regrep: debug: %s\n", qPrintable(msg));
#endif
		break;
	case QtInfoMsg:
	case QtWarningMsg:
	case QtCriticalMsg:
		fprintf(stderr, "regrep: %s\n", qPrintable(msg));
		break;
	case QtFatalMsg:
		fprintf(stderr, "regrep: %s\n", qPrintable(msg));
		abort();
	}
}

QString CreateInfoString() {

	return QStringLiteral("regrep version %1.%2\n"
						  "\n"
						  "     Built on: %3, %4, %5\n"
						  "      With Qt: %6\n"
						  "   Running Qt: %7\n")
		.arg(QString::number(REGREP_VERSION_MAJ),
			 QString::number(REGREP_VERSION_REV),
			 BuildOperatingSystem(),
			 BuildArchitecture(),
			 BuildCompiler(),
			 QLatin1String(QT_VERSION_STR),
			 QString::fromLatin1(qVersion()));
}

/**
 * @brief Decides whether matches are coloured.
 */
bool UseColor(ColorMode mode) {
	switch (mode) {
	case ColorMode::Always:
		return true;
	case ColorMode::Never:
		return false;
	case ColorMode::Auto:
#ifdef Q_OS_UNIX
		return isatty(STDOUT_FILENO) != 0 && qgetenv("TERM") != "dumb";
#else
		return false;
#endif
	}

	return false;
}

}

/**
 * @brief Main entry point for regrep.
 *
 * @param argc The number of command line arguments.
 * @param argv The command line arguments as an array of strings.
 * @return 0 if a line was selected, 1 if none was, 2 on error.
 */
int main(int argc, char *argv[]) {

	qInstallMessageHandler(MessageHandler);

	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("regrep"));

	Settings::Load();

	Options options;
	try {
		options = ParseArguments(QCoreApplication::arguments().mid(1));
	} catch (const UsageError &ex) {
		fprintf(stderr, "regrep: %s\n%s", ex.what(), CommandLineHelp);
		return GREP_ERROR;
	}

	if (options.help) {
		printf("%s", CommandLineHelp);
		return EXIT_SUCCESS;
	}

	if (options.version) {
		printf("%s", qPrintable(CreateInfoString()));
		return EXIT_SUCCESS;
	}

	const int flags = options.ignoreCase ? RE_DEFAULT_CASE_INSENSITIVE : RE_DEFAULT_STANDARD;

	try {
		const Regex regex(options.pattern.toStdString(), flags);

		if (options.dump) {
			PrintLine("pattern: " + DecompilePattern(regex.tree()));
			printf("groups: %zu\n", regex.groupCount());
			for (const std::string &line : DecompileProgram(regex.program())) {
				PrintLine(line);
			}
			return EXIT_SUCCESS;
		}

		options.lineNumbers = options.lineNumbers || Settings::lineNumbers;

		QFile output;
		QFile input;
		if (!output.open(stdout, QIODevice::WriteOnly) || !input.open(stdin, QIODevice::ReadOnly)) {
			qCritical("cannot open the standard streams");
			return GREP_ERROR;
		}

		Grep grep(regex, options, &output);
		grep.setColor(!options.quiet && UseColor(options.color.value_or(Settings::color)));
		return grep.run(options.files, &input);

	} catch (const RegexError &ex) {
		qCritical("%s", ex.what());
		return GREP_ERROR;
	}
}
