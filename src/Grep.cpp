
#include "Grep.h"
#include "LineScanner.h"
#include "Regex.h"
#include "Settings.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QtDebug>

#include <gsl/gsl_util>

#include <optional>

namespace {

const auto StandardInputName = QLatin1String("(standard input)");

/*----------------------------------------------------------------------*
 * ForEachMatch
 *
 * Calls `func` with the span of every non-empty match in `line`, left to
 * right. Each search resumes where the previous match ended; an empty
 * match moves the search on by one character.
 *----------------------------------------------------------------------*/
template <class Func>
void ForEachMatch(const Regex &regex, std::string_view line, Func func) {

	size_t offset = 0;
	while (offset <= line.size()) {
		const MatchResult result = regex.execute(line, offset);
		if (!result.matched) {
			break;
		}

		if (result.span.length() == 0) {
			offset = result.span.end + 1;
			continue;
		}

		func(result.span);
		offset = result.span.end;
	}
}

/**
 * @brief Appends the files below `path` to `files`, files of each
 * directory in name order ahead of its subdirectories.
 */
void CollectDirectory(const QString &path, QStringList &files) {

	const QDir dir(path);
	const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot, QDir::Name | QDir::DirsLast);

	for (const QFileInfo &entry : entries) {
		if (entry.isDir()) {
			// symbolic links to directories are not followed
			if (!entry.isSymLink()) {
				CollectDirectory(entry.filePath(), files);
			}
		} else {
			files.push_back(entry.filePath());
		}
	}
}

}

/**
 * @brief Constructs a search that writes its report to `output`.
 *
 * @param regex The compiled pattern.
 * @param options The command line options.
 * @param output An open, writable device.
 */
Grep::Grep(const Regex &regex, const Options &options, QIODevice *output)
	: regex_(regex), options_(options), output_(output) {
}

void Grep::setColor(bool enable) {
	color_ = enable;
}

bool Grep::hadErrors() const noexcept {
	return errors_;
}

/**
 * @brief Expands the command line operands into the list of files to search.
 *
 * @param operands The file and directory names given on the command line.
 * @param recursive If `true`, directories are searched recursively,
 * otherwise they are reported and skipped.
 * @param errors Set to `true` if an operand does not exist.
 * @return The files to search, in command line order.
 */
QStringList Grep::CollectFiles(const QStringList &operands, bool recursive, bool *errors) {

	QStringList files;

	for (const QString &operand : operands) {
		if (operand == QLatin1String("-")) {
			files.push_back(operand);
			continue;
		}

		const QFileInfo info(operand);

		if (!info.exists()) {
			qWarning("%s: No such file or directory", qPrintable(operand));
			*errors = true;
		} else if (info.isDir()) {
			if (recursive) {
				CollectDirectory(operand, files);
			} else {
				qWarning("%s: Is a directory", qPrintable(operand));
			}
		} else {
			files.push_back(operand);
		}
	}

	return files;
}

/**
 * @brief Searches every operand, or `standardInput` if there are none.
 *
 * @return The exit status: GREP_SELECTED if any line was selected,
 * GREP_NO_SELECTED if none was, or GREP_ERROR if an input could not be
 * read and -q did not already find a line.
 */
int Grep::run(const QStringList &operands, QIODevice *standardInput) {

	bool selected = false;

	if (operands.isEmpty()) {
		showFileName_ = options_.withFileName.value_or(false);
		selected      = searchDevice(standardInput, StandardInputName);
	} else {
		const QStringList files = CollectFiles(operands, options_.recursive, &errors_);
		showFileName_           = options_.withFileName.value_or(operands.size() > 1 || options_.recursive);

		for (const QString &file : files) {
			if (file == QLatin1String("-")) {
				selected |= searchDevice(standardInput, StandardInputName);
			} else {
				selected |= searchFile(file);
			}

			if (finished_) {
				break;
			}
		}
	}

	if (options_.quiet && selected) {
		return GREP_SELECTED;
	}

	if (errors_) {
		return GREP_ERROR;
	}

	return selected ? GREP_SELECTED : GREP_NO_SELECTED;
}

/**
 * @brief Opens and searches one file.
 *
 * @return `true` if a line was selected.
 */
bool Grep::searchFile(const QString &path) {

	QFile file(path);
	if (!file.open(QIODevice::ReadOnly)) {
		qWarning("%s: %s", qPrintable(path), qPrintable(file.errorString()));
		errors_ = true;
		return false;
	}

	const bool selected = searchDevice(&file, path);

	if (file.error() != QFileDevice::NoError) {
		qWarning("%s: %s", qPrintable(path), qPrintable(file.errorString()));
		errors_ = true;
	}

	return selected;
}

/*----------------------------------------------------------------------*
 * searchDevice
 *
 * Tests every line of `input` and reports the selected ones according
 * to the output mode: the lines themselves, only their matched parts
 * (-o), a count (-c), the input name (-l), or nothing at all (-q).
 *----------------------------------------------------------------------*/
bool Grep::searchDevice(QIODevice *input, const QString &name) {

	LineScanner scanner(input);
	size_t count = 0;

	while (std::optional<std::string> line = scanner.nextLine()) {

		const bool matched = regex_.execute(*line).matched;
		if (matched == options_.invert) {
			continue;
		}

		++count;

		if (options_.quiet) {
			finished_ = true;
			break;
		}

		if (options_.filesWithMatches) {
			break;
		}

		if (options_.count) {
			continue;
		}

		if (options_.onlyMatching) {
			if (options_.invert) {
				continue;
			}

			ForEachMatch(regex_, *line, [&](const Span &span) {
				const std::string_view part = std::string_view(*line).substr(span.start, span.length());
				write(prefix(name, scanner.lineNumber()) + colorize(part, Settings::matchColor) + '\n');
			});
			continue;
		}

		const std::string text = options_.invert ? *line : highlight(*line);
		write(prefix(name, scanner.lineNumber()) + text + '\n');
	}

	if (options_.quiet) {
		return count != 0;
	}

	if (options_.filesWithMatches) {
		if (count != 0) {
			write(colorize(name.toStdString(), Settings::fileNameColor) + '\n');
		}
	} else if (options_.count) {
		std::string text;
		if (showFileName_) {
			text += colorize(name.toStdString(), Settings::fileNameColor);
			text += colorize(":", Settings::separatorColor);
		}
		text += std::to_string(count);
		write(text + '\n');
	}

	return count != 0;
}

/**
 * @brief Builds the "name:number:" prefix of an output line.
 */
std::string Grep::prefix(const QString &name, size_t lineNumber) const {

	std::string text;

	if (showFileName_) {
		text += colorize(name.toStdString(), Settings::fileNameColor);
		text += colorize(":", Settings::separatorColor);
	}

	if (options_.lineNumbers) {
		text += colorize(std::to_string(lineNumber), Settings::lineNumberColor);
		text += colorize(":", Settings::separatorColor);
	}

	return text;
}

/**
 * @brief Wraps `text` in an SGR sequence if colour output is enabled.
 */
std::string Grep::colorize(std::string_view text, const QString &sgr) const {

	if (!color_ || text.empty()) {
		return std::string(text);
	}

	std::string out = "\033[";
	out += sgr.toStdString();
	out += "m\033[K";
	out += text;
	out += "\033[m\033[K";
	return out;
}

/**
 * @brief Returns `line` with every match coloured.
 */
std::string Grep::highlight(std::string_view line) const {

	if (!color_) {
		return std::string(line);
	}

	std::string out;
	size_t last = 0;

	ForEachMatch(regex_, line, [&](const Span &span) {
		out += line.substr(last, span.start - last);
		out += colorize(line.substr(span.start, span.length()), Settings::matchColor);
		last = span.end;
	});

	out += line.substr(last);
	return out;
}

void Grep::write(const std::string &text) {
	if (output_->write(text.data(), gsl::narrow_cast<qint64>(text.size())) == -1) {
		qWarning("write error: %s", qPrintable(output_->errorString()));
		errors_ = true;
	}
}
