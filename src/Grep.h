
#ifndef GREP_H_
#define GREP_H_

#include "Options.h"

#include <QString>
#include <QStringList>

#include <cstddef>
#include <string>
#include <string_view>

class QIODevice;
class Regex;
struct Span;

// Exit status of a search.
enum GrepStatus : int {
	GREP_SELECTED    = 0,
	GREP_NO_SELECTED = 1,
	GREP_ERROR       = 2,
};

class Grep {
public:
	Grep(const Regex &regex, const Options &options, QIODevice *output);
	Grep(const Grep &)            = delete;
	Grep &operator=(const Grep &) = delete;
	~Grep()                       = default;

public:
	int run(const QStringList &operands, QIODevice *standardInput);
	bool searchDevice(QIODevice *input, const QString &name);
	bool searchFile(const QString &path);

public:
	void setColor(bool enable);
	bool hadErrors() const noexcept;

public:
	static QStringList CollectFiles(const QStringList &operands, bool recursive, bool *errors);

private:
	std::string prefix(const QString &name, size_t lineNumber) const;
	std::string colorize(std::string_view text, const QString &sgr) const;
	std::string highlight(std::string_view line) const;
	void write(const std::string &text);

private:
	const Regex &regex_;
	const Options &options_;
	QIODevice *output_;
	bool color_        = false;
	bool showFileName_ = false;
	bool errors_       = false;
	bool finished_     = false;
};

#endif
