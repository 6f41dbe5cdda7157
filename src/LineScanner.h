
#ifndef LINE_SCANNER_H_
#define LINE_SCANNER_H_

#include <cstddef>
#include <optional>
#include <string>

class QIODevice;

class LineScanner {
public:
	explicit LineScanner(QIODevice *device);
	LineScanner(const LineScanner &)            = delete;
	LineScanner &operator=(const LineScanner &) = delete;
	~LineScanner()                              = default;

public:
	std::optional<std::string> nextLine();
	size_t lineNumber() const noexcept;

private:
	QIODevice *device_;
	size_t lineNumber_ = 0;
};

#endif
