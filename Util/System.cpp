
#include "Util/System.h"

#include <QtGlobal>

/**
 * @brief Gets the operating system that regrep was built on.
 *
 * @return The operating system name.
 */
QLatin1String BuildOperatingSystem() {
#if defined(Q_OS_LINUX)
	return QLatin1String("Linux");
#elif defined(Q_OS_FREEBSD)
	return QLatin1String("FreeBSD");
#elif defined(Q_OS_NETBSD)
	return QLatin1String("NetBSD");
#elif defined(Q_OS_OPENBSD)
	return QLatin1String("OpenBSD");
#elif defined(Q_OS_DARWIN)
	return QLatin1String("Darwin");
#elif defined(Q_OS_CYGWIN)
	return QLatin1String("Cygwin");
#elif defined(Q_OS_WIN32)
	return QLatin1String("Windows");
#elif defined(Q_OS_UNIX)
	return QLatin1String("Unix");
#else
	return QLatin1String("<Unknown OS>");
#endif
}

/**
 * @brief Gets the architecture that regrep was built for.
 *
 * @return The architecture name.
 */
QLatin1String BuildArchitecture() {
#if defined(Q_PROCESSOR_X86_64)
	return QLatin1String("x86_64");
#elif defined(Q_PROCESSOR_X86_32)
	return QLatin1String("x86");
#elif defined(Q_PROCESSOR_ARM_64)
	return QLatin1String("arm64");
#elif defined(Q_PROCESSOR_ARM_32)
	return QLatin1String("arm");
#elif defined(Q_PROCESSOR_POWER_64)
	return QLatin1String("power64");
#elif defined(Q_PROCESSOR_RISCV_64)
	return QLatin1String("riscv64");
#elif defined(Q_PROCESSOR_S390_X)
	return QLatin1String("s390x");
#else
	return QLatin1String("unknown");
#endif
}

/**
 * @brief Gets the compiler that regrep was built with.
 *
 * @return A description of the compiler and its version.
 */
QString BuildCompiler() {
#if defined(Q_CC_CLANG) // must be before GNU, because clang claims to be GNU too
	return QStringLiteral("Clang ") +
		   QString::number(__clang_major__) +
		   QLatin1Char('.') +
		   QString::number(__clang_minor__);
#elif defined(Q_CC_GNU)
	return QStringLiteral("GCC ") + QStringLiteral(__VERSION__);
#elif defined(Q_CC_MSVC)
	return QStringLiteral("MSVC ") + QString::number(_MSC_VER);
#else
	return QStringLiteral("<unknown compiler>");
#endif
}
