
#ifndef UTIL_SYSTEM_H_
#define UTIL_SYSTEM_H_

#include <QLatin1String>
#include <QString>

QLatin1String BuildOperatingSystem();
QLatin1String BuildArchitecture();
QString BuildCompiler();

#endif
