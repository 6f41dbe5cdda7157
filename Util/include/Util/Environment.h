
#ifndef UTIL_ENVIRONMENT_H_
#define UTIL_ENVIRONMENT_H_

#include <QString>

QString GetEnvironmentVariable(const char *name);

#endif
