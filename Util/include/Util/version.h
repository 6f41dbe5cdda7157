
#ifndef UTIL_VERSION_H_
#define UTIL_VERSION_H_

constexpr auto REGREP_VERSION_MAJ = 1;
constexpr auto REGREP_VERSION_REV = 0;

#endif
