#ifndef SETTINGS_H_
#define SETTINGS_H_

#include "ColorMode.h"

#include <QString>

namespace Settings {

void Load();
void Reset();

// Paths
QString ConfigFile();

extern ColorMode color;
extern QString matchColor;
extern QString fileNameColor;
extern QString lineNumberColor;
extern QString separatorColor;
extern bool lineNumbers;

}

#endif
