
#ifndef HELP_H
#define HELP_H

#include "globalsdef.h"

void showHelp(enum helpType kind);

#endif

