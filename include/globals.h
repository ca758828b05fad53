
#ifndef GLOBALS_H
#define GLOBALS_H

#include "globalsdef.h"

extern struct global_vars GLOBALS;

#endif

