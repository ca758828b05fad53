#ifndef COLORS_H
#define COLORS_H

// ANSI colors, only when GLOBALS.color says stdout is a terminal that wants them
#define ifcolor(x) (GLOBALS.color && NOTQUIET ? x : "")

#define RESET       ifcolor("\033[0m")
#define RED         ifcolor("\033[31m")
#define GREEN       ifcolor("\033[32m")
#define YELLOW      ifcolor("\033[33m")
#define BOLDGREEN   ifcolor("\033[1;32m")
#define BOLDBLUE    ifcolor("\033[1;34m")

#endif

