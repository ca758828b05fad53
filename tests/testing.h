#ifndef TESTING_H
#define TESTING_H

#include <dirent.h>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>

#include "globals.h"
#include "util_generic.h"

using namespace std;

// fresh directory under /tmp, removed by the caller with rmrf()
inline string makeTempDir(string tag) {
    string pattern = "/tmp/vpsbackup-" + tag + ".XXXXXX";
    char buffer[200];
    snprintf(buffer, sizeof(buffer), "%s", pattern.c_str());

    auto dir = mkdtemp(buffer);
    if (dir == NULL) {
        cerr << "unable to create a temporary directory" << errtext() << endl;
        exit(1);
    }

    return dir;
}

inline void writeFile(string filename, string contents) {
    ofstream out(filename, ios::binary | ios::trunc);
    out << contents;
}

inline string readFile(string filename) {
    ifstream in(filename, ios::binary);
    stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline bool fileContains(string filename, string text) {
    return readFile(filename).find(text) != string::npos;
}

// entries in dir other than . and ..; -1 if it can't be opened
inline int entryCount(string dir) {
    DIR *dirPtr = opendir(dir.c_str());
    if (dirPtr == NULL)
        return -1;

    int count = 0;
    struct dirent *entry;
    while ((entry = readdir(dirPtr)) != NULL)
        if (strcmp(entry->d_name, ".") && strcmp(entry->d_name, ".."))
            ++count;

    closedir(dirPtr);
    return count;
}

// point the run log somewhere disposable and keep the screen quiet
inline void setupTestGlobals(string logFile) {
    GLOBALS.quiet = true;
    GLOBALS.color = false;
    GLOBALS.pid = getpid();
    GLOBALS.logFile = logFile;
    time(&GLOBALS.startupTime);
}

#endif

