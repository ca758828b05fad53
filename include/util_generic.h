#ifndef UTIL_GENERIC
#define UTIL_GENERIC

#include <string>
#include <vector>
#include <time.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <iostream>

#include "pcre++.h"
#include "globals.h"
#include "math.h"

using namespace pcrepp;
using namespace std;


#define mytimersub(tvp, uvp, vvp)                         \
    do {                                                  \
        (vvp)->tv_sec = (tvp)->tv_sec - (uvp)->tv_sec;    \
        (vvp)->tv_usec = (tvp)->tv_usec - (uvp)->tv_usec; \
        if ((vvp)->tv_usec < 0) {                         \
            (vvp)->tv_sec--;                              \
            (vvp)->tv_usec += 1000000;                    \
        }                                                 \
    } while (0)


string cppgetenv(string variable);

string plural(size_t number, string text);

string log(string message);

string timeDiffSingle(time_t seconds, int maxUnits = 2);


class timer {
    struct timeval startTime;
    struct timeval endTime;

    public:
        void start() { gettimeofday(&startTime, NULL); endTime = startTime; }
        void stop() { gettimeofday(&endTime, NULL); }

        time_t seconds() {
            struct timeval diffTime;
            mytimersub(&endTime, &startTime, &diffTime);
            return diffTime.tv_sec;
        }

        string elapsed() { return timeDiffSingle(seconds()); }

    timer() { startTime.tv_sec = startTime.tv_usec = endTime.tv_sec = endTime.tv_usec = 0; }
};


struct s_pathSplit {
    string dir;
    string file;
};

// pathsplit assumes a full dir/file
s_pathSplit pathSplit(string path);

string slashConcat(string str1, string str2, string str3 = "");

string sha256File(string filename);

string approximate(size_t size);

size_t approx2bytes(string approx);

int mkdirp(string dir, mode_t mode = 0700);

string trimSpace(const string &s);

string trimQuotes(string s, bool unEscape = false);

vector<string> string2vectorOnPipe(string data, bool trimQ = false, bool unEscape = false);

vector<string> splitOnChar(string data, char delimiter);

string locateBinary(string app);

bool str2bool(string text);

bool sendEmail(string from, string recipients, string subject, string message);

string blockp(string data, int width);

bool rmrf(string directory, bool includeTopDir = true);

// du -s
size_t dus(string path);


bool exists(const std::string& name);

long long fileSize(string filename);

string errtext(bool format = true);

string commafy(string data);

string hostname();

string escapeRegex(string data);

string timeString(time_t when, string format);

vector<string> tailFile(string filename, unsigned int lines);

struct pdCallbackData {
    string filename;
    unsigned int depth;
    struct stat statData;
    void *dataPtr;
};

string processDirectory(string directory, bool (*callback)(pdCallbackData&), void *passData, bool includeTopDir = false);

#endif

