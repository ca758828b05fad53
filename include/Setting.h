
#ifndef SETTING_H
#define SETTING_H

#include <string>
#include <map>
#include <pcre++.h>
#include "util_generic.h"

using namespace std;
using namespace pcrepp;

enum SetType { INT, STRING, BOOL, SIZE };
enum SetSpecifier { sSources, sRemote, sPassword, sKeep, sMinAge, sLogFile, sTmpDir, sLockFile, sMinSpace,
    sAttempts, sRetryDelay, sIterations, sHostname, sRclone, sTar, sNotify, sMailFrom, sTgToken, sTgChat,
    sTgApi, sNotifyStart };

extern map<string, int>settingMap;

class Setting {
    public:
        string display_name;
        enum SetType data_type;
        string value;
        string defaultValue;
        Pcre regex;
        bool seen;
        bool secret;

        int ivalue() const { return stoi(value); }
        size_t svalue() const { return approx2bytes(value); }
        bool bvalue() const { return str2bool(value); }
        string confPrint() const;
        void validate() const;
        Setting(string name, string pattern, enum SetType setType, string defaultVal, bool isSecret = false);
};

#endif

