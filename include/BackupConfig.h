
#ifndef BACKUPCONFIG_H
#define BACKUPCONFIG_H

#include <vector>
#include <string>
#include <pcre++.h>
#include "cxxopts.hpp"
#include "Setting.h"


using namespace std;
using namespace pcrepp;


class BackupConfig {

public:
    string config_filename;
    vector<Setting> settings;

    BackupConfig();

    void loadConfig(string filename);
    void applyOverrides(const cxxopts::ParseResult &cli);
    void validate(bool forBackup = true) const;

    vector<string> sourceList() const;
    string hostIdentity() const;

    // short-lived verify/check directories go here, beside the scratch directory rather than inside it
    string workBase() const;

    void fullDump() const;
};

#endif

