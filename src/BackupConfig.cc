
#include <algorithm>
#include <fstream>
#include <sys/stat.h>
#include <stdio.h>
#include <unistd.h>
#include <pcre++.h>

#include "BackupConfig.h"
#include "Setting.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"
#include "exception.h"

using namespace pcrepp;


BackupConfig::BackupConfig() {
    config_filename = "";

    // define settings and their defaults
    // *** order *** of these inserts matter because they're accessed by position via the SetSpecifier enum
    settings.insert(settings.end(), Setting(CLI_SOURCES, RE_SOURCES, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_REMOTE, RE_REMOTE, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_PASSWORD, RE_PASSWORD, STRING, "", true));
    settings.insert(settings.end(), Setting(CLI_KEEP, RE_KEEP, INT, "2"));
    settings.insert(settings.end(), Setting(CLI_MINAGE, RE_MINAGE, INT, "0"));
    settings.insert(settings.end(), Setting(CLI_LOGFILE, RE_LOGFILE, STRING, "/var/log/vps-backup.log"));
    settings.insert(settings.end(), Setting(CLI_TMPDIR, RE_TMPDIR, STRING, "/tmp/vps-backups"));
    settings.insert(settings.end(), Setting(CLI_LOCKFILE, RE_LOCKFILE, STRING, "/var/lock/vps-backup.lock"));
    settings.insert(settings.end(), Setting(CLI_MINSPACE, RE_MINSPACE, SIZE, "1G"));
    settings.insert(settings.end(), Setting(CLI_ATTEMPTS, RE_ATTEMPTS, INT, "3"));
    settings.insert(settings.end(), Setting(CLI_RETRYDELAY, RE_RETRYDELAY, INT, "5"));
    settings.insert(settings.end(), Setting(CLI_ITERATIONS, RE_ITERATIONS, INT, "10000"));
    settings.insert(settings.end(), Setting(CLI_HOSTNAME, RE_HOSTNAME, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_RCLONE, RE_RCLONE, STRING, "rclone"));
    settings.insert(settings.end(), Setting(CLI_TAR, RE_TAR, STRING, "tar"));
    settings.insert(settings.end(), Setting(CLI_NOTIFY, RE_NOTIFY, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_MAILFROM, RE_MAILFROM, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_TGTOKEN, RE_TGTOKEN, STRING, "", true));
    settings.insert(settings.end(), Setting(CLI_TGCHAT, RE_TGCHAT, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_TGAPI, RE_TGAPI, STRING, "https://api.telegram.org"));
    settings.insert(settings.end(), Setting(CLI_NOTIFYSTART, RE_NOTIFYSTART, BOOL, "false"));
}


/*******************************************************************************
 * loadConfig(filename)
 *
 * Read "name: value" (or name=value, env-file style) lines from filename.
 * Blank lines and # comments are skipped. Anything unrecognized, or a value
 * that doesn't parse for its setting's type, throws VBException(eConfig)
 * naming the offending line.
 *******************************************************************************/
void BackupConfig::loadConfig(string filename) {
    ifstream configFile;

    configFile.open(filename);
    if (!configFile.is_open())
        throw VBException("unable to read " + filename + errtext(), eConfig);

    string dataLine;
    Pcre reBlank(RE_BLANK);
    config_filename = filename;

    unsigned int line = 0;
    while (getline(configFile, dataLine)) {
        ++line;

        // skip blanks and comments
        if (reBlank.search(dataLine))
            continue;

        // compare the line against each of the config settings until there's a match
        bool identified = false;
        for (auto &setting: settings) {
            if (setting.regex.search(dataLine) && setting.regex.matches() > 2) {
                setting.value = trimQuotes(trimSpace(setting.regex.get_match(2)));
                setting.seen = true;

                try {
                    setting.validate();
                }
                catch (VBException &e) {
                    configFile.close();
                    throw VBException(e.detail() + " on line " + to_string(line) + " of " + filename, eConfig);
                }

                DEBUG(D_config) DFMT(setting.display_name << " (line " << line << ")" <<
                    (setting.secret ? string("") : " = " + setting.value));
                identified = true;
                break;
            }
        }

        if (!identified) {
            configFile.close();
            throw VBException("unrecognized setting on line " + to_string(line) + " of " + filename + ": " + trimSpace(dataLine), eConfig);
        }
    }

    configFile.close();
    DEBUG(D_config) DFMT("successfully parsed config from " << filename);
}


/*******************************************************************************
 * applyOverrides(cli)
 *
 * Any setting also given on the commandline replaces the value from the
 * config file for this run.
 *******************************************************************************/
void BackupConfig::applyOverrides(const cxxopts::ParseResult &cli) {
    for (auto &setting : settings)
        if (cli.count(setting.display_name)) {
            DEBUG(D_config) DFMT("command line param: " << setting.display_name << " (type " << setting.data_type << ")");

            switch (setting.data_type) {
                case INT:
                    setting.value = to_string(cli[setting.display_name].as<int>());
                    break;

                case BOOL:
                    setting.value = cli[setting.display_name].as<bool>() ? "true" : "false";
                    break;

                case SIZE:
                case STRING:
                default:
                    setting.value = cli[setting.display_name].as<string>();
                    setting.validate();
                    break;
            }

            setting.seen = true;
        }
}


/*******************************************************************************
 * validate(forBackup)
 *
 * Check the combination of settings makes sense before anything is run.
 * A backup needs a remote and a passphrase; restore/list only the remote.
 *******************************************************************************/
void BackupConfig::validate(bool forBackup) const {
    for (auto &setting: settings)
        setting.validate();

    if (!settings[sRemote].value.length())
        throw VBException("no remote destination configured (set " + string(CLI_REMOTE) + ")", eConfig);

    if (forBackup && !settings[sPassword].value.length())
        throw VBException("no encryption passphrase configured (set " + string(CLI_PASSWORD) + ")", eConfig);

    if (settings[sAttempts].ivalue() < 1)
        throw VBException(string(CLI_ATTEMPTS) + " must be at least 1", eConfig);

    if (settings[sRetryDelay].ivalue() < 0 || settings[sMinAge].ivalue() < 0)
        throw VBException(string(CLI_RETRYDELAY) + " and " + CLI_MINAGE + " can't be negative", eConfig);

    if (settings[sIterations].ivalue() < 1)
        throw VBException(string(CLI_ITERATIONS) + " must be at least 1", eConfig);

    if (!settings[sTmpDir].value.length() || settings[sTmpDir].value == "/")
        throw VBException("invalid scratch directory '" + settings[sTmpDir].value + "'", eConfig);
}


// ordered, de-duplicated list of source paths
string BackupConfig::workBase() const {
    string scratch = settings[sTmpDir].value;

    while (scratch.length() > 1 && scratch.back() == '/')
        scratch.pop_back();

    auto base = pathSplit(scratch).dir;
    return base.length() ? base : ".";
}


vector<string> BackupConfig::sourceList() const {
    vector<string> result;

    for (auto &item: string2vectorOnPipe(settings[sSources].value, true, false)) {
        string source = trimQuotes(trimSpace(item));

        if (source.length() && find(result.begin(), result.end(), source) == result.end())
            result.push_back(source);
    }

    return result;
}


string BackupConfig::hostIdentity() const {
    return (settings[sHostname].value.length() ? settings[sHostname].value : hostname());
}


void BackupConfig::fullDump() const {
    for (auto &setting: settings)
        cout << setting.confPrint();
}

