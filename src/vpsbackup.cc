/*
 *  vpsbackup
 *
 *  Takes a full, encrypted snapshot of a list of files and directories and keeps
 *  it in remote object storage (anything rclone can reach):
 *
 *  1. Backup
 *
 *     The configured sources are packed into one tar.gz, encrypted under a
 *     passphrase (openssl enc compatible), checksummed and uploaded.  The upload
 *     is retried until the remote size matches the local size.
 *
 *  2. Retention
 *
 *     Only the newest N backups of this host are kept at the remote.
 *
 *  3. Restore
 *
 *     Any backup can be listed, downloaded, checked against its checksum,
 *     decrypted and extracted, or verified without writing its contents to disk.
 */

#include <signal.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <iostream>
#include <fstream>

#include "syslog.h"
#include "unistd.h"

#include "BackupConfig.h"
#include "BackupLock.h"
#include "Notifier.h"
#include "Pipeline.h"
#include "RcloneTransport.h"
#include "cipher.h"
#include "colors.h"
#include "cxxopts.hpp"
#include "debug.h"
#include "exception.h"
#include "globalsdef.h"
#include "help.h"
#include "restore.h"
#include "snapshot.h"
#include "util_generic.h"

using namespace pcrepp;


struct methodStatus {
    bool success;
    string detail;

    methodStatus() { success = true; }
    methodStatus(bool s, string d)
    {
        success = s;
        detail = d;
    }
};


/*******************************************************************************
 * sigTermHandler(sig)
 *
 * Clean up whatever the current operation has in flight (the scratch or
 * temporary directory and the lock) and exit.
 *******************************************************************************/
void sigTermHandler(int sig) {
    string reason = (sig > 0 ? "interrupt" : "error");

    if (GLOBALS.interruptDir.length()) {
        log("operation aborted on " + reason + (sig > 0 ? ", signal " + to_string(sig) : "") + " (" +
            GLOBALS.interruptDir + ")");

        cerr << "\n" << reason << ": aborting, cleaning up " << GLOBALS.interruptDir << "... ";
        rmrf(GLOBALS.interruptDir);
        cerr << "done." << endl;
    }
    else
        log("operation aborted on " + reason + (sig > 0 ? " (signal " + to_string(sig) + ")" : ""));

    if (GLOBALS.interruptLock.length()) unlink(GLOBALS.interruptLock.c_str());

    exit(1);
}


// descriptive function name for exit
void cleanupAndExitOnError() {
    sigTermHandler(-1);
}


void listBackups(const BackupConfig &config) {
    RcloneTransport transport(config.settings[sRclone].value, config.settings[sRemote].value);
    auto snapshots = listSnapshots(transport);

    if (!snapshots.size()) {
        cout << "no backups found at " << transport.describe() << endl;
        return;
    }

    cout << BOLDBLUE << "Backups at " << transport.describe() << RESET << endl;

    long long total = 0;
    char buffer[400];
    int index = 0;
    for (auto &entry: snapshots) {
        snprintf(buffer, sizeof(buffer), "%4d  %-60s %8s  %s", ++index, entry.name.c_str(),
                 entry.size >= 0 ? approximate(entry.size).c_str() : "?",
                 entry.hasChecksum ? "sha256" : "");
        cout << buffer << endl;

        if (entry.size > 0)
            total += entry.size;
    }

    cout << plural(snapshots.size(), "backup") << ", " << approximate(total) << " total" << endl;
}


string passphraseFor(const BackupConfig &config) {
    if (config.settings[sPassword].value.length())
        return config.settings[sPassword].value;

    return promptPassphrase("Encryption passphrase: ");
}


void restoreBackup(const BackupConfig &config, string selector, string directory) {
    RcloneTransport transport(config.settings[sRclone].value, config.settings[sRemote].value);
    auto name = resolveSnapshot(listSnapshots(transport), selector);
    auto passphrase = passphraseFor(config);

    if (!directory.length())
        directory = defaultRestoreDir();

    log("restore of " + name + " to " + directory + " started");
    restoreSnapshot(config, transport, name, directory, passphrase);
    NOTQUIET && cout << GREEN << "restored " << name << " to " << directory << RESET << endl;
}


void verifyBackup(const BackupConfig &config, string selector) {
    RcloneTransport transport(config.settings[sRclone].value, config.settings[sRemote].value);
    auto name = resolveSnapshot(listSnapshots(transport), selector);

    verifySnapshot(config, transport, name, passphraseFor(config));
    NOTQUIET && cout << GREEN << name << " verified: checksum, decryption and archive are intact" << RESET << endl;
}


methodStatus checkEncryption(const BackupConfig &config) {
    string base = config.workBase();
    mkdirp(base, 0755);

    string pattern = slashConcat(base, "vpsbackup-check.XXXXXX");
    vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back(0);

    if (mkdtemp(buffer.data()) == NULL)
        return methodStatus(false, "unable to create a temporary directory under " + base + errtext());

    string dir = buffer.data();
    string plainFile = slashConcat(dir, "sample.txt");
    string sealedFile = plainFile + ENCRYPTED_SUFFIX;
    string openedFile = plainFile + ".out";
    string sample = "vpsbackup encryption check " + to_string(time(NULL)) + "\n";
    methodStatus status;

    ofstream plain(plainFile);
    plain << sample;
    plain.close();

    try {
        encryptFile(plainFile, sealedFile, config.settings[sPassword].value, config.settings[sIterations].ivalue());
        decryptFile(sealedFile, openedFile, config.settings[sPassword].value, config.settings[sIterations].ivalue(), false);

        if (sha256File(plainFile) != sha256File(openedFile))
            status = methodStatus(false, "decrypted data doesn't match the original");
    }
    catch (VBException &e) {
        status = methodStatus(false, e.detail());
    }

    rmrf(dir);
    return status;
}


// returns the number of problems found
int checkConfiguration(const BackupConfig &config) {
    int problems = 0;
    auto report = [&](bool ok, string item, string detail = "") {
        cout << (ok ? GREEN : RED) << (ok ? "  ok    " : "  FAIL  ") << RESET << item << (detail.length() ? " - " + detail : "") << endl;
        problems += !ok;
    };

    cout << BOLDBLUE << "Configuration check" << (config.config_filename.length() ? " (" + config.config_filename + ")" : "") << RESET << endl;

    auto sources = config.sourceList();
    report(sources.size() > 0, "sources configured", plural(sources.size(), "path"));
    for (auto &source: sources)
        if (exists(source))
            report(true, source);
        else
            cout << YELLOW << "  warn  " << RESET << source << " - not found, it will be skipped" << endl;

    report(locateBinary(config.settings[sTar].value).length() > 0, "tar available", config.settings[sTar].value);
    report(locateBinary(config.settings[sRclone].value).length() > 0, "rclone available", config.settings[sRclone].value);

    RcloneTransport transport(config.settings[sRclone].value, config.settings[sRemote].value);
    vector<remoteObject> objects;
    report(transport.list(objects), "remote accessible", transport.describe());

    auto crypto = checkEncryption(config);
    report(crypto.success, "encryption round trip", crypto.detail);

    if (GLOBALS.cli.count(CLI_NOTIFYTEST)) {
        Notifier notifier(config, config.hostIdentity());

        if (notifier.enabled())
            report(notifier.notify("vpsbackup test notification from " + config.hostIdentity(), true) > 0, "test notification sent");
        else
            cout << YELLOW << "  warn  " << RESET << "no notification destinations configured" << endl;
    }

    cout << (problems ? RED : GREEN) << (problems ? plural(problems, "problem") + " found" : "configuration looks good") << RESET << endl;
    return problems;
}


void showStatus(const BackupConfig &config) {
    auto host = config.hostIdentity();

    cout << BOLDBLUE << "vpsbackup " << VERSION << RESET << endl;
    cout << "  config:        " << (config.config_filename.length() ? config.config_filename : "(none, defaults)") << endl;
    cout << "  hostname:      " << host << endl;
    cout << "  remote:        " << (config.settings[sRemote].value.length() ? config.settings[sRemote].value : "(not set)") << endl;
    cout << "  retention:     " << (config.settings[sKeep].ivalue() > 0 ? "keep " + config.settings[sKeep].value : string("pruning disabled")) <<
        (config.settings[sMinAge].ivalue() > 0 ? ", min age " + plural(config.settings[sMinAge].ivalue(), "hour") : "") << endl;
    cout << "  encryption:    " << (config.settings[sPassword].value.length() ? "AES-256-CBC, PBKDF2 " + config.settings[sIterations].value + " iterations" : string("no passphrase set")) << endl;

    Notifier notifier(config, host);
    cout << "  notifications: " << (notifier.enabled() ? "enabled" : "none") << endl;
    cout << "  log:           " << config.settings[sLogFile].value << endl;

    BackupLock lock(config.settings[sLockFile].value);
    auto [pid, lockTime] = lock.getLockPID();
    if (pid && BackupLock::pidIsAlive(pid))
        cout << YELLOW << "  running:       pid " << pid << " since " << timeString(lockTime, "%Y-%m-%d %H:%M:%S") << RESET << endl;

    cout << "  sources:" << endl;
    for (auto &source: config.sourceList()) {
        if (exists(source))
            cout << "    " << blockp(approximate(dus(source)), 8) << "  " << source << endl;
        else
            cout << "    " << YELLOW << blockp("missing", 8) << RESET << "  " << source << endl;
    }

    try {
        string lastRun;
        for (auto &line: tailFile(config.settings[sLogFile].value, 1000))
            if (line.find("pipeline completed") != string::npos)
                lastRun = line;

        cout << "  last success:  " << (lastRun.length() ? lastRun : "none recorded") << endl;
    }
    catch (VBException &e) {
        cout << "  last success:  unknown (" << e.detail() << ")" << endl;
    }
}


void showLogs(const BackupConfig &config, int lines) {
    for (auto &line: tailFile(config.settings[sLogFile].value, lines > 0 ? lines : 30))
        cout << line << endl;
}


int main(int argc, char *argv[]) {
    signal(SIGTERM, sigTermHandler);
    signal(SIGINT, sigTermHandler);

    GLOBALS.pid = getpid();
    time(&GLOBALS.startupTime);
    openlog(LOG_IDENT, LOG_PID | LOG_NDELAY, LOG_LOCAL1);
    cxxopts::Options options("vpsbackup", "Encrypted VPS backups to remote storage");

    options.add_options()(string("c,") + CLI_CONFIG, "Config file", cxxopts::value<std::string>())(
        string("b,") + CLI_BACKUP, "Run a backup", cxxopts::value<bool>()->default_value("false"))(
        string("l,") + CLI_LIST, "List backups", cxxopts::value<bool>()->default_value("false"))(
        string("r,") + CLI_RESTORE, "Restore a backup", cxxopts::value<std::string>())(
        CLI_RESTOREDIR, "Restore directory", cxxopts::value<std::string>())(
        CLI_VERIFY, "Verify a backup", cxxopts::value<std::string>())(
        CLI_CHECK, "Check configuration", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOTIFYTEST, "Send a test notification", cxxopts::value<bool>()->default_value("false"))(
        CLI_STATUS, "Show status", cxxopts::value<bool>()->default_value("false"))(
        CLI_LOGS, "Show the run log", cxxopts::value<int>()->implicit_value("30"))(
        string("q,") + CLI_QUIET, "No output", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOCOLOR, "Disable color", cxxopts::value<bool>()->default_value("false"))(
        CLI_DEFAULTS, "Show defaults", cxxopts::value<bool>()->default_value("false"))(
        string("h,") + CLI_HELP, "Show help", cxxopts::value<bool>()->default_value("false"))(
        string("V,") + CLI_VERSION, "Version", cxxopts::value<bool>()->default_value("false"))(
        CLI_SOURCES, "Sources", cxxopts::value<std::string>())(
        CLI_REMOTE, "Remote", cxxopts::value<std::string>())(
        CLI_PASSWORD, "Passphrase", cxxopts::value<std::string>())(
        CLI_KEEP, "Backups to keep", cxxopts::value<int>())(
        CLI_MINAGE, "Minimum age to prune", cxxopts::value<int>())(
        CLI_LOGFILE, "Run log", cxxopts::value<std::string>())(
        CLI_TMPDIR, "Scratch directory", cxxopts::value<std::string>())(
        CLI_LOCKFILE, "Lock file", cxxopts::value<std::string>())(
        CLI_MINSPACE, "Minimum local space", cxxopts::value<std::string>())(
        CLI_ATTEMPTS, "Upload attempts", cxxopts::value<int>())(
        CLI_RETRYDELAY, "Upload retry delay", cxxopts::value<int>())(
        CLI_ITERATIONS, "KDF iterations", cxxopts::value<int>())(
        CLI_HOSTNAME, "Hostname", cxxopts::value<std::string>())(
        CLI_RCLONE, "rclone binary", cxxopts::value<std::string>())(
        CLI_TAR, "tar binary", cxxopts::value<std::string>())(
        CLI_NOTIFY, "Notify", cxxopts::value<std::string>())(
        CLI_MAILFROM, "Send mail from", cxxopts::value<std::string>())(
        CLI_TGTOKEN, "Telegram bot token", cxxopts::value<std::string>())(
        CLI_TGCHAT, "Telegram chat id", cxxopts::value<std::string>())(
        CLI_TGAPI, "Telegram API URL", cxxopts::value<std::string>())(
        CLI_NOTIFYSTART, "Notify on start", cxxopts::value<bool>());

    try {
        options.allow_unrecognised_options();  // to support -v...
        GLOBALS.cli = options.parse(argc, argv);
        GLOBALS.quiet = GLOBALS.cli[CLI_QUIET].as<bool>();
        GLOBALS.color = !(GLOBALS.quiet || GLOBALS.cli[CLI_NOCOLOR].as<bool>()) && isatty(STDOUT_FILENO);

        // debug selectors
        GLOBALS.debugSelector = 0;
        for (auto uarg : GLOBALS.cli.unmatched()) {
            if (uarg == "--vv") {
                GLOBALS.debugSelector = D_all;
                continue;
            }

            if (uarg == "-v") {
                GLOBALS.debugSelector = D_default;
                continue;
            }

            if (uarg.length() > 2 && uarg.substr(0, 2) == "-v" && string("=+-").find(uarg[2]) != string::npos) {
                unsigned int selector = D_default;
                string error;

                if (!decodeDebugSelectors(selector, uarg.substr(2), error)) {
                    SCREENERR("error: " << error);
                    exit(1);
                }

                GLOBALS.debugSelector = selector;
                continue;
            }

            SCREENERR("error: unrecognized parameter " << uarg
                      << "\nUse --help for a list of options.");
            exit(1);
        }
    }
    catch (cxxopts::OptionParseException &e) {
        cerr << "vpsbackup: " << e.what() << endl;
        exit(1);
    }

    if (GLOBALS.cli.count(CLI_HELP)) {
        showHelp(hOptions);
        exit(0);
    }

    if (GLOBALS.cli.count(CLI_VERSION)) {
        cout << "vpsbackup " << VERSION << endl;
        exit(0);
    }

    if (GLOBALS.cli.count(CLI_DEFAULTS)) {
        showHelp(hDefaults);
        exit(0);
    }

    int actions = GLOBALS.cli.count(CLI_BACKUP) + GLOBALS.cli.count(CLI_LIST) + GLOBALS.cli.count(CLI_RESTORE) +
        GLOBALS.cli.count(CLI_VERIFY) + GLOBALS.cli.count(CLI_CHECK) + GLOBALS.cli.count(CLI_STATUS) + GLOBALS.cli.count(CLI_LOGS);

    if (!actions) {
        showHelp(hOptions);
        exit(1);
    }

    if (actions > 1) {
        SCREENERR("error: --" << CLI_BACKUP << ", --" << CLI_LIST << ", --" << CLI_RESTORE << ", --" << CLI_VERIFY << ", --" <<
                  CLI_CHECK << ", --" << CLI_STATUS << " and --" << CLI_LOGS << " are mutually-exclusive");
        exit(1);
    }

    // the config file: --config, then $VB_CONFIG, then the default location
    BackupConfig config;
    string configFile = CONF_FILE;
    bool explicitConfig = true;

    if (GLOBALS.cli.count(CLI_CONFIG))
        configFile = GLOBALS.cli[CLI_CONFIG].as<string>();
    else
        if (cppgetenv("VB_CONFIG").length())
            configFile = cppgetenv("VB_CONFIG");
        else
            explicitConfig = false;

    try {
        if (explicitConfig || exists(configFile))
            config.loadConfig(configFile);

        config.applyOverrides(GLOBALS.cli);
        GLOBALS.logFile = config.settings[sLogFile].value;

        if (GLOBALS.cli.count(CLI_STATUS)) {
            showStatus(config);
            exit(0);
        }

        if (GLOBALS.cli.count(CLI_LOGS)) {
            showLogs(config, GLOBALS.cli[CLI_LOGS].as<int>());
            exit(0);
        }

        config.validate(GLOBALS.cli.count(CLI_BACKUP) || GLOBALS.cli.count(CLI_CHECK));

        if (GLOBALS.cli.count(CLI_CHECK))
            exit(checkConfiguration(config) ? 1 : 0);

        if (GLOBALS.cli.count(CLI_LIST)) {
            listBackups(config);
            exit(0);
        }

        if (GLOBALS.cli.count(CLI_RESTORE)) {
            restoreBackup(config, GLOBALS.cli[CLI_RESTORE].as<string>(),
                          GLOBALS.cli.count(CLI_RESTOREDIR) ? GLOBALS.cli[CLI_RESTOREDIR].as<string>() : "");
            exit(0);
        }

        if (GLOBALS.cli.count(CLI_VERIFY)) {
            verifyBackup(config, GLOBALS.cli[CLI_VERIFY].as<string>());
            exit(0);
        }
    }
    catch (VBException &e) {
        SCREENERR(log("error: " + e.detail()));
        cleanupAndExitOnError();
    }
    catch (std::exception &e) {
        SCREENERR(log(string("error: ") + e.what()));
        cleanupAndExitOnError();
    }

    // BACKUP
    RcloneTransport transport(config.settings[sRclone].value, config.settings[sRemote].value);
    Notifier notifier(config, config.hostIdentity());
    BackupPipeline pipeline(config, transport, notifier);

    auto result = pipeline.run(config.hostIdentity(), time(NULL));

    DEBUG(D_any) DFMT("pipeline ended in " << stateName(result.state));
    closelog();
    return (result.success() ? 0 : 1);
}

