#ifndef GLOBALSDEF_H
#define GLOBALSDEF_H

#define VERSION "1.0.2"

#include "cxxopts.hpp"
#include "colors.h"
#include <string>

/*
 Adding a commandline option vs adding a backup config setting.

 All settings have CLI options but not all CLI options have an equivalent setting.

 (A) To add a CLI option:
    (1) add a defined constant for its name #define CLI_xxxx in globalsdef.h
    (2) add the constant along with its type to options.add_options() in vpsbackup.cc

 (B) To add a backup config setting:
    (1) add a defined constant for its regex #define RE_xxxx in globalsdef.h
    (2) add an enum constant to reference it in Setting.h (order matters, add at end of list)
    (3) add a map entry between the defined const and the enum in Setting.cc
    (4) add it to the settings vector with its default in BackupConfig::BackupConfig() in BackupConfig.cc
    (5) do everything under the CLI option list above because you need a matching CLI option to
      override the config setting

 Settings are accessed as config.settings[ENUM].value or config.settings[ENUM].ivalue().
 BackupConfig::applyOverrides() folds the CLI values into the settings so the pipeline
 never has to look at the commandline itself.
 */


#define CONF_FILE "/etc/vpsbackup/vpsbackup.conf"
#define TMP_OUTPUT_DIR "/tmp/vpsbackup_output"
#define LOG_IDENT "vpsbackup"

#define DFMT(x) cerr << BOLDGREEN << __FUNCTION__ << ": " << RESET << GREEN << x << RESET << endl

#define NOTQUIET (!GLOBALS.quiet)
#define SCREENERR(x) cerr << RED << x << RESET << endl;
#define DUP2(x,y) while (dup2(x,y) < 0 && errno == EINTR)

#define SECS_PER_HOUR (60*60)
#define SNAPSHOT_TIME_FORMAT "%Y%m%d-%H%M%S"
#define SNAPSHOT_TIME_REGEX "(\\d{8}-\\d{6})"

/* CLI_ and RE_
 * The CLI_ constants are commandline switches while the RE_ are regex patterns
 * that match lines of config files.  Every setting has both (--keep & keep:). */

// define commandline options
#define CLI_CONFIG "config"
#define CLI_BACKUP "backup"
#define CLI_LIST "list"
#define CLI_RESTORE "restore"
#define CLI_RESTOREDIR "dir"
#define CLI_VERIFY "verify"
#define CLI_CHECK "check"
#define CLI_NOTIFYTEST "notifytest"
#define CLI_STATUS "status"
#define CLI_LOGS "logs"
#define CLI_QUIET "quiet"
#define CLI_NOCOLOR "nocolor"
#define CLI_DEFAULTS "defaults"
#define CLI_HELP "help"
#define CLI_VERSION "version"

// options that are also settings
#define CLI_SOURCES "sources"
#define CLI_REMOTE "remote"
#define CLI_PASSWORD "password"
#define CLI_KEEP "keep"
#define CLI_MINAGE "minage"
#define CLI_LOGFILE "logfile"
#define CLI_TMPDIR "tmpdir"
#define CLI_LOCKFILE "lockfile"
#define CLI_MINSPACE "minspace"
#define CLI_ATTEMPTS "attempts"
#define CLI_RETRYDELAY "retrydelay"
#define CLI_ITERATIONS "iterations"
#define CLI_HOSTNAME "hostname"
#define CLI_RCLONE "rclone"
#define CLI_TAR "tar"
#define CLI_NOTIFY "notify"
#define CLI_MAILFROM "mailfrom"
#define CLI_TGTOKEN "tgtoken"
#define CLI_TGCHAT "tgchat"
#define CLI_TGAPI "tgapi"
#define CLI_NOTIFYSTART "notifystart"


// conf file regexes
// values may be bare or wrapped in single/double quotes (env-file style)
#define CAPTURE_VALUE string("((?:\\s|=|:)+)((?:\"[^\"]*\"|'[^']*'|[^\"'#])*?)\\s*?")
#define RE_COMMENT "((?:\\s*#).*)*$"
#define RE_BLANK "^((?:\\s*#).*)*$"
#define RE_SOURCES "(sources|source|BACKUP_SRCS)"
#define RE_REMOTE "(remote|BACKUP_REMOTE_DIR)"
#define RE_PASSWORD "(password|passphrase|BACKUP_PASSWORD)"
#define RE_KEEP "(keep|maxkeep|BACKUP_MAX_KEEP)"
#define RE_MINAGE "(minage)"
#define RE_LOGFILE "(logfile|log|BACKUP_LOG_FILE)"
#define RE_TMPDIR "(tmpdir|scratch|BACKUP_TMP_DIR)"
#define RE_LOCKFILE "(lockfile|lock)"
#define RE_MINSPACE "(minspace)"
#define RE_ATTEMPTS "(attempts|upload_attempts)"
#define RE_RETRYDELAY "(retrydelay|retry_delay)"
#define RE_ITERATIONS "(iterations|kdf_iterations)"
#define RE_HOSTNAME "(hostname|VPS_IDENTIFIER)"
#define RE_RCLONE "(rclone)"
#define RE_TAR "(tar)"
#define RE_NOTIFY "(notify)"
#define RE_MAILFROM "(mailfrom|from)"
#define RE_TGTOKEN "(tgtoken|TG_BOT_TOKEN)"
#define RE_TGCHAT "(tgchat|TG_CHAT_ID)"
#define RE_TGAPI "(tgapi)"
#define RE_NOTIFYSTART "(notifystart)"

using namespace std;

enum helpType { hDefaults, hOptions };

struct global_vars {
    unsigned int debugSelector;
    time_t startupTime;
    int pid;
    cxxopts::ParseResult cli;
    bool color;
    bool quiet;
    string logFile;
    string interruptDir;
    string interruptLock;

    global_vars() : debugSelector(0), startupTime(0), pid(0), color(false), quiet(true) {}
};

#endif

