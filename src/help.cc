
#include <iostream>
#include <string>
#include "help.h"
#include "BackupConfig.h"
#include "globals.h"
#include "util_generic.h"


using namespace std;

void showHelp(enum helpType kind) {
    switch (kind) {
        case hDefaults: {
            BackupConfig config;
            cout << "Configuration defaults (" << CONF_FILE << "):" << endl;
            config.fullDump();
            break;
        }

        case hOptions: {
            string helpText = "vpsbackup [options]\n\n"
            + string(BOLDBLUE) + "ACTIONS" + string(RESET) + "\n"
            + "   -b, --backup        Run the backup pipeline: archive, encrypt, checksum, upload, prune.\n"
            + "   -l, --list          List the backups stored at the remote (newest first).\n"
            + "   -r, --restore [x]   Restore backup x (a name or its number from --list).\n"
            + "   --dir [dir]         Directory to restore into (default /tmp/vps-restore-<pid>).\n"
            + "   --verify [x]        Download and test-decrypt backup x without writing the contents to disk.\n"
            + "   --check             Test the configuration: sources, remote access and an encryption round trip.\n"
            + "   --notifytest        With --check, also send a test notification.\n"
            + "   --status            Show the configuration summary.\n"
            + "   --logs [n]          Show the last n lines of the run log (default 30).\n"
            + "\n" + string(BOLDBLUE) + "BACKUP SETTINGS" + string(RESET) + " (override the config file)\n"
            + "   --sources [list]    Pipe-separated files/directories to back up, e.g. \"/etc/nginx|/var/www\".\n"
            + "   --remote [dest]     rclone destination, e.g. gdrive:vps-backups.\n"
            + "   --password [pass]   Encryption passphrase. Losing it means losing every backup.\n"
            + "   --iterations [x]    PBKDF2 iterations for the key derivation (default 10000).\n"
            + "   --hostname [name]   Host name used in backup filenames (default: the system hostname).\n"
            + "   --tmpdir [dir]      Scratch directory; it's wiped at the start and end of every run.\n"
            + "   --minspace [size]   Minimum free space required in the scratch filesystem (default 1G).\n"
            + "   --attempts [x]      Upload attempts before giving up (default 3).\n"
            + "   --retrydelay [s]    Seconds between upload attempts (default 5).\n"
            + "   --rclone [path]     rclone binary to use.\n"
            + "   --tar [path]        tar binary to use.\n"
            + "\n" + string(BOLDBLUE) + "RETENTION" + string(RESET) + "\n"
            + "   --keep [x]          Keep the x most recent backups of this host; 0 disables pruning (default 2).\n"
            + "   --minage [hours]    Never prune a backup younger than this.\n"
            + "\n" + string(BOLDBLUE) + "NOTIFICATIONS" + string(RESET) + "\n"
            + "   --notify [contact]  Email addresses and/or script names, comma separated.\n"
            + "   --mailfrom [addr]   Sending address for notification emails.\n"
            + "   --tgtoken [token]   Telegram bot token.\n"
            + "   --tgchat [id]       Telegram chat id.\n"
            + "   --tgapi [url]       Telegram API base URL.\n"
            + "   --notifystart       Also notify when a backup starts.\n"
            + "\n" + string(BOLDBLUE) + "GENERAL" + string(RESET) + "\n"
            + "   -c, --config [file] Config file (default " + CONF_FILE + ", or $VB_CONFIG).\n"
            + "   --logfile [file]    Run log (default /var/log/vps-backup.log).\n"
            + "   --lockfile [file]   Lock file (default /var/lock/vps-backup.lock).\n"
            + "   -q, --quiet         No output except errors.\n"
            + "   --nocolor           Disable color.\n"
            + "   --defaults          Show the default settings.\n"
            + "   -v                  Debug output; -v+crypto-exec etc select areas, --vv for everything.\n"
            + "   -V, --version       Version.\n"
            + "   -h, --help          This help.\n";

            cout << helpText;
            break;
        }
    }
}

