
#include <algorithm>
#include <unistd.h>
#include <signal.h>
#include <termios.h>
#include <stdio.h>
#include <string.h>
#include <pcre++.h>

#include "restore.h"
#include "snapshot.h"
#include "cipher.h"
#include "archive.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"
#include "debug.h"

using namespace pcrepp;


vector<snapshotEntry> listSnapshots(RemoteTransport &transport) {
    vector<remoteObject> objects;
    vector<snapshotEntry> snapshots;

    if (!transport.list(objects))
        throw VBException("unable to list backups at " + transport.describe(), eDownloadFailed);

    Pcre stampRE(string("-") + SNAPSHOT_TIME_REGEX + "\\.tar\\.gz\\.enc$");
    for (auto &object: objects) {
        if (!isSnapshotName(object.name) || !stampRE.search(object.name))
            continue;

        snapshotEntry entry;
        entry.name = object.name;
        entry.timestamp = stampRE.get_match(0);
        entry.size = object.size;
        entry.hasChecksum = find_if(objects.begin(), objects.end(), [&](const remoteObject &o) {
            return o.name == checksumNameFor(object.name); }) != objects.end();

        snapshots.push_back(entry);
    }

    sort(snapshots.begin(), snapshots.end(), [](const snapshotEntry &a, const snapshotEntry &b) {
        return (a.timestamp != b.timestamp ? a.timestamp > b.timestamp : a.name < b.name);
    });

    DEBUG(D_restore) DFMT(transport.describe() << ": " << plural(snapshots.size(), "snapshot"));
    return snapshots;
}


string resolveSnapshot(const vector<snapshotEntry> &snapshots, string selector) {
    Pcre indexRE("^\\d+$");
    selector = trimSpace(selector);

    for (auto &entry: snapshots)
        if (entry.name == selector)
            return entry.name;

    if (indexRE.search(selector)) {
        auto index = stoul(selector);

        if (index >= 1 && index <= snapshots.size())
            return snapshots[index - 1].name;
    }

    throw VBException("no backup matching '" + selector + "' (use --" + CLI_LIST + " to see what's available)");
}


/*******************************************************************************
 * fetchVerified(transport, name, directory)
 *
 * Download name (and its companion, if there is one) into directory and
 * compare digests.  Returns the local path of the encrypted artifact.
 *******************************************************************************/
string fetchVerified(RemoteTransport &transport, string name, string directory) {
    string localFile = slashConcat(directory, name);
    string companion = checksumNameFor(name);
    string localCompanion = slashConcat(directory, companion);

    log("downloading " + name + " from " + transport.describe());
    NOTQUIET && cout << "\t• downloading " << name << endl;

    if (!transport.download(name, directory))
        throw VBException("unable to download " + name + " from " + transport.describe(), eDownloadFailed);

    if (transport.download(companion, directory)) {
        auto expected = readChecksumFile(localCompanion);
        auto actual = sha256File(localFile);
        unlink(localCompanion.c_str());

        if (!expected.length() || expected != actual) {
            unlink(localFile.c_str());
            throw VBException("checksum mismatch for " + name + " (expected " + (expected.length() ? expected : "nothing") +
                              ", got " + actual + ")", eChecksumFailed);
        }

        DEBUG(D_restore) DFMT(name << " matches its checksum " << actual);
    }
    else
        log("warning: no checksum available for " + name + "; skipping integrity check");

    return localFile;
}


void restoreSnapshot(const BackupConfig &config, RemoteTransport &transport, string name, string directory, string passphrase) {
    if (mkdirp(directory, 0700))
        throw VBException("unable to create " + directory + errtext(), eExtractFailed);

    auto encryptedPath = fetchVerified(transport, name, directory);
    string archivePath = encryptedPath.substr(0, encryptedPath.length() - strlen(ENCRYPTED_SUFFIX));

    NOTQUIET && cout << "\t• decrypting " << name << endl;
    try {
        decryptFile(encryptedPath, archivePath, passphrase, config.settings[sIterations].ivalue());
    }
    catch (VBException &) {
        unlink(encryptedPath.c_str());
        throw;
    }

    unlink(encryptedPath.c_str());

    NOTQUIET && cout << "\t• extracting to " << directory << endl;
    try {
        extractArchive(config.settings[sTar].value, archivePath, directory);
    }
    catch (VBException &) {
        unlink(archivePath.c_str());
        throw;
    }

    unlink(archivePath.c_str());
    log("restored " + name + " to " + directory);
}


// temporary directory removed when this goes out of scope
class tempDir {
    string path;

public:
    tempDir(string base) {
        string pattern = slashConcat(base, "vpsbackup-verify.XXXXXX");
        vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back(0);

        if (mkdtemp(buffer.data()) == NULL)
            throw VBException("unable to create a temporary directory under " + base + errtext(), eDownloadFailed);

        path = buffer.data();
        GLOBALS.interruptDir = path;
    }

    ~tempDir() {
        rmrf(path);
        if (GLOBALS.interruptDir == path)
            GLOBALS.interruptDir = "";
    }

    string get() const { return path; }
};


void verifySnapshot(const BackupConfig &config, RemoteTransport &transport, string name, string passphrase) {
    string base = config.workBase();
    if (mkdirp(base, 0755))
        throw VBException("unable to create " + base + errtext(), eDownloadFailed);

    tempDir workDir(base);

    auto encryptedPath = fetchVerified(transport, name, workDir.get());

    // tar may stop reading early on a damaged archive
    auto oldHandler = signal(SIGPIPE, SIG_IGN);

    PipeExec tar({ config.settings[sTar].value, "-tzf", "-" }, "tar");
    tar.execute(true, poDiscard);

    NOTQUIET && cout << "\t• verifying " << name << endl;
    try {
        decryptStream(encryptedPath, passphrase, config.settings[sIterations].ivalue(),
            [&](const unsigned char *data, size_t length) { return tar.writeProc(data, length) >= 0; });
    }
    catch (VBException &) {
        tar.wait();
        signal(SIGPIPE, oldHandler);
        throw;
    }

    int status = tar.wait();
    signal(SIGPIPE, oldHandler);

    if (status) {
        string errors = tar.errorOutput();
        throw VBException("archive in " + name + " is unreadable (tar exit " + to_string(status) + ")" +
                          (errors.length() ? ": " + errors : ""), eExtractFailed);
    }

    log("verified " + name);
}


string defaultRestoreDir() {
    return "/tmp/vps-restore-" + to_string(getpid());
}


string promptPassphrase(string prompt) {
    FILE *tty = fopen("/dev/tty", "r+");

    if (tty == NULL)
        throw VBException("no passphrase configured and no terminal to ask for one", eConfig);

    struct termios original, silent;
    int fd = fileno(tty);
    bool haveTermios = !tcgetattr(fd, &original);

    fprintf(tty, "%s", prompt.c_str());
    fflush(tty);

    if (haveTermios) {
        silent = original;
        silent.c_lflag &= ~ECHO;
        tcsetattr(fd, TCSAFLUSH, &silent);
    }

    char buffer[1024];
    bool gotLine = fgets(buffer, sizeof(buffer), tty) != NULL;

    if (haveTermios)
        tcsetattr(fd, TCSAFLUSH, &original);

    fprintf(tty, "\n");
    fclose(tty);

    if (!gotLine)
        throw VBException("no passphrase entered", eConfig);

    string passphrase = buffer;
    while (passphrase.length() && (passphrase.back() == '\n' || passphrase.back() == '\r'))
        passphrase.pop_back();

    memset(buffer, 0, sizeof(buffer));
    return passphrase;
}

