#include <string.h>
#include <unistd.h>

#include <cassert>
#include <iostream>

#include "BackupConfig.h"
#include "FakeTransport.h"
#include "Notifier.h"
#include "Pipeline.h"
#include "cipher.h"
#include "exception.h"
#include "restore.h"
#include "snapshot.h"
#include "testing.h"

namespace {

string workDir;
const string passphrase = "pipeline test passphrase";
const string expectedName = "backup-host1-20250101-120000.tar.gz.enc";

class RecordingNotifier : public Notifier {
public:
    vector<pair<string, bool>> messages;

    RecordingNotifier(const BackupConfig &cfg) : Notifier(cfg, "host1") {}

    int notify(string message, bool success) {
        messages.push_back({message, success});
        return 1;
    }
};

time_t runTime() {
    struct tm t;
    memset(&t, 0, sizeof(t));
    t.tm_year = 2025 - 1900;
    t.tm_mon = 0;
    t.tm_mday = 1;
    t.tm_hour = 12;
    t.tm_isdst = -1;
    return mktime(&t);
}

// a source tree named "site" with a nested file, under its own directory
string makeSource(string dir) {
    string site = slashConcat(dir, "site");
    mkdirp(slashConcat(site, "conf.d"));
    writeFile(slashConcat(site, "index.html"), "<h1>hello</h1>\n");
    writeFile(slashConcat(site, "conf.d/app.conf"), "listen 443;\n");
    return site;
}

BackupConfig makeConfig(string dir, string sources) {
    BackupConfig config;

    config.settings[sSources].value = sources;
    config.settings[sRemote].value = "fake:";
    config.settings[sPassword].value = passphrase;
    config.settings[sTmpDir].value = slashConcat(dir, "scratch");
    config.settings[sLockFile].value = slashConcat(dir, "vps-backup.lock");
    config.settings[sMinSpace].value = "1K";
    config.settings[sRetryDelay].value = "0";
    config.settings[sIterations].value = "1000";
    config.settings[sHostname].value = "host1";
    config.settings[sNotifyStart].value = "true";

    GLOBALS.logFile = slashConcat(dir, "run.log");
    return config;
}

string caseDir(string name) {
    string dir = slashConcat(workDir, name);
    mkdirp(dir);
    return dir;
}

void TestSuccessfulRunWithMissingSource() {
    string dir = caseDir("success");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site + "|/does/not/exist");
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    auto result = pipeline.run("host1", runTime());

    assert(result.success());
    assert(result.state == psDone);
    assert(result.artifact == expectedName);
    assert(result.uploadAttempts == 1);
    assert(result.missingSources.size() == 1);
    assert(result.missingSources[0] == "/does/not/exist");
    assert(result.artifactSize == fileSize(remote.path(expectedName)));

    assert(remote.has(expectedName));
    assert(readChecksumFile(remote.path(checksumNameFor(expectedName))) == sha256File(remote.path(expectedName)));

    assert(fileContains(GLOBALS.logFile, "warning: backup source not found - /does/not/exist"));
    assert(fileContains(GLOBALS.logFile, "pipeline completed: " + expectedName));
    assert(!exists(config.settings[sTmpDir].value));
    assert(!exists(config.settings[sLockFile].value));
    assert(GLOBALS.interruptDir.empty());
    assert(GLOBALS.interruptLock.empty());

    // tar's stderr capture doesn't outlive it
    assert(!exists(slashConcat(TMP_OUTPUT_DIR, "pid_" + to_string(getpid()))));

    assert(notifier.messages.size() == 2);
    assert(notifier.messages[0].first.find("started") != string::npos);
    assert(notifier.messages[1].second);
    assert(notifier.messages[1].first.find(expectedName) != string::npos);
}

void TestRestoreAndVerify() {
    string dir = caseDir("restore");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site);
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    assert(pipeline.run("host1", runTime()).success());

    auto snapshots = listSnapshots(remote);
    assert(snapshots.size() == 1);
    assert(snapshots[0].hasChecksum);
    assert(resolveSnapshot(snapshots, "1") == expectedName);
    assert(resolveSnapshot(snapshots, expectedName) == expectedName);

    string target = slashConcat(dir, "restored");
    restoreSnapshot(config, remote, expectedName, target, passphrase);

    // restored under the source's leaf name, nothing else left behind
    assert(readFile(slashConcat(target, "site/index.html")) == "<h1>hello</h1>\n");
    assert(readFile(slashConcat(target, "site/conf.d/app.conf")) == "listen 443;\n");
    assert(!exists(slashConcat(target, expectedName)));
    assert(!exists(slashConcat(target, "backup-host1-20250101-120000.tar.gz")));

    // the download directory sits beside the configured scratch directory, whatever TMPDIR says
    string verifyBase = slashConcat(dir, "verifybase");
    config.settings[sTmpDir].value = slashConcat(verifyBase, "scratch");
    setenv("TMPDIR", slashConcat(dir, "no/such/dir").c_str(), 1);

    verifySnapshot(config, remote, expectedName, passphrase);
    unsetenv("TMPDIR");

    assert(entryCount(verifyBase) == 0);
    assert(!exists(slashConcat(dir, "no")));

    bool rejected = false;
    try {
        verifySnapshot(config, remote, expectedName, "not the passphrase");
    }
    catch (VBException &e) {
        rejected = e.getKind() == eDecryptionFailed;
    }
    assert(rejected);
    assert(GLOBALS.interruptDir.empty());
}

void TestCorruptedSnapshotDetected() {
    string dir = caseDir("corrupt");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site);
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    assert(pipeline.run("host1", runTime()).success());

    auto data = readFile(remote.path(expectedName));
    data[data.length() / 2] ^= 0x55;
    remote.put(expectedName, data);

    bool rejected = false;
    try {
        restoreSnapshot(config, remote, expectedName, slashConcat(dir, "restored"), passphrase);
    }
    catch (VBException &e) {
        rejected = e.getKind() == eChecksumFailed;
    }

    assert(rejected);
    assert(!exists(slashConcat(dir, "restored/site")));
}

void TestLockHeldByAnotherRun() {
    string dir = caseDir("locked");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site);
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    // the other run's lock and its scratch work in progress
    string lockFile = config.settings[sLockFile].value;
    writeFile(lockFile, to_string(getppid()) + "\n" + to_string(time(NULL)) + "\n");
    mkdirp(config.settings[sTmpDir].value);
    string theirWork = slashConcat(config.settings[sTmpDir].value, "in-progress");
    writeFile(theirWork, "busy");

    auto result = pipeline.run("host1", runTime());

    assert(result.state == psFailed);
    assert(result.failedFrom == psInit);
    assert(result.error == eAlreadyRunning);
    assert(exists(lockFile));
    assert(exists(theirWork));
    assert(remote.calls.empty());
    assert(notifier.messages.size() == 1);
    assert(!notifier.messages[0].second);
}

void TestInsufficientSpace() {
    string dir = caseDir("space");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site);
    config.settings[sMinSpace].value = "900P";
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    auto result = pipeline.run("host1", runTime());

    assert(result.state == psFailed);
    assert(result.failedFrom == psLocked);
    assert(result.error == eInsufficientSpace);
    assert(!exists(config.settings[sTmpDir].value));
    assert(!exists(config.settings[sLockFile].value));
    assert(fileContains(GLOBALS.logFile, "backup failed in LOCKED [InsufficientSpace]"));
}

void TestArchiveFailureCleansUp() {
    string dir = caseDir("tarfail");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site);
    config.settings[sTar].value = "false";
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    auto result = pipeline.run("host1", runTime());

    assert(result.state == psFailed);
    assert(result.failedFrom == psSpaceOk);
    assert(result.error == eArchiveFailed);
    assert(!exists(config.settings[sTmpDir].value));
    assert(!exists(config.settings[sLockFile].value));
    assert(remote.calls.empty());
    assert(fileContains(GLOBALS.logFile, "backup failed in SPACE_OK [ArchiveFailed]"));

    assert(notifier.messages.size() == 2);
    assert(!notifier.messages[1].second);
    assert(notifier.messages[1].first.find("backup failed: archive creation failed") == 0);
}

void TestEncryptionFailureLeavesNoPlaintext() {
    string dir = caseDir("cryptfail");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site);
    config.settings[sPassword].value = "";
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    auto result = pipeline.run("host1", runTime());
    string scratch = config.settings[sTmpDir].value;

    assert(result.state == psFailed);
    assert(result.failedFrom == psArchived);
    assert(result.error == eEncryptionFailed);
    assert(!exists(slashConcat(scratch, "backup-host1-20250101-120000.tar.gz")));
    assert(!exists(scratch));
    assert(!exists(config.settings[sLockFile].value));
    assert(remote.calls.empty());
    assert(fileContains(GLOBALS.logFile, "backup failed in ARCHIVED [EncryptionFailed]"));
    assert(!notifier.messages.back().second);
}

void TestNoSourcesStillCompletes() {
    string dir = caseDir("empty");
    auto config = makeConfig(dir, "/does/not/exist|/nor/this");
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    auto result = pipeline.run("host1", runTime());

    assert(result.success());
    assert(result.missingSources.size() == 2);
    assert(remote.has(expectedName));
}

void TestUploadFailureCleansUp() {
    string dir = caseDir("upload");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site);
    config.settings[sAttempts].value = "2";
    FakeTransport remote(slashConcat(dir, "remote"));
    remote.failUploads = 10;
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    auto result = pipeline.run("host1", runTime());

    assert(result.state == psFailed);
    assert(result.failedFrom == psHashed);
    assert(result.error == eUploadFailed);
    assert(remote.failUploads == 8);
    assert(!remote.has(expectedName));
    assert(!exists(config.settings[sTmpDir].value));
    assert(!exists(config.settings[sLockFile].value));
    assert(!notifier.messages.back().second);
}

void TestRunPrunesOlderSnapshots() {
    string dir = caseDir("prune");
    auto site = makeSource(dir);
    auto config = makeConfig(dir, site);
    config.settings[sKeep].value = "2";
    FakeTransport remote(slashConcat(dir, "remote"));
    RecordingNotifier notifier(config);
    BackupPipeline pipeline(config, remote, notifier);

    vector<string> older;
    for (int day = 1; day <= 3; ++day) {
        auto names = makeSnapshotNames("host1", runTime() - day * 86400);
        remote.put(names.encrypted, "old");
        remote.put(names.checksum, "old\n");
        older.push_back(names.encrypted);
    }

    auto result = pipeline.run("host1", runTime());

    assert(result.success());
    assert(result.retained == 2);
    assert(result.pruned.size() == 2);
    assert(remote.has(expectedName));
    assert(remote.has(older[0]));
    assert(!remote.has(older[1]) && !remote.has(checksumNameFor(older[1])));
    assert(!remote.has(older[2]));
}

} // namespace

int main() {
    workDir = makeTempDir("pipeline");
    setupTestGlobals(slashConcat(workDir, "run.log"));

    TestSuccessfulRunWithMissingSource();
    TestRestoreAndVerify();
    TestCorruptedSnapshotDetected();
    TestLockHeldByAnotherRun();
    TestInsufficientSpace();
    TestArchiveFailureCleansUp();
    TestEncryptionFailureLeavesNoPlaintext();
    TestNoSourcesStillCompletes();
    TestUploadFailureCleansUp();
    TestRunPrunesOlderSnapshots();

    rmrf(workDir);
    std::cout << "vpsbackup_pipeline: pass\n";
    return 0;
}

