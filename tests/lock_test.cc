#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <utime.h>

#include <cassert>
#include <iostream>

#include "BackupLock.h"
#include "exception.h"
#include "testing.h"

namespace {

string workDir;

// pid of a process that has already exited and been reaped
pid_t deadPid() {
    pid_t child = fork();
    if (!child)
        _exit(0);

    int status;
    waitpid(child, &status, 0);
    return child;
}

void TestAcquireAndRelease() {
    string lockFile = slashConcat(workDir, "run/acquire.lock");
    BackupLock lock(lockFile);

    lock.acquire(getpid(), 1700000000);
    assert(lock.isHeld());
    assert(exists(lockFile));
    assert(GLOBALS.interruptLock == lockFile);

    auto [pid, started] = lock.getLockPID();
    assert(pid == getpid());
    assert(started == 1700000000);

    lock.release();
    assert(!lock.isHeld());
    assert(!exists(lockFile));
    assert(GLOBALS.interruptLock.empty());
}

void TestLiveHolderRefused() {
    string lockFile = slashConcat(workDir, "live.lock");
    writeFile(lockFile, to_string(getppid()) + "\n" + to_string(time(NULL)) + "\n");

    BackupLock lock(lockFile);
    bool refused = false;

    try {
        lock.acquire(getpid(), time(NULL));
    }
    catch (VBException &e) {
        refused = e.getKind() == eAlreadyRunning;
    }

    assert(refused);
    assert(!lock.isHeld());
    assert(exists(lockFile));
    assert(readFile(lockFile).find(to_string(getppid())) == 0);
}

void TestOwnPidStillCountsAsRunning() {
    string lockFile = slashConcat(workDir, "self.lock");
    BackupLock first(lockFile);
    BackupLock second(lockFile);
    bool refused = false;

    first.acquire(getpid(), time(NULL));

    try {
        second.acquire(getpid(), time(NULL));
    }
    catch (VBException &e) {
        refused = e.getKind() == eAlreadyRunning;
    }

    assert(refused);
    assert(first.isHeld());
}

void TestStaleLockReplaced() {
    string lockFile = slashConcat(workDir, "stale.lock");
    auto dead = deadPid();
    writeFile(lockFile, to_string(dead) + "\n0\n");

    BackupLock lock(lockFile);
    lock.acquire(getpid(), time(NULL));

    auto [pid, started] = lock.getLockPID();
    assert(pid == getpid());
    assert(started > 0);
    assert(fileContains(GLOBALS.logFile, "removing stale lock " + lockFile));
    assert(!exists(lockFile + ".stale." + to_string(getpid())));
}

void TestUnreadableLockIsStale() {
    string lockFile = slashConcat(workDir, "garbage.lock");
    writeFile(lockFile, "not a pid\n");

    struct utimbuf old;
    old.actime = old.modtime = time(NULL) - LOCK_GRACE_SECONDS - 60;
    assert(!utime(lockFile.c_str(), &old));

    BackupLock lock(lockFile);
    lock.acquire(getpid(), time(NULL));
    assert(lock.isHeld());
    assert(get<0>(lock.getLockPID()) == getpid());
}

// another process has just created the lock and not yet written its pid
void TestEmptyLockBeingWrittenRefused() {
    string lockFile = slashConcat(workDir, "fresh.lock");
    int ready[2], finish[2];
    assert(!pipe(ready) && !pipe(finish));

    pid_t child = fork();
    if (!child) {
        close(ready[0]);
        close(finish[1]);

        int fd = open(lockFile.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
        char c = fd < 0 ? 'n' : 'y';
        if (write(ready[1], &c, 1) != 1)
            _exit(1);

        if (read(finish[0], &c, 1) < 0)
            _exit(1);
        _exit(0);
    }

    close(ready[1]);
    close(finish[0]);

    char c = 0;
    assert(read(ready[0], &c, 1) == 1 && c == 'y');

    BackupLock lock(lockFile);
    bool refused = false;

    try {
        lock.acquire(getpid(), time(NULL));
    }
    catch (VBException &e) {
        refused = e.getKind() == eAlreadyRunning;
    }

    assert(refused);
    assert(!lock.isHeld());
    assert(exists(lockFile));
    assert(readFile(lockFile).empty());

    close(finish[1]);
    close(ready[0]);

    int status;
    waitpid(child, &status, 0);
}

} // namespace

int main() {
    workDir = makeTempDir("lock");
    setupTestGlobals(slashConcat(workDir, "run.log"));

    TestAcquireAndRelease();
    TestLiveHolderRefused();
    TestOwnPidStillCountsAsRunning();
    TestStaleLockReplaced();
    TestUnreadableLockIsStale();
    TestEmptyLockBeingWrittenRefused();
    TestDestructorReleases();

    rmrf(workDir);
    std::cout << "vpsbackup_lock: pass\n";
    return 0;
}

