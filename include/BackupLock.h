
#ifndef BACKUPLOCK_H
#define BACKUPLOCK_H

#include <string>
#include <tuple>
#include <sys/types.h>

#define LOCK_GRACE_SECONDS  10

using namespace std;


/*******************************************************************************
 * BackupLock
 *
 * Single-run guard backed by a lock file holding the owner's pid and start
 * time.  acquire() refuses (VBException eAlreadyRunning) while the recorded
 * pid is alive; a lock left behind by a dead process is considered stale and
 * replaced.  A lock with no readable pid counts as held until it is
 * LOCK_GRACE_SECONDS old.  The lock is released by release(), by the destructor, or by
 * the SIGINT/SIGTERM handler via GLOBALS.interruptLock.
 *******************************************************************************/
class BackupLock {
    string lockFilename;
    bool held;

    bool createLock(pid_t pid, time_t startTime);
    static tuple<pid_t, time_t> readLock(string filename);
    static bool holderIsLive(string filename, pid_t lockPid);

public:
    BackupLock(string filename);
    ~BackupLock();

    void acquire(pid_t pid, time_t startTime);
    void release();
    bool isHeld() const { return held; }

    tuple<pid_t, time_t> getLockPID() const;
    static bool pidIsAlive(pid_t pid);
};

#endif

