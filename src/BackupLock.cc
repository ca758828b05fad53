
#include <fstream>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <string.h>

#include "BackupLock.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"
#include "debug.h"


BackupLock::BackupLock(string filename) {
    lockFilename = filename;
    held = false;
}


BackupLock::~BackupLock() {
    if (held)
        release();
}


bool BackupLock::pidIsAlive(pid_t pid) {
    if (pid <= 0)
        return false;

    // EPERM means it exists but belongs to someone else
    return (!kill(pid, 0) || errno == EPERM);
}


// {0, 0} if there's no lock or it can't be parsed
tuple<pid_t, time_t> BackupLock::readLock(string filename) {
    ifstream lockFile;
    lockFile.open(filename);

    if (lockFile.is_open()) {
        string temp;
        pid_t pid = 0;
        time_t startTime = 0;

        try {
            if (lockFile >> temp)
                pid = stoi(temp);

            if (lockFile >> temp)
                startTime = stol(temp);
        }
        catch (std::exception &e) {
            pid = 0;
        }

        lockFile.close();
        return {pid, startTime};
    }

    return {0, 0};
}


tuple<pid_t, time_t> BackupLock::getLockPID() const {
    return readLock(lockFilename);
}


// a lock without a readable pid is given LOCK_GRACE_SECONDS for its writer to finish
bool BackupLock::holderIsLive(string filename, pid_t lockPid) {
    if (lockPid)
        return pidIsAlive(lockPid);

    struct stat statData;
    if (stat(filename.c_str(), &statData))
        return false;

    return time(NULL) - statData.st_mtime < LOCK_GRACE_SECONDS;
}


/*
 * The pid is written to a private temp file which is then hard linked onto
 * the lock path, so the lock never exists without its contents.
 */
bool BackupLock::createLock(pid_t pid, time_t startTime) {
    string tempTemplate = lockFilename + ".XXXXXX";
    char *tempName = strdup(tempTemplate.c_str());
    int fd = mkstemp(tempName);

    if (fd < 0) {
        free(tempName);
        throw VBException(log("error: unable to create lock " + lockFilename + errtext()), eAlreadyRunning);
    }

    string tempFilename = tempName;
    free(tempName);

    string data = to_string(pid) + "\n" + to_string(startTime) + "\n";
    bool written = write(fd, data.c_str(), data.length()) == (ssize_t)data.length();
    fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    close(fd);

    if (!written) {
        unlink(tempFilename.c_str());
        throw VBException(log("error: unable to write lock " + lockFilename + errtext()), eAlreadyRunning);
    }

    int result = link(tempFilename.c_str(), lockFilename.c_str());
    int linkErrno = errno;
    unlink(tempFilename.c_str());

    if (result) {
        if (linkErrno == EEXIST)
            return false;

        errno = linkErrno;
        throw VBException(log("error: unable to create lock " + lockFilename + errtext()), eAlreadyRunning);
    }

    return true;
}


static VBException runningError(pid_t lockPid, time_t lockTime) {
    if (!lockPid)
        return VBException("another backup is already running (lock is being written)", eAlreadyRunning);

    return VBException("another backup is already running (pid " + to_string(lockPid) + ", started " +
                       timeString(lockTime, "%Y-%m-%d %H:%M:%S") + ")", eAlreadyRunning);
}


/*******************************************************************************
 * acquire(pid, startTime)
 *
 * Take the lock for pid or throw VBException(eAlreadyRunning) if another live
 * process holds it.  A stale lock is first renamed aside and re-read; if a
 * racing run replaced it in the meantime the fresh lock is put back and we
 * refuse, so two runs taking over the same stale lock can't both win.
 *******************************************************************************/
void BackupLock::acquire(pid_t pid, time_t startTime) {
    auto lockDir = pathSplit(lockFilename).dir;
    if (lockDir.length())
        mkdirp(lockDir, 0755);

    string staleFilename = lockFilename + ".stale." + to_string(getpid());

    for (int attempt = 0; attempt < 5; ++attempt) {
        if (createLock(pid, startTime)) {
            held = true;
            GLOBALS.interruptLock = lockFilename;
            DEBUG(D_lock) DFMT("acquired " << lockFilename << " for pid " << pid);
            return;
        }

        auto [lockPid, lockTime] = getLockPID();

        if (holderIsLive(lockFilename, lockPid))
            throw runningError(lockPid, lockTime);

        if (rename(lockFilename.c_str(), staleFilename.c_str())) {
            if (errno == ENOENT)
                continue;

            throw VBException(log("error: unable to remove stale lock " + lockFilename + errtext()), eAlreadyRunning);
        }

        auto [movedPid, movedTime] = readLock(staleFilename);

        if (holderIsLive(staleFilename, movedPid)) {
            DEBUG(D_lock) DFMT("lock " << lockFilename << " was replaced by pid " << movedPid << "; restoring it");

            if (link(staleFilename.c_str(), lockFilename.c_str()) && errno != EEXIST)
                log("error: unable to restore lock " + lockFilename + errtext());

            unlink(staleFilename.c_str());
            throw runningError(movedPid, movedTime);
        }

        log("removing stale lock " + lockFilename + (movedPid ? " (pid " + to_string(movedPid) + ")" : " (unreadable)"));
        unlink(staleFilename.c_str());
    }

    throw VBException("unable to acquire " + lockFilename + " (contended)", eAlreadyRunning);
}


void BackupLock::release() {
    DEBUG(D_lock) DFMT("releasing " << lockFilename);

    unlink(lockFilename.c_str());
    held = false;

    if (GLOBALS.interruptLock == lockFilename)
        GLOBALS.interruptLock = "";
}

