
#include <unistd.h>
#include <sys/stat.h>

#ifdef __APPLE__
#include <sys/mount.h>
#include <sys/param.h>
#else
#include <sys/statfs.h>
#endif

#include "Pipeline.h"
#include "BackupLock.h"
#include "snapshot.h"
#include "archive.h"
#include "cipher.h"
#include "upload.h"
#include "retention.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


string stateName(pipelineState state) {
    switch (state) {
        case psInit:        return "INIT";
        case psLocked:      return "LOCKED";
        case psSpaceOk:     return "SPACE_OK";
        case psArchived:    return "ARCHIVED";
        case psEncrypted:   return "ENCRYPTED";
        case psHashed:      return "HASHED";
        case psUploaded:    return "UPLOADED";
        case psPruned:      return "PRUNED";
        case psDone:        return "DONE";
        case psFailed:      return "FAILED";
    }

    return "UNKNOWN";
}


string errorKindName(errorKind kind) {
    switch (kind) {
        case eGeneric:              return "Error";
        case eConfig:               return "ConfigError";
        case eAlreadyRunning:       return "AlreadyRunning";
        case eInsufficientSpace:    return "InsufficientSpace";
        case eArchiveFailed:        return "ArchiveFailed";
        case eEncryptionFailed:     return "EncryptionFailed";
        case eChecksumFailed:       return "ChecksumFailed";
        case eUploadFailed:         return "UploadFailed";
        case eDownloadFailed:       return "DownloadFailed";
        case eDecryptionFailed:     return "DecryptionFailed";
        case eExtractFailed:        return "ExtractFailed";
    }

    return "Error";
}


// the run's scratch directory; removed when this goes out of scope
class scratchDir {
    string path;

public:
    void claim(string dir) {
        path = dir;
        GLOBALS.interruptDir = dir;
    }

    ~scratchDir() {
        if (path.length()) {
            DEBUG(D_backup) DFMT("removing " << path);

            if (!rmrf(path))
                log("warning: unable to fully remove scratch directory " + path);

            if (GLOBALS.interruptDir == path)
                GLOBALS.interruptDir = "";
        }
    }
};


BackupPipeline::BackupPipeline(const BackupConfig &cfg, RemoteTransport &remote, Notifier &notify) :
    config(cfg), transport(remote), notifier(notify), state(psInit) {}


void BackupPipeline::advance(pipelineState next) {
    DEBUG(D_backup) DFMT(stateName(state) << " -> " << stateName(next));
    state = next;
}


/*******************************************************************************
 * checkLocalSpace(directory)
 *
 * Throw VBException(eInsufficientSpace) if the filesystem holding directory
 * has less than minspace available.  If the filesystem can't be queried the
 * run goes ahead; the archive step will fail on its own if space runs out.
 *******************************************************************************/
void BackupPipeline::checkLocalSpace(string directory) {
    auto requiredSpace = config.settings[sMinSpace].svalue();

    DEBUG(D_backup) DFMT("required for backup: " << requiredSpace);
    if (!requiredSpace)
        return;

    struct statfs fs;
    if (!statfs(directory.c_str(), &fs)) {
        auto availableSpace = (uint64_t)fs.f_bsize * fs.f_bavail;

        DEBUG(D_backup)
        DFMT(directory << ": available=" << availableSpace << " (" << approximate(availableSpace)
             << "), required=" << requiredSpace << " (" << approximate(requiredSpace) << ")");

        if (availableSpace < requiredSpace)
            throw VBException("insufficient space in " + directory + " (" + approximate(availableSpace) +
                              " available, " + approximate(requiredSpace) + " required)", eInsufficientSpace);
    }
    else
        log("warning: unable to statfs() the filesystem that " + directory + " is on" + errtext());
}


pipelineResult BackupPipeline::run(string hostname, time_t now) {
    pipelineResult result;
    auto names = makeSnapshotNames(hostname, now);
    string scratch = config.settings[sTmpDir].value;
    BackupLock lock(config.settings[sLockFile].value);
    scratchDir scratchGuard;
    timer runTimer;

    state = psInit;
    result.artifact = names.encrypted;
    runTimer.start();
    log("backup started: " + names.encrypted + " -> " + transport.describe());

    try {
        lock.acquire(getpid(), now);
        advance(psLocked);

        // the scratch area is only ours to clear once the lock is held
        if (exists(scratch) && !rmrf(scratch))
            throw VBException("unable to clear scratch directory " + scratch);

        if (mkdirp(scratch, 0700))
            throw VBException("unable to create scratch directory " + scratch + errtext());

        scratchGuard.claim(scratch);

        checkLocalSpace(scratch);
        advance(psSpaceOk);
        notifier.runStarted(names.encrypted);

        string archivePath = slashConcat(scratch, names.archive);
        string encryptedPath = slashConcat(scratch, names.encrypted);
        string checksumPath = slashConcat(scratch, names.checksum);

        NOTQUIET && cout << "\t• archiving " << plural(config.sourceList().size(), "source") << endl;
        result.missingSources = buildArchive(config.settings[sTar].value, config.sourceList(), archivePath);
        log("archive created: " + names.archive + " (" + approximate(fileSize(archivePath)) + ")" +
            (result.missingSources.size() ? ", " + plural(result.missingSources.size(), "source") + " missing" : ""));
        advance(psArchived);

        NOTQUIET && cout << "\t• encrypting " << names.archive << endl;
        try {
            encryptFile(archivePath, encryptedPath, config.settings[sPassword].value, config.settings[sIterations].ivalue());
        }
        catch (VBException &) {
            unlink(archivePath.c_str());
            throw;
        }

        // no plaintext copy outlives this point
        unlink(archivePath.c_str());
        log("archive encrypted: " + names.encrypted);
        advance(psEncrypted);

        auto digest = writeChecksumFile(encryptedPath, checksumPath);
        log("checksum: " + digest);
        advance(psHashed);

        result.artifactSize = fileSize(encryptedPath);
        result.uploadAttempts = uploadArtifact(transport, encryptedPath, checksumPath,
            uploadPolicy(config.settings[sAttempts].ivalue(), config.settings[sRetryDelay].ivalue()));

        unlink(encryptedPath.c_str());
        unlink(checksumPath.c_str());
        advance(psUploaded);

        auto pruned = pruneSnapshots(transport, hostname, config.settings[sKeep].ivalue(), config.settings[sMinAge].ivalue(), now);
        result.pruned = pruned.deleted;
        result.retained = pruned.retained;
        if (pruned.deleted.size())
            log("pruned " + plural(pruned.deleted.size(), "old backup") + ", " + to_string(pruned.retained) + " retained");
        advance(psPruned);

        advance(psDone);
        runTimer.stop();

        string summary = names.encrypted + " (" + approximate(result.artifactSize) + ")";
        log("pipeline completed: " + summary + " in " + runTimer.elapsed());
        NOTQUIET && cout << GREEN << "backup complete: " << summary << RESET << endl;

        notifier.notify("backup completed\nfile: " + names.encrypted + "\nsize: " + approximate(result.artifactSize) +
                        "\nbackups on remote: " + to_string(result.retained) +
                        (result.missingSources.size() ? "\nmissing sources: " + to_string(result.missingSources.size()) : ""), true);
    }
    catch (VBException &e) {
        result.failedFrom = state;
        result.error = e.getKind();
        result.message = e.detail();
    }
    catch (std::exception &e) {
        result.failedFrom = state;
        result.error = eGeneric;
        result.message = e.what();
    }

    if (state != psDone) {
        advance(psFailed);

        log("error: backup failed in " + stateName(result.failedFrom) + " [" + errorKindName(result.error) + "]: " + result.message);
        SCREENERR("error: " << result.message);
        notifier.notify("backup failed: " + result.message, false);
    }

    result.state = state;
    return result;
}

