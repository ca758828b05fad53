
#ifndef RESTORE_H
#define RESTORE_H

#include <string>
#include <vector>
#include "BackupConfig.h"
#include "RemoteTransport.h"

using namespace std;


struct snapshotEntry {
    string name;
    string timestamp;
    long long size;
    bool hasChecksum;
};


// every host's snapshots at the remote, newest first
vector<snapshotEntry> listSnapshots(RemoteTransport &transport);

// selector is either an exact snapshot name or its 1-based position in the listing
string resolveSnapshot(const vector<snapshotEntry> &snapshots, string selector);

/*******************************************************************************
 * restoreSnapshot(config, transport, name, directory, passphrase)
 *
 * Download name into directory, check it against its .sha256 companion (if
 * the companion exists), decrypt and extract it there.  The encrypted and
 * decrypted archives are deleted as soon as they've been used, on success or
 * failure.  Throws VBException (eDownloadFailed, eChecksumFailed,
 * eDecryptionFailed, eExtractFailed).
 *******************************************************************************/
void restoreSnapshot(const BackupConfig &config, RemoteTransport &transport, string name, string directory, string passphrase);

/*******************************************************************************
 * verifySnapshot(config, transport, name, passphrase)
 *
 * Same checks as a restore but the plaintext is streamed straight into
 * "tar -tz" and never written to disk.  The temporary download directory is
 * always removed.
 *******************************************************************************/
void verifySnapshot(const BackupConfig &config, RemoteTransport &transport, string name, string passphrase);

string defaultRestoreDir();

// read a passphrase from the terminal with echo off; throws if there's no terminal
string promptPassphrase(string prompt);

#endif

