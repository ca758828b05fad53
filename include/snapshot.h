
#ifndef SNAPSHOT_H
#define SNAPSHOT_H

#include <string>
#include <time.h>

using namespace std;

#define SNAPSHOT_PREFIX "backup-"
#define ARCHIVE_SUFFIX ".tar.gz"
#define ENCRYPTED_SUFFIX ".enc"
#define CHECKSUM_SUFFIX ".sha256"


// the three names one run produces, e.g.
//   backup-host1-20250101-120000.tar.gz
//   backup-host1-20250101-120000.tar.gz.enc
//   backup-host1-20250101-120000.tar.gz.enc.sha256
struct snapshotNames {
    string hostname;
    string timestamp;
    string archive;
    string encrypted;
    string checksum;
};


snapshotNames makeSnapshotNames(string hostname, time_t when);

string checksumNameFor(string encryptedName);

// any host's encrypted artifact
bool isSnapshotName(string name);

// this host's encrypted artifact; when is set from the embedded timestamp
bool parseSnapshotName(string name, string hostname, time_t &when);

time_t snapshotTime(string timestamp);

#endif

