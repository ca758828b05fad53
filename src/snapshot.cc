
#include <string.h>
#include <pcre++.h>

#include "snapshot.h"
#include "util_generic.h"
#include "globals.h"

using namespace pcrepp;


snapshotNames makeSnapshotNames(string hostname, time_t when) {
    snapshotNames names;

    names.hostname = hostname;
    names.timestamp = timeString(when, SNAPSHOT_TIME_FORMAT);
    names.archive = SNAPSHOT_PREFIX + hostname + "-" + names.timestamp + ARCHIVE_SUFFIX;
    names.encrypted = names.archive + ENCRYPTED_SUFFIX;
    names.checksum = checksumNameFor(names.encrypted);

    return names;
}


string checksumNameFor(string encryptedName) {
    return encryptedName + CHECKSUM_SUFFIX;
}


bool isSnapshotName(string name) {
    Pcre anyHost(string("^") + SNAPSHOT_PREFIX + ".+-" + SNAPSHOT_TIME_REGEX + "\\.tar\\.gz\\.enc$");
    return anyHost.search(name);
}


bool parseSnapshotName(string name, string hostname, time_t &when) {
    Pcre thisHost(string("^") + SNAPSHOT_PREFIX + escapeRegex(hostname) + "-" + SNAPSHOT_TIME_REGEX + "\\.tar\\.gz\\.enc$");

    if (thisHost.search(name) && thisHost.matches() > 0) {
        when = snapshotTime(thisHost.get_match(0));
        return true;
    }

    return false;
}


// YYYYMMDD-HHMMSS (local time) to epoch; 0 if it doesn't parse
time_t snapshotTime(string timestamp) {
    struct tm t;
    memset(&t, 0, sizeof(t));

    if (!strptime(timestamp.c_str(), SNAPSHOT_TIME_FORMAT, &t))
        return 0;

    t.tm_isdst = -1;
    return mktime(&t);
}

