
#ifndef RETENTION_H
#define RETENTION_H

#include <string>
#include <vector>
#include <time.h>
#include "RemoteTransport.h"

using namespace std;


struct pruneResult {
    bool listed;
    vector<string> deleted;
    vector<string> skipped;     // beyond keep but younger than minage
    unsigned int retained;

    pruneResult() : listed(false), retained(0) {}
};


/*******************************************************************************
 * pruneSnapshots(transport, hostname, keep, minAgeHours, now)
 *
 * Keep the newest `keep` of this host's snapshots and delete the rest along
 * with their checksum companions.  Names sort newest first because of the
 * zero-padded timestamp.  keep <= 0 turns pruning off.  Snapshots younger
 * than minAgeHours are never deleted.  Every failure here is a warning: the
 * new snapshot is already stored.
 *******************************************************************************/
pruneResult pruneSnapshots(RemoteTransport &transport, string hostname, int keep, int minAgeHours, time_t now);

#endif

