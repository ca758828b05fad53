
#include <algorithm>

#include "retention.h"
#include "snapshot.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


pruneResult pruneSnapshots(RemoteTransport &transport, string hostname, int keep, int minAgeHours, time_t now) {
    pruneResult result;
    vector<remoteObject> objects;
    vector<pair<string, time_t>> snapshots;

    if (!transport.list(objects)) {
        log("warning: unable to list " + transport.describe() + "; skipping pruning");
        return result;
    }

    result.listed = true;

    for (auto &object: objects) {
        time_t when;
        if (parseSnapshotName(object.name, hostname, when))
            snapshots.push_back({object.name, when});
    }

    sort(snapshots.begin(), snapshots.end(), [](const pair<string, time_t> &a, const pair<string, time_t> &b) {
        return a.first > b.first;
    });

    DEBUG(D_prune) DFMT(plural(snapshots.size(), "snapshot") << " for " << hostname << ", keep " << keep);

    if (keep <= 0) {
        DEBUG(D_prune) DFMT("pruning disabled");
        result.retained = snapshots.size();
        return result;
    }

    for (size_t index = 0; index < snapshots.size(); ++index) {
        auto &[name, when] = snapshots[index];

        if (index < (size_t)keep) {
            ++result.retained;
            continue;
        }

        if (minAgeHours > 0 && now - when < (time_t)minAgeHours * SECS_PER_HOUR) {
            log("not pruning " + name + " (younger than " + plural(minAgeHours, "hour") + ")");
            result.skipped.push_back(name);
            ++result.retained;
            continue;
        }

        log("pruning old backup: " + name);
        NOTQUIET && cout << "\t• pruning " << name << endl;

        if (!transport.remove(name)) {
            log("warning: unable to delete " + name + " from " + transport.describe());
            ++result.retained;
            continue;
        }

        result.deleted.push_back(name);

        auto companion = checksumNameFor(name);
        if (!transport.remove(companion))
            log("warning: unable to delete " + companion + " from " + transport.describe());
    }

    return result;
}

