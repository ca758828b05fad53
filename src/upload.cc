
#include <unistd.h>

#include "upload.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"
#include "debug.h"


int uploadArtifact(RemoteTransport &transport, string artifact, string checksum, const uploadPolicy &policy) {
    auto name = pathSplit(artifact).file;
    auto localSize = fileSize(artifact);

    if (localSize < 0)
        throw VBException("unable to stat " + artifact + errtext(), eUploadFailed);

    for (int attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
        log("uploading " + name + " to " + transport.describe() + " (attempt " + to_string(attempt) + "/" + to_string(policy.maxAttempts) + ")");
        NOTQUIET && cout << "\t• uploading " << name << " (attempt " << attempt << "/" << policy.maxAttempts << ")" << endl;

        if (transport.upload(artifact)) {
            auto remoteSize = transport.remoteSize(name);
            DEBUG(D_transfer) DFMT(name << ": local " << localSize << ", remote " << remoteSize);

            if (remoteSize == localSize) {
                log("upload verified: " + name + " (" + approximate(localSize) + ")");

                // only now that the artifact is safely stored
                if (checksum.length() && !transport.upload(checksum))
                    log("warning: unable to upload checksum " + pathSplit(checksum).file);

                return attempt;
            }

            log("warning: size mismatch after upload of " + name + " (local " + to_string(localSize) +
                ", remote " + to_string(remoteSize) + ")");
        }
        else
            log("warning: upload attempt " + to_string(attempt) + " of " + name + " failed");

        if (attempt < policy.maxAttempts && policy.delaySecs > 0)
            sleep(policy.delaySecs);
    }

    throw VBException("upload of " + name + " failed after " + plural(policy.maxAttempts, "attempt"), eUploadFailed);
}

