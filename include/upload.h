
#ifndef UPLOAD_H
#define UPLOAD_H

#include <string>
#include "RemoteTransport.h"

using namespace std;


struct uploadPolicy {
    int maxAttempts;
    int delaySecs;

    uploadPolicy(int attempts = 3, int delay = 5) : maxAttempts(attempts), delaySecs(delay) {}
};


/*******************************************************************************
 * uploadArtifact(transport, artifact, checksum, policy)
 *
 * Copy artifact to the remote and confirm the remote size matches the local
 * size, retrying up to policy.maxAttempts times with policy.delaySecs between
 * attempts.  A copy whose size doesn't match counts as a failed attempt.
 * Once the artifact is verified the checksum companion is copied; that copy is
 * best-effort and only logged if it fails.  Returns the attempts used or
 * throws VBException(eUploadFailed) when every attempt failed.
 *******************************************************************************/
int uploadArtifact(RemoteTransport &transport, string artifact, string checksum, const uploadPolicy &policy);

#endif

