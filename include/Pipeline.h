
#ifndef PIPELINE_H
#define PIPELINE_H

#include <string>
#include <vector>
#include <time.h>
#include "BackupConfig.h"
#include "RemoteTransport.h"
#include "Notifier.h"
#include "exception.h"

using namespace std;


enum pipelineState { psInit, psLocked, psSpaceOk, psArchived, psEncrypted, psHashed, psUploaded, psPruned, psDone, psFailed };

struct pipelineResult {
    pipelineState state;
    pipelineState failedFrom;
    errorKind error;
    string message;
    string artifact;
    long long artifactSize;
    int uploadAttempts;
    vector<string> missingSources;
    vector<string> pruned;
    unsigned int retained;

    pipelineResult() : state(psInit), failedFrom(psInit), error(eGeneric), artifactSize(0), uploadAttempts(0), retained(0) {}
    bool success() const { return state == psDone; }
};


/*******************************************************************************
 * BackupPipeline
 *
 * One backup run:
 *   INIT -> LOCKED -> SPACE_OK -> ARCHIVED -> ENCRYPTED -> HASHED -> UPLOADED -> PRUNED -> DONE
 * with FAILED reachable from every state.  Whatever the outcome the scratch
 * directory is removed and the lock released before run() returns; the same
 * cleanup is done by the signal handler if the process is interrupted.
 *******************************************************************************/
class BackupPipeline {
    const BackupConfig &config;
    RemoteTransport &transport;
    Notifier &notifier;
    pipelineState state;

    void advance(pipelineState next);
    void checkLocalSpace(string directory);

public:
    BackupPipeline(const BackupConfig &cfg, RemoteTransport &remote, Notifier &notify);

    pipelineResult run(string hostname, time_t now);
    pipelineState getState() const { return state; }
};

string stateName(pipelineState state);

#endif

