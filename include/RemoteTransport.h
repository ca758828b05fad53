
#ifndef REMOTETRANSPORT_H
#define REMOTETRANSPORT_H

#include <string>
#include <vector>

using namespace std;


struct remoteObject {
    string name;
    long long size;

    remoteObject(string n = "", long long s = -1) : name(n), size(s) {}
};


/*******************************************************************************
 * RemoteTransport
 *
 * The remote object store as the pipeline sees it: flat objects under one
 * destination, addressed by name.  Implementations return false (or -1 for
 * sizes) on failure and leave the policy (retry, warn, abort) to the caller.
 *******************************************************************************/
class RemoteTransport {
public:
    virtual ~RemoteTransport() {}

    // copy a local file to the destination under its own leaf name
    virtual bool upload(string localFile) = 0;

    // copy a remote object into localDir
    virtual bool download(string name, string localDir) = 0;

    // every object at the destination with its size
    virtual bool list(vector<remoteObject> &objects) = 0;

    // size of one remote object; -1 if unknown or missing
    virtual long long remoteSize(string name) = 0;

    virtual bool remove(string name) = 0;

    virtual string describe() = 0;
};

#endif

