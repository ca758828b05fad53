
#ifndef RCLONETRANSPORT_H
#define RCLONETRANSPORT_H

#include <string>
#include "RemoteTransport.h"

using namespace std;


// RemoteTransport over the rclone CLI; destination is "remote:path"
class RcloneTransport : public RemoteTransport {
    string rcloneBinary;
    string destination;

    int rclone(vector<string> args, string &output, string &errors);

public:
    RcloneTransport(string binary, string remote);

    string remotePath(string name = "") const;

    bool upload(string localFile) override;
    bool download(string name, string localDir) override;
    bool list(vector<remoteObject> &objects) override;
    long long remoteSize(string name) override;
    bool remove(string name) override;
    string describe() override { return destination; }
};

#endif

