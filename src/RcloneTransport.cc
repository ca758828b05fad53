
#include <pcre++.h>

#include "RcloneTransport.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"

using namespace pcrepp;


RcloneTransport::RcloneTransport(string binary, string remote) {
    rcloneBinary = binary;
    destination = remote;
}


// "remote:" and "remote:dir/" take the name directly, anything else gets a slash
string RcloneTransport::remotePath(string name) const {
    if (!name.length())
        return destination;

    if (destination.length() && (destination.back() == ':' || destination.back() == '/'))
        return destination + name;

    return destination + "/" + name;
}


int RcloneTransport::rclone(vector<string> args, string &output, string &errors) {
    args.insert(args.begin(), rcloneBinary);

    PipeExec proc(args, "rclone");
    int status = proc.capture(output);
    errors = proc.errorOutput();

    DEBUG(D_transfer) DFMT(args[1] << " exited " << status << (errors.length() ? "; stderr: " + errors : ""));
    return status;
}


bool RcloneTransport::upload(string localFile) {
    string output, errors;

    if (rclone({ "copy", localFile, destination, "--retries", "3", "--low-level-retries", "10" }, output, errors)) {
        log("warning: rclone copy of " + pathSplit(localFile).file + " to " + destination + " failed" + (errors.length() ? ": " + errors : ""));
        return false;
    }

    return true;
}


bool RcloneTransport::download(string name, string localDir) {
    string output, errors;

    if (rclone({ "copy", remotePath(name), localDir, "--retries", "3", "--low-level-retries", "10" }, output, errors)) {
        log("warning: rclone copy of " + remotePath(name) + " failed" + (errors.length() ? ": " + errors : ""));
        return false;
    }

    return exists(slashConcat(localDir, name));
}


bool RcloneTransport::list(vector<remoteObject> &objects) {
    string output, errors;

    if (rclone({ "lsf", destination, "--files-only", "--format", "sp", "--separator", ";" }, output, errors)) {
        log("warning: unable to list " + destination + (errors.length() ? ": " + errors : ""));
        return false;
    }

    // "<size>;<name>" per line
    Pcre lineRE("^(-?\\d+);(.+)$");
    for (auto &line: splitOnChar(output, '\n')) {
        if (lineRE.search(trimSpace(line)) && lineRE.matches() > 1)
            objects.push_back(remoteObject(lineRE.get_match(1), stoll(lineRE.get_match(0))));
    }

    DEBUG(D_transfer) DFMT(destination << ": " << plural(objects.size(), "object"));
    return true;
}


long long RcloneTransport::remoteSize(string name) {
    string output, errors;

    if (rclone({ "size", remotePath(name), "--json" }, output, errors))
        return -1;

    Pcre bytesRE("\"bytes\"\\s*:\\s*(\\d+)");
    Pcre countRE("\"count\"\\s*:\\s*(\\d+)");

    // a missing object reports count 0 rather than failing
    if (countRE.search(output) && countRE.matches() > 0 && stoll(countRE.get_match(0)) == 0)
        return -1;

    if (bytesRE.search(output) && bytesRE.matches() > 0)
        return stoll(bytesRE.get_match(0));

    return -1;
}


bool RcloneTransport::remove(string name) {
    string output, errors;

    if (rclone({ "deletefile", remotePath(name), "--drive-use-trash=false" }, output, errors)) {
        DEBUG(D_prune) DFMT("deletefile " << name << " failed: " << errors);
        return false;
    }

    return true;
}

