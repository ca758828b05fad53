#ifndef FAKETRANSPORT_H
#define FAKETRANSPORT_H

#include <dirent.h>
#include <string.h>
#include <unistd.h>

#include <fstream>
#include <set>
#include <string>
#include <vector>

#include "RemoteTransport.h"
#include "snapshot.h"
#include "util_generic.h"

using namespace std;

/*******************************************************************************
 * FakeTransport
 *
 * A RemoteTransport over a local directory.  The public counters let a test
 * make the next N uploads fail outright or land short (so the size check
 * fails), make listing or particular deletes fail, and see every call made.
 *******************************************************************************/
class FakeTransport : public RemoteTransport {
    bool copyFile(string from, string to) {
        ifstream in(from, ios::binary);
        if (!in.is_open())
            return false;

        ofstream out(to, ios::binary | ios::trunc);
        out << in.rdbuf();
        return out.good();
    }

public:
    string root;
    int failUploads;
    int shortUploads;
    bool failChecksumUploads;
    bool failList;
    set<string> failRemoves;
    vector<string> calls;

    FakeTransport(string dir) : root(dir), failUploads(0), shortUploads(0), failChecksumUploads(false), failList(false) {
        mkdirp(root);
    }

    string path(string name) { return slashConcat(root, name); }
    bool has(string name) { return exists(path(name)); }
    void put(string name, string contents) {
        ofstream out(path(name), ios::binary | ios::trunc);
        out << contents;
    }

    bool upload(string localFile) {
        auto name = pathSplit(localFile).file;
        bool isChecksum = name.length() > strlen(CHECKSUM_SUFFIX) &&
            name.substr(name.length() - strlen(CHECKSUM_SUFFIX)) == CHECKSUM_SUFFIX;

        calls.push_back("upload " + name);

        if (isChecksum ? failChecksumUploads : failUploads > 0) {
            if (!isChecksum)
                --failUploads;
            return false;
        }

        if (!copyFile(localFile, path(name)))
            return false;

        if (!isChecksum && shortUploads > 0) {
            --shortUploads;
            if (truncate(path(name).c_str(), fileSize(localFile) / 2))
                return false;
        }

        return true;
    }

    bool download(string name, string localDir) {
        calls.push_back("download " + name);
        return copyFile(path(name), slashConcat(localDir, name));
    }

    bool list(vector<remoteObject> &objects) {
        calls.push_back("list");
        objects.clear();

        if (failList)
            return false;

        DIR *dir = opendir(root.c_str());
        if (dir == NULL)
            return false;

        struct dirent *entry;
        while ((entry = readdir(dir)) != NULL) {
            string name = entry->d_name;
            if (name != "." && name != "..")
                objects.push_back(remoteObject(name, fileSize(path(name))));
        }

        closedir(dir);
        return true;
    }

    long long remoteSize(string name) {
        calls.push_back("size " + name);
        return fileSize(path(name));
    }

    bool remove(string name) {
        calls.push_back("remove " + name);

        if (failRemoves.count(name))
            return false;

        return unlink(path(name).c_str()) == 0;
    }

    string describe() { return "fake:" + root; }
};

#endif

