
#include <unistd.h>

#include "archive.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"
#include "debug.h"


vector<string> buildArchive(string tarBinary, const vector<string> &sources, string archivePath) {
    vector<string> missing;
    vector<string> command = { tarBinary, "--ignore-failed-read", "--warning=no-file-changed", "-czf", archivePath };
    unsigned int included = 0;

    for (auto source: sources) {
        // strip trailing slashes so the leaf name is the directory itself
        while (source.length() > 1 && source.back() == '/')
            source.pop_back();

        if (!exists(source)) {
            log("warning: backup source not found - " + source);
            NOTQUIET && cerr << YELLOW << "warning: backup source not found - " << source << RESET << endl;
            missing.push_back(source);
            continue;
        }

        if (source == "/") {
            command.insert(command.end(), { "-C", "/", "." });
        }
        else {
            auto parts = pathSplit(source);
            command.insert(command.end(), { "-C", parts.dir, parts.file });
        }

        DEBUG(D_backup) DFMT("including " << source);
        ++included;
    }

    // nothing to pack still yields a valid (empty) archive
    if (!included)
        command.insert(command.end(), { "-T", "/dev/null" });

    PipeExec tar(command, "tar");
    tar.execute(false, poDiscard);
    int status = tar.wait();

    if (status != 0 && status != 1) {
        string errors = tar.errorOutput();
        unlink(archivePath.c_str());
        throw VBException("archive creation failed (tar exit " + to_string(status) + ")" + (errors.length() ? ": " + errors : ""), eArchiveFailed);
    }

    if (status == 1)
        log("warning: some files changed while being archived");

    if (!exists(archivePath))
        throw VBException("archive creation failed: " + archivePath + " was not created", eArchiveFailed);

    DEBUG(D_backup) DFMT(archivePath << " created with " << plural(included, "source") << " (" << approximate(fileSize(archivePath)) << ")");
    return missing;
}


void extractArchive(string tarBinary, string archivePath, string directory) {
    if (mkdirp(directory, 0755))
        throw VBException("unable to create " + directory + errtext(), eExtractFailed);

    PipeExec tar({ tarBinary, "-xzf", archivePath, "-C", directory }, "tar");
    tar.execute(false, poDiscard);
    int status = tar.wait();

    if (status) {
        string errors = tar.errorOutput();
        throw VBException("extraction failed (tar exit " + to_string(status) + ")" + (errors.length() ? ": " + errors : ""), eExtractFailed);
    }
}

