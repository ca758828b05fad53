
#ifndef ARCHIVE_H
#define ARCHIVE_H

#include <string>
#include <vector>

using namespace std;


/*******************************************************************************
 * buildArchive(tarBinary, sources, archivePath)
 *
 * Pack every existing source into one gzip'd tar at archivePath.  Each source
 * is stored under its own leaf name (/etc/nginx -> nginx/...).  Sources that
 * don't exist are logged as warnings and skipped; they're returned so the
 * caller can report them.  tar's "file changed as we read it" exit (1) is
 * tolerated; anything worse throws VBException(eArchiveFailed).
 *******************************************************************************/
vector<string> buildArchive(string tarBinary, const vector<string> &sources, string archivePath);

// tar -xzf archivePath -C directory
void extractArchive(string tarBinary, string archivePath, string directory);

#endif

