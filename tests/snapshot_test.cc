#include <string.h>

#include <cassert>
#include <iostream>

#include "snapshot.h"
#include "testing.h"

namespace {

time_t localTime(int year, int month, int day, int hour, int minute, int second) {
    struct tm t;
    memset(&t, 0, sizeof(t));
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    t.tm_isdst = -1;
    return mktime(&t);
}

void TestNamesForOneRun() {
    auto names = makeSnapshotNames("host1", localTime(2025, 1, 1, 12, 0, 0));

    assert(names.timestamp == "20250101-120000");
    assert(names.archive == "backup-host1-20250101-120000.tar.gz");
    assert(names.encrypted == "backup-host1-20250101-120000.tar.gz.enc");
    assert(names.checksum == "backup-host1-20250101-120000.tar.gz.enc.sha256");
    assert(checksumNameFor(names.encrypted) == names.checksum);
}

void TestParseThisHost() {
    time_t when = 0;
    auto expected = localTime(2025, 1, 1, 12, 0, 0);

    assert(parseSnapshotName("backup-host1-20250101-120000.tar.gz.enc", "host1", when));
    assert(when == expected);

    assert(parseSnapshotName("backup-web-01.example.com-20241231-235959.tar.gz.enc", "web-01.example.com", when));
    assert(when == localTime(2024, 12, 31, 23, 59, 59));
}

void TestParseRejectsOthers() {
    time_t when = 0;

    assert(!parseSnapshotName("backup-host2-20250101-120000.tar.gz.enc", "host1", when));
    assert(!parseSnapshotName("backup-host1-20250101-120000.tar.gz.enc.sha256", "host1", when));
    assert(!parseSnapshotName("backup-host1-20250101-120000.tar.gz", "host1", when));
    assert(!parseSnapshotName("backup-host1-2025010-120000.tar.gz.enc", "host1", when));
    assert(!parseSnapshotName("backup-hostX1-20250101-120000.tar.gz.enc", "host.1", when));
    assert(!parseSnapshotName("notes.txt", "host1", when));
}

void TestAnyHost() {
    assert(isSnapshotName("backup-host1-20250101-120000.tar.gz.enc"));
    assert(isSnapshotName("backup-db-eu-2-20250101-120000.tar.gz.enc"));
    assert(!isSnapshotName("backup-host1-20250101-120000.tar.gz.enc.sha256"));
    assert(!isSnapshotName("backup--20250101-120000.tar.gz.enc"));
    assert(!isSnapshotName("snapshot-host1-20250101-120000.tar.gz.enc"));
}

void TestNamesSortByAge() {
    auto older = makeSnapshotNames("host1", localTime(2025, 1, 9, 23, 0, 0));
    auto newer = makeSnapshotNames("host1", localTime(2025, 1, 10, 1, 0, 0));

    assert(newer.encrypted > older.encrypted);
    assert(snapshotTime("garbage") == 0);
}

} // namespace

int main() {
    setupTestGlobals("/dev/null");

    TestNamesForOneRun();
    TestParseThisHost();
    TestParseRejectsOthers();
    TestAnyHost();
    TestNamesSortByAge();

    std::cout << "vpsbackup_snapshot: pass\n";
    return 0;
}

