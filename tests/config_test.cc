#include <cassert>
#include <iostream>

#include "BackupConfig.h"
#include "exception.h"
#include "testing.h"

namespace {

string workDir;

string configFrom(string name, string contents) {
    string filename = slashConcat(workDir, name);
    writeFile(filename, contents);
    return filename;
}

errorKind loadFailure(string filename, string &message) {
    BackupConfig config;

    try {
        config.loadConfig(filename);
    }
    catch (VBException &e) {
        message = e.detail();
        return e.getKind();
    }

    return eGeneric;
}

void TestDefaults() {
    BackupConfig config;

    assert(config.settings[sKeep].ivalue() == 2);
    assert(config.settings[sMinAge].ivalue() == 0);
    assert(config.settings[sAttempts].ivalue() == 3);
    assert(config.settings[sRetryDelay].ivalue() == 5);
    assert(config.settings[sIterations].ivalue() == 10000);
    assert(config.settings[sMinSpace].svalue() == 1073741824UL);
    assert(config.settings[sTgApi].value == "https://api.telegram.org");
    assert(!config.settings[sNotifyStart].bvalue());
    assert(config.sourceList().empty());
}

void TestLoadNameValueFile() {
    BackupConfig config;
    config.loadConfig(configFrom("basic.conf",
        "# vpsbackup\n"
        "\n"
        "sources: /etc/nginx | /var/www |/etc/nginx\n"
        "remote = b2:bucket/vps\n"
        "password: \"correct # horse\"\n"
        "keep: 5   # five is plenty\n"
        "minspace: 250M\n"
        "notifystart: yes\n"));

    auto sources = config.sourceList();
    assert(sources.size() == 2);
    assert(sources[0] == "/etc/nginx");
    assert(sources[1] == "/var/www");

    assert(config.settings[sRemote].value == "b2:bucket/vps");
    assert(config.settings[sPassword].value == "correct # horse");
    assert(config.settings[sKeep].ivalue() == 5);
    assert(config.settings[sMinSpace].svalue() == 250UL * 1024 * 1024);
    assert(config.settings[sNotifyStart].bvalue());
    assert(config.settings[sKeep].seen);
    assert(!config.settings[sTmpDir].seen);
}

void TestLoadEnvFileKeys() {
    BackupConfig config;
    config.loadConfig(configFrom("env.conf",
        "export BACKUP_SRCS=\"/etc|/root\"\n"
        "BACKUP_REMOTE_DIR=gdrive:vps-backups\n"
        "BACKUP_PASSWORD='s3cret'\n"
        "BACKUP_MAX_KEEP=4\n"
        "BACKUP_TMP_DIR=/var/tmp/vps\n"
        "VPS_IDENTIFIER=web-01\n"
        "TG_BOT_TOKEN=123:abc\n"
        "TG_CHAT_ID=-100200\n"));

    assert(config.sourceList().size() == 2);
    assert(config.settings[sRemote].value == "gdrive:vps-backups");
    assert(config.settings[sPassword].value == "s3cret");
    assert(config.settings[sKeep].ivalue() == 4);
    assert(config.settings[sTmpDir].value == "/var/tmp/vps");
    assert(config.hostIdentity() == "web-01");
    assert(config.settings[sTgToken].value == "123:abc");
    assert(config.settings[sTgChat].value == "-100200");
}

void TestUnrecognizedLineNamesTheLine() {
    string message;

    assert(loadFailure(configFrom("unknown.conf", "keep: 3\nbogus: 1\n"), message) == eConfig);
    assert(message.find("line 2") != string::npos);
}

void TestBadValuesRejected() {
    string message;

    assert(loadFailure(configFrom("badint.conf", "keep: lots\n"), message) == eConfig);
    assert(message.find("line 1") != string::npos);

    assert(loadFailure(configFrom("badsize.conf", "\nminspace: plenty\n"), message) == eConfig);
    assert(message.find("line 2") != string::npos);

    assert(loadFailure(slashConcat(workDir, "missing.conf"), message) == eConfig);
}

void TestValidate() {
    BackupConfig config;
    bool threw = false;

    try { config.validate(false); }
    catch (VBException &e) { threw = e.getKind() == eConfig; }
    assert(threw);

    config.settings[sRemote].value = "b2:bucket";
    config.validate(false);

    threw = false;
    try { config.validate(true); }
    catch (VBException &e) { threw = e.getKind() == eConfig; }
    assert(threw);

    config.settings[sPassword].value = "pw";
    config.validate(true);

    config.settings[sTmpDir].value = "/";
    threw = false;
    try { config.validate(true); }
    catch (VBException &e) { threw = e.getKind() == eConfig; }
    assert(threw);

    config.settings[sTmpDir].value = "/tmp/vps-backups";
    config.settings[sAttempts].value = "0";
    threw = false;
    try { config.validate(true); }
    catch (VBException &e) { threw = e.getKind() == eConfig; }
    assert(threw);
}

void TestSecretsMasked() {
    BackupConfig config;
    config.settings[sPassword].value = "hunter2";

    assert(config.settings[sPassword].confPrint().find("hunter2") == string::npos);
    assert(config.settings[sRemote].confPrint().find("default") != string::npos);
}

void TestWorkBaseBesideScratch() {
    BackupConfig config;

    config.settings[sTmpDir].value = "/var/tmp/vps-backup";
    assert(config.workBase() == "/var/tmp");

    config.settings[sTmpDir].value = "/var/tmp/vps-backup//";
    assert(config.workBase() == "/var/tmp");

    config.settings[sTmpDir].value = "/scratch";
    assert(config.workBase() == "/");

    config.settings[sTmpDir].value = "scratch";
    assert(config.workBase() == ".");
}

} // namespace

int main() {
    workDir = makeTempDir("config");
    setupTestGlobals(slashConcat(workDir, "run.log"));

    TestDefaults();
    TestLoadNameValueFile();
    TestLoadEnvFileKeys();
    TestUnrecognizedLineNamesTheLine();
    TestBadValuesRejected();
    TestValidate();
    TestSecretsMasked();
    TestWorkBaseBesideScratch();

    rmrf(workDir);
    std::cout << "vpsbackup_config: pass\n";
    return 0;
}

