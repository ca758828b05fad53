
#include <string>
#include <vector>
#include <unistd.h>
#include <pcre++.h>

#include "Notifier.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"
#include "debug.h"

using namespace pcrepp;


Notifier::Notifier(const BackupConfig &cfg, string hostname) : config(cfg), host(hostname) {}


bool Notifier::enabled() const {
    return (config.settings[sNotify].value.length() ||
            (config.settings[sTgToken].value.length() && config.settings[sTgChat].value.length()));
}


int Notifier::notify(string message, bool success) {
    int delivered = 0;
    string prefix = "[vpsbackup@" + host + "]";
    string sender = config.settings[sMailFrom].value.length() ? config.settings[sMailFrom].value : "vpsbackup";

    // separate the contacts list by commas
    for (auto contactMethod: splitOnChar(config.settings[sNotify].value, ',')) {
        contactMethod = trimSpace(contactMethod);
        if (!contactMethod.length())
            continue;

        DEBUG(D_notify) DFMT("method: " << contactMethod);

        // if there's an at-sign treat it as an email address
        if (contactMethod.find("@") != string::npos) {
            try {
                if (sendEmail(sender, contactMethod, "vpsbackup - " + prefix + (success ? " (success)" : " (failed)"), message))
                    ++delivered;
                else
                    log("warning: unable to notify via email to " + contactMethod);
            }
            catch (VBException &e) {
                log("warning: unable to notify via email to " + contactMethod + ": " + e.detail());
            }
        }
        // if there's no at-sign treat it as a script to execute
        else {
            if (runScript(contactMethod, prefix + "\n\n" + message))
                ++delivered;
            else
                log("warning: unable to notify via " + contactMethod + " (cannot execute)");
        }
    }

    if (config.settings[sTgToken].value.length() && config.settings[sTgChat].value.length()) {
        if (sendTelegram(prefix + " " + (success ? "✅ " : "❌ ") + message))
            ++delivered;
        else
            log("warning: unable to notify via telegram");
    }

    return delivered;
}


void Notifier::runStarted(string snapshotName) {
    if (config.settings[sNotifyStart].bvalue())
        notify("backup started: " + snapshotName, true);
}


bool Notifier::runScript(string script, string message) {
    try {
        PipeExec proc({ script, message }, "notify");
        proc.execute(false, poDiscard);
        int status = proc.wait();

        DEBUG(D_notify) DFMT("script: " << script << " exited " << status);
        return !status;
    }
    catch (VBException &e) {
        log("warning: " + e.detail());
        return false;
    }
}


bool Notifier::sendTelegram(string message) {
    string url = config.settings[sTgApi].value + "/bot" + config.settings[sTgToken].value + "/sendMessage";
    string curl = locateBinary("curl");

    if (!curl.length())
        return false;

    try {
        PipeExec proc({ curl, "-s", "-m", "30", "-X", "POST", url,
            "--data-urlencode", "chat_id=" + config.settings[sTgChat].value,
            "--data-urlencode", "text=" + message }, "curl");
        string response;
        int status = proc.capture(response);

        DEBUG(D_notify) DFMT("telegram: curl exited " << status);

        Pcre okRE("\"ok\"\\s*:\\s*true");
        return (!status && okRE.search(response));
    }
    catch (VBException &e) {
        log("warning: " + e.detail());
        return false;
    }
}

