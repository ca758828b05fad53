
#ifndef NOTIFIER_H
#define NOTIFIER_H

#include <string>
#include <vector>
#include "BackupConfig.h"

using namespace std;


/*******************************************************************************
 * Notifier
 *
 * Fire-and-forget run reports.  Destinations come from the config:
 *   notify:   comma list; entries with an @ are emailed, others are run as
 *             scripts with the message as their argument
 *   tgtoken + tgchat: Telegram bot message
 * Nothing here ever throws; failures are logged as warnings.
 *******************************************************************************/
class Notifier {
    const BackupConfig &config;
    string host;

    bool sendTelegram(string message);
    bool runScript(string script, string message);

public:
    Notifier(const BackupConfig &cfg, string hostname);
    virtual ~Notifier() {}

    bool enabled() const;

    // returns the number of destinations that accepted the message
    virtual int notify(string message, bool success);
    void runStarted(string snapshotName);
};

#endif

