#include "Setting.h"
#include "globals.h"
#include "exception.h"

map<string, int>settingMap =
{{ CLI_SOURCES, sSources },
    { CLI_REMOTE, sRemote },
    { CLI_PASSWORD, sPassword },
    { CLI_KEEP, sKeep },
    { CLI_MINAGE, sMinAge },
    { CLI_LOGFILE, sLogFile },
    { CLI_TMPDIR, sTmpDir },
    { CLI_LOCKFILE, sLockFile },
    { CLI_MINSPACE, sMinSpace },
    { CLI_ATTEMPTS, sAttempts },
    { CLI_RETRYDELAY, sRetryDelay },
    { CLI_ITERATIONS, sIterations },
    { CLI_HOSTNAME, sHostname },
    { CLI_RCLONE, sRclone },
    { CLI_TAR, sTar },
    { CLI_NOTIFY, sNotify },
    { CLI_MAILFROM, sMailFrom },
    { CLI_TGTOKEN, sTgToken },
    { CLI_TGCHAT, sTgChat },
    { CLI_TGAPI, sTgApi },
    { CLI_NOTIFYSTART, sNotifyStart }
    };



Setting::Setting(string name, string pattern, enum SetType setType, string defaultVal, bool isSecret) {
    // env-file lines may carry a leading "export"
    regex = Pcre("^\\s*(?:export\\s+)?" + pattern + CAPTURE_VALUE + RE_COMMENT);
    display_name = name;
    data_type = setType;
    defaultValue = defaultVal;
    value = defaultValue;
    seen = false;
    secret = isSecret;
}


/*******************************************************************************
 * validate()
 *
 * Throws VBException(eConfig) if the current value can't be interpreted as
 * the setting's type.
 *******************************************************************************/
void Setting::validate() const {
    try {
        switch (data_type) {
            case INT:
                stoi(value);
                break;

            case SIZE:
                approx2bytes(value);
                break;

            default:
                break;
        }
    }
    catch (std::exception &e) {
        throw VBException("invalid value '" + value + "' for " + display_name +
                          (data_type == SIZE ? " (expected a size such as 500M or 2G)" : " (expected a number)"), eConfig);
    }
}


string Setting::confPrint() const {
    bool isDef = value == defaultValue;
    string shown = secret && value.length() ? "********" : (data_type == BOOL ? (str2bool(value) ? "true" : "false") : value);

    return(blockp((isDef ? "#" : "") + display_name + ":", -17) + blockp(shown, -25) + (isDef ? "  # default" : "") + "\n");
}

