#include <ctype.h>
#include <stdlib.h>
#include <map>

#include "debug.h"


static const map<string, unsigned int> debugNames = {
    { "all",        D_all },
    { "backup",     D_backup },
    { "config",     D_config },
    { "crypto",     D_crypto },
    { "exec",       D_exec },
    { "lock",       D_lock },
    { "notify",     D_notify },
    { "prune",      D_prune },
    { "restore",    D_restore },
    { "transfer",   D_transfer }
};


bool decodeDebugSelectors(unsigned int &selector, string settings, string &error) {
    if (settings.length() && settings[0] == '=') {
        char *end;
        auto value = strtoul(settings.c_str() + 1, &end, 0);

        if (*end || end == settings.c_str() + 1) {
            error = "unknown debugging selection: " + settings;
            return false;
        }

        selector = (unsigned int)value;
        return true;
    }

    size_t pos = 0;
    while (pos < settings.length()) {
        char op = settings[pos++];

        if (op != '+' && op != '-') {
            error = "unknown debugging flag (should be + or -): " + settings.substr(pos - 1);
            return false;
        }

        auto start = pos;
        while (pos < settings.length() && (isalnum(settings[pos]) || settings[pos] == '_'))
            ++pos;

        auto name = settings.substr(start, pos - start);
        auto bits = debugNames.find(name);

        if (bits == debugNames.end()) {
            error = string("unknown debugging selection: ") + op + name;
            return false;
        }

        if (op == '+')
            selector |= bits->second;
        else
            selector &= ~bits->second;
    }

    return true;
}

