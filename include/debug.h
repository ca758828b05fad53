#ifndef DEBUG_H
#define DEBUG_H

#include <string>

using namespace std;

/*
 Debug selectors, picked on the commandline:
     -v                  the default set
     --vv                everything
     -v+crypto-lock      the default set plus crypto, minus lock
     -v=0x30             an explicit bitmask
 */
enum debugBits {
    D_backup    = 1 << 0,
    D_config    = 1 << 1,
    D_crypto    = 1 << 2,
    D_exec      = 1 << 3,
    D_lock      = 1 << 4,
    D_notify    = 1 << 5,
    D_prune     = 1 << 6,
    D_restore   = 1 << 7,
    D_transfer  = 1 << 8
};

#define D_all                        0xffffffff
#define D_any                        (D_all)
#define D_default                    (D_all & \
                                       ~(D_transfer         | \
                                         D_config           | \
                                         D_crypto           | \
                                         D_exec             | \
                                         D_notify))

#define DEBUG(x)      if (GLOBALS.debugSelector & (x))

// apply "+name-name..." or "=number" to selector; on an unknown name error is set and false returned
bool decodeDebugSelectors(unsigned int &selector, string settings, string &error);

#endif

