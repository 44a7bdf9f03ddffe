// Symbol definitions shared by the lock file and the control-plane
#include <lithium_symbol.hh>

#ifndef LI_SYMBOL_pid
#define LI_SYMBOL_pid
    LI_SYMBOL(pid)
#endif

#ifndef LI_SYMBOL_version
#define LI_SYMBOL_version
    LI_SYMBOL(version)
#endif

#ifndef LI_SYMBOL_port
#define LI_SYMBOL_port
    LI_SYMBOL(port)
#endif

#ifndef LI_SYMBOL_timestamp
#define LI_SYMBOL_timestamp
    LI_SYMBOL(timestamp)
#endif

#ifndef LI_SYMBOL_status
#define LI_SYMBOL_status
    LI_SYMBOL(status)
#endif
