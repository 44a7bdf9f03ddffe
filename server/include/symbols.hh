// Symbol definitions for the application server routes
#include <lithium_symbol.hh>
#include "../../coordination/include/symbols.hh"

#ifndef LI_SYMBOL_mode
#define LI_SYMBOL_mode
    LI_SYMBOL(mode)
#endif

#ifndef LI_SYMBOL_message
#define LI_SYMBOL_message
    LI_SYMBOL(message)
#endif

#ifndef LI_SYMBOL_error
#define LI_SYMBOL_error
    LI_SYMBOL(error)
#endif

#ifndef LI_SYMBOL_endpoints
#define LI_SYMBOL_endpoints
    LI_SYMBOL(endpoints)
#endif

#ifndef LI_SYMBOL_health
#define LI_SYMBOL_health
    LI_SYMBOL(health)
#endif

#ifndef LI_SYMBOL_shutdown
#define LI_SYMBOL_shutdown
    LI_SYMBOL(shutdown)
#endif

#ifndef LI_SYMBOL_uptime_ms
#define LI_SYMBOL_uptime_ms
    LI_SYMBOL(uptime_ms)
#endif
