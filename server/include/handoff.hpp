#pragma once
#include "../../coordination/include/lock_store.hpp"
#include <cstdint>
#include <string>

/**
 * Explains why the application server returned from http_serve().
 *
 * The election socket is released just before lithium binds the service port,
 * so a peer can slip in between. When the lock file names another pid, the
 * message names that peer; otherwise it only reports the stop.
 */
std::string describe_lost_service_port(LockStore& lockStore, uint16_t port);
