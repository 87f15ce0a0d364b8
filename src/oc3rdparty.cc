#include "config.h"
#include "oc3rdparty.h"
#include "debug.h"

#include <event2/thread.h>
#include <event2/event.h>

#include <openssl/evp.h>
#include <openssl/crypto.h>

#include <ares.h>

namespace orca {

void ORCA_API oc3rdparty_init()
{
	// worker threads hand over their results with event_active, needs locking in libevent
	evthread_use_pthreads();
#ifdef DEBUG
	evthread_enable_lock_debugging();
#endif
	ares_library_init(ARES_LIB_INIT_ALL);
	OPENSSL_init_crypto(OPENSSL_INIT_ADD_ALL_DIGESTS, nullptr);
}

void ORCA_API oc3rdparty_deinit()
{
	libevent_global_shutdown();
	ares_library_cleanup();
}

}
