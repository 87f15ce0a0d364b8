#ifndef OC3RDPARTY_H
#define OC3RDPARTY_H

#include "config.h"

namespace orca
{

/**
 * Global setup of the libraries, to be called before any event base or DNS channel is created.
 */
void ORCA_API oc3rdparty_init();
void ORCA_API oc3rdparty_deinit();

}

#endif // OC3RDPARTY_H
