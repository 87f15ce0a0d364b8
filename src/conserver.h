#ifndef CONSERVER_H_
#define CONSERVER_H_

#include "octypes.h"

#include <memory>

namespace orca
{

class ctlhandler;

/**
 * Listeners for the control protocol on the UNIX socket and optional TCP ports.
 * Each accepted connection is served line by line on the event thread.
 */
class ORCA_API conserver
{
public:
	virtual ~conserver() = default;
	/**
	 * Open the configured listeners.
	 * @return false when nothing could be set up, the reason is printed to stderr
	 */
	virtual bool Setup() = 0;
	// listen on explicit endpoints, for tests and tools; port 0 selects a free one
	virtual bool SetupUnix(cmstring& path) =0;
	virtual int SetupTcp(LPCSTR bindAddr, uint16_t port) =0;
	// close listeners and connections
	virtual void Abandon() =0;
	virtual size_t GetConnectionCount() =0;
	static std::unique_ptr<conserver> Create(ctlhandler& handler);
};

}

#endif /*CONSERVER_H_*/
