#include"Net/Fd.hpp"
#include<errno.h>
#include<fcntl.h>
#include<unistd.h>

namespace Net {

void Fd::reset(int fd_) {
	if (fd >= 0 && fd != fd_) {
		/* Preserve errno across close.  */
		auto saved = errno;
		close(fd);
		errno = saved;
	}
	fd = fd_;
}

bool Fd::set_nonblocking() {
	auto flags = fcntl(fd, F_GETFL);
	if (flags < 0)
		return false;
	if (flags & O_NONBLOCK)
		return true;
	return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}
