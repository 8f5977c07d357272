#undef NDEBUG
#include"Net/Fd.hpp"
#include<assert.h>
#include<errno.h>
#include<fcntl.h>
#include<sys/socket.h>
#include<unistd.h>
#include<utility>

namespace {

bool is_open(int fd) {
	return fcntl(fd, F_GETFD) >= 0;
}

}

int main() {
	int fds[2];
	auto res = socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
	assert(res == 0);

	auto a = Net::Fd(fds[0]);
	auto b = Net::Fd(fds[1]);
	assert(a && b);

	{
		auto moved = std::move(a);
		assert(!a);
		assert(moved.get() == fds[0]);
		assert(is_open(fds[0]));
	}
	/* Closed when the owner went away.  */
	assert(!is_open(fds[0]));

	assert(b.set_nonblocking());
	assert(fcntl(b.get(), F_GETFL) & O_NONBLOCK);
	/* Peer closed: reads see EOF, not EAGAIN.  */
	char c;
	assert(read(b.get(), &c, 1) == 0);

	auto raw = b.release();
	assert(!b);
	assert(is_open(raw));
	b.reset(raw);
	b.reset();
	assert(!b);
	assert(!is_open(raw));

	auto empty = Net::Fd();
	assert(!empty.set_nonblocking());
	assert(errno == EBADF);

	return 0;
}
