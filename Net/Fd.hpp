#ifndef NET_FD_HPP
#define NET_FD_HPP

#include<cstddef>

namespace Net {

/** class Net::Fd
 *
 * @brief sole owner of a file descriptor; closes it
 * when destroyed or reset.
 *
 * @desc move-only.  An empty Fd holds -1.
 */
class Fd {
private:
	int fd;

public:
	Fd(std::nullptr_t = nullptr) : fd(-1) { }
	explicit Fd(int fd_) : fd(fd_) { }
	~Fd() { reset(); }

	Fd(Fd const&) =delete;
	Fd& operator=(Fd const&) =delete;

	Fd(Fd&& o) : fd(o.release()) { }
	Fd& operator=(Fd&& o) {
		reset(o.release());
		return *this;
	}

	int get() const { return fd; }
	int release() {
		auto rv = fd;
		fd = -1;
		return rv;
	}
	/* Closes the current descriptor, if any.  */
	void reset(int fd_ = -1);

	/* Sets O_NONBLOCK; false if fcntl failed, with
	 * errno set.  */
	bool set_nonblocking();

	explicit operator bool() const { return fd >= 0; }
	bool operator!() const { return fd < 0; }
};

}

#endif /* !defined(NET_FD_HPP) */
