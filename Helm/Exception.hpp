#ifndef HELM_EXCEPTION_HPP
#define HELM_EXCEPTION_HPP

#include"Helm/CloseMode.hpp"
#include<exception>
#include<stdexcept>
#include<string>

namespace Helm {

enum class ErrorKind {
	InvalidArgument,
	NoAvailableChannel,
	BackendUnavailable,
	BackendTimeout,
	BackendError,
	OpenFailed,
	CloseFailed,
	PaymentFailed,
	InvoiceFailed
};

char const* to_string(ErrorKind);

/** class Helm::Exception
 *
 * @brief base of every failure the node control
 * core reports through Ev::Io.
 *
 * @desc `what()` is a short description of what
 * went wrong; `detail()` is the text reported by
 * the backend, if any, preserved as-is.
 */
class Exception : public std::runtime_error {
private:
	ErrorKind k;
	std::string d;

public:
	Exception( ErrorKind k_
		 , std::string const& message
		 , std::string detail_ = ""
		 ) : std::runtime_error(message)
		   , k(k_)
		   , d(std::move(detail_))
		   { }

	ErrorKind kind() const { return k; }
	std::string const& detail() const { return d; }
};

/* Precondition violation, detected before the backend
 * is contacted.  */
class InvalidArgument : public Exception {
public:
	explicit
	InvalidArgument(std::string const& message)
		: Exception(ErrorKind::InvalidArgument, message) { }
};

class NoAvailableChannel : public Exception {
public:
	NoAvailableChannel()
		: Exception( ErrorKind::NoAvailableChannel
			   , "No active channel to send through"
			   ) { }
};

/* The request could not be delivered to the backend.  */
class BackendUnavailable : public Exception {
public:
	explicit
	BackendUnavailable(std::string detail)
		: Exception( ErrorKind::BackendUnavailable
			   , "Node backend unavailable"
			   , std::move(detail)
			   ) { }
};

/* The backend did not answer in time; whether the
 * request took effect is unknown.  */
class BackendTimeout : public Exception {
public:
	explicit
	BackendTimeout(std::string detail)
		: Exception( ErrorKind::BackendTimeout
			   , "Node backend did not answer in time"
			   , std::move(detail)
			   ) { }
};

class BackendError : public Exception {
public:
	explicit
	BackendError(std::string detail)
		: Exception( ErrorKind::BackendError
			   , "Node backend reported an error"
			   , std::move(detail)
			   ) { }
};

class OpenFailed : public Exception {
public:
	explicit
	OpenFailed(std::string detail)
		: Exception( ErrorKind::OpenFailed
			   , "Channel open rejected"
			   , std::move(detail)
			   ) { }
};

class CloseFailed : public Exception {
private:
	std::string chan;
	CloseMode m;

	static
	std::string make_message(std::string const& chan, CloseMode m) {
		return std::string("Channel ") + to_string(m)
		     + " close of " + chan + " rejected"
		     ;
	}

public:
	CloseFailed( std::string channel_
		   , CloseMode mode_
		   , std::string detail
		   ) : Exception( ErrorKind::CloseFailed
				, make_message(channel_, mode_)
				, std::move(detail)
				)
		     , chan(std::move(channel_))
		     , m(mode_)
		     { }

	std::string const& channel() const { return chan; }
	CloseMode mode() const { return m; }
};

/* Backend refusals of a submitted payment come back
 * as an unconfirmed Helm::PaymentReceipt, so the only
 * failure is not having a channel to pay through.  */
enum class PaymentFailure {
	NoAvailableChannel
};

class PaymentFailed : public Exception {
private:
	PaymentFailure r;

	static
	char const* make_message(PaymentFailure) {
		return "Payment not attempted: no active channel";
	}

public:
	PaymentFailed(PaymentFailure r_, std::string detail)
		: Exception( ErrorKind::PaymentFailed
			   , make_message(r_)
			   , std::move(detail)
			   )
		, r(r_)
		{ }

	PaymentFailure reason() const { return r; }
};

class InvoiceFailed : public Exception {
public:
	explicit
	InvoiceFailed(std::string detail)
		: Exception( ErrorKind::InvoiceFailed
			   , "Invoice creation rejected"
			   , std::move(detail)
			   ) { }
};

/** Helm::describe_error
 *
 * @brief renders a failure as a single
 * human-readable line, in the form
 * "<kind>: <message>[: <detail>]".
 */
std::string describe_error(std::exception_ptr);

}

#endif /* !defined(HELM_EXCEPTION_HPP) */
