#include"Helm/Exception.hpp"
#include"Helm/Shutdown.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"

namespace Helm {

char const* to_string(ErrorKind k) {
	switch (k) {
	case ErrorKind::InvalidArgument: return "InvalidArgument";
	case ErrorKind::NoAvailableChannel: return "NoAvailableChannel";
	case ErrorKind::BackendUnavailable: return "BackendUnavailable";
	case ErrorKind::BackendTimeout: return "BackendTimeout";
	case ErrorKind::BackendError: return "BackendError";
	case ErrorKind::OpenFailed: return "OpenFailed";
	case ErrorKind::CloseFailed: return "CloseFailed";
	case ErrorKind::PaymentFailed: return "PaymentFailed";
	case ErrorKind::InvoiceFailed: return "InvoiceFailed";
	}
	return "Unknown";
}

std::string describe_error(std::exception_ptr e) {
	if (!e)
		return "Unknown: no error";
	try {
		std::rethrow_exception(e);
	} catch (Exception const& ex) {
		auto rv = std::string(to_string(ex.kind()))
			+ ": " + ex.what()
			;
		if (!ex.detail().empty())
			rv += ": " + ex.detail();
		return rv;
	} catch (Jsmn::ParseError const& ex) {
		return std::string("ParseError: ") + ex.what();
	} catch (Jsmn::TypeError const& ex) {
		return std::string("TypeError: ") + ex.what();
	} catch (Shutdown const&) {
		return "Shutdown: interrupted by shutdown";
	} catch (std::exception const& ex) {
		return std::string("Error: ") + ex.what();
	} catch (...) {
		return "Unknown: exception of unknown type";
	}
}

}
