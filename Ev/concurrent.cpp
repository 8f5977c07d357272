#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>

namespace {

void concurrent_handler(EV_P_ ev_idle* raw_idler, int) {
	auto idler = std::unique_ptr<ev_idle>(raw_idler);
	ev_idle_stop(EV_A_ idler.get());

	auto io = std::unique_ptr<Ev::Io<void>>(
		static_cast<Ev::Io<void>*>(idler->data)
	);

	io->run([]() { }, [](std::exception_ptr e) {
		std::cerr << "Unhandled exception in concurrent task: ";
		try {
			std::rethrow_exception(e);
		} catch (std::exception const& ex) {
			std::cerr << ex.what() << std::endl;
		} catch (...) {
			std::cerr << "unknown type" << std::endl;
		}
	});
}

}

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::Io<void>([io]( std::function<void()> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		auto pio = Util::make_unique<Ev::Io<void>>(io);
		auto idler = Util::make_unique<ev_idle>();
		ev_idle_init(idler.get(), &concurrent_handler);
		idler->data = pio.release();
		ev_idle_start(EV_DEFAULT_ idler.release());
		pass();
	});
}

}
