#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>
#include<memory>

namespace {

/* What the idle handler needs to launch the main action.  */
struct Launch {
	int exit_code;
	Ev::Io<int> main;
};

void launch_handler(EV_P_ ev_idle* raw_idler, int) {
	/* Take back ownership from libev.  */
	auto idler = std::unique_ptr<ev_idle>(raw_idler);
	ev_idle_stop(EV_A_ idler.get());

	auto plaunch = static_cast<Launch*>(idler->data);
	auto main = std::move(plaunch->main);

	main.run([plaunch](int exit_code) {
		plaunch->exit_code = exit_code;
	}, [plaunch](std::exception_ptr e) {
		try {
			std::rethrow_exception(e);
		} catch (std::exception const& ex) {
			std::cerr << "Unhandled exception: "
				  << ex.what()
				  << std::endl;
		} catch (...) {
			std::cerr << "Unhandled exception of unknown type!"
				  << std::endl;
		}
		plaunch->exit_code = 254;
	});
}

}

namespace Ev {

int start(Io<int> main) {
	if (!ev_default_loop(0)) {
		std::cerr << "libev failed to initialize" << std::endl;
		return 255;
	}

	auto launch = Launch{ 255, std::move(main) };

	auto idler = Util::make_unique<ev_idle>();
	ev_idle_init(idler.get(), &launch_handler);
	idler->data = &launch;
	/* libev owns the idler until the handler runs.  */
	ev_idle_start(EV_DEFAULT_ idler.release());

	ev_run(EV_DEFAULT_ 0);

	return launch.exit_code;
}

}
