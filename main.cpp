#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Helm/Main.hpp>
#include<Helm/open_node_socket.hpp>
#include<Net/Fd.hpp>
#include<iostream>
#include<memory>

namespace {

Ev::Io<int> io_main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i) {
		arg_vec.push_back(std::string(argv[i]));
	}
	auto main_obj = std::make_shared<Helm::Main>(
		arg_vec, std::cout, std::cerr,
		Helm::open_node_socket
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Keeps main_obj alive until the end.  */
		return Ev::lift(ec);
	});
}

}

int main (int argc, char **argv) {
	auto code = io_main(argc, argv);
	return Ev::start(code);
}
