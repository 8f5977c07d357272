#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>
#include<vector>

namespace {

struct Custom {
	int code;
};

}

int main() {
	auto steps = std::vector<std::string>();

	/* operator+ and += keep order.  */
	auto seq = Ev::lift().then([&]() {
		steps.push_back("a");
		return Ev::lift();
	}) + Ev::lift().then([&]() {
		steps.push_back("b");
		return Ev::lift();
	});
	seq += Ev::yield().then([&]() {
		steps.push_back("c");
		return Ev::lift();
	});

	/* Nothing runs until started.  */
	assert(steps.empty());

	auto caught = 0;
	auto background = false;
	auto code = Ev::start(seq.then([&]() {
		assert((steps == std::vector<std::string>{"a", "b", "c"}));

		/* A throw inside then goes to catching.  */
		return Ev::yield().then([]() {
			throw Custom{7};
			return Ev::lift(std::string("unreachable"));
		}).catching<Custom>([&](Custom const& e) {
			caught = e.code;
			return Ev::lift(std::string("handled"));
		});
	}).then([&](std::string s) {
		assert(s == "handled");
		assert(caught == 7);

		/* catching ignores other types.  */
		return Ev::lift(1).then([](int) {
			throw std::runtime_error("boom");
			return Ev::lift(0);
		}).catching<Custom>([](Custom const&) {
			assert(false);
			return Ev::lift(99);
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			assert(std::string(e.what()) == "boom");
			return Ev::lift(2);
		});
	}).then([&](int n) {
		assert(n == 2);
		return Ev::concurrent(Ev::yield().then([&]() {
			background = true;
			return Ev::lift();
		}));
	}).then([&]() {
		/* Runs only after we yield.  */
		assert(!background);
		return Ev::yield();
	}).then([&]() {
		return Ev::lift(0);
	}));

	assert(code == 0);
	assert(background);
	return code;
}
