#include"Ev/Io.hpp"
#include"Helm/Mod/Waiter.hpp"
#include"Helm/Shutdown.hpp"
#include"S/Bus.hpp"
#include<ev.h>
#include<list>

namespace Helm { namespace Mod {

class Waiter::Impl {
private:
	bool is_shutting_down;

	struct Timer {
		ev_timer timer;
		Impl* self;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	typedef std::list<Timer>::iterator Handle;
	/* A list, so that iterators (and the ev_timer
	 * addresses libev holds) stay valid.  */
	std::list<Timer> timers;

	static
	void fail_shutdown(std::function<void(std::exception_ptr)> const& fail) {
		try {
			throw Helm::Shutdown();
		} catch (...) {
			fail(std::current_exception());
		}
	}

	void shutdown() {
		is_shutting_down = true;
		auto timers_copy = std::move(timers);
		timers.clear();
		for (auto& t : timers_copy)
			ev_timer_stop(EV_DEFAULT_ &t.timer);
		for (auto& t : timers_copy)
			fail_shutdown(t.fail);
	}

	static
	void on_timer(EV_P_ ev_timer* raw, int) {
		auto t = reinterpret_cast<Timer*>(raw->data);
		auto self = t->self;
		ev_timer_stop(EV_A_ raw);
		auto pass = std::move(t->pass);
		/* Find and drop our entry.  */
		for (auto it = self->timers.begin(); it != self->timers.end(); ++it) {
			if (&*it == t) {
				self->timers.erase(it);
				break;
			}
		}
		pass();
	}

	/* Returns an iterator usable with cancel().  */
	Handle start_timer( double seconds
			  , std::function<void()> pass
			  , std::function<void(std::exception_ptr)> fail
			  ) {
		auto it = timers.emplace(timers.end());
		it->self = this;
		it->pass = std::move(pass);
		it->fail = std::move(fail);
		ev_timer_init(&it->timer, &on_timer, seconds, 0);
		it->timer.data = &*it;
		ev_timer_start(EV_DEFAULT_ &it->timer);
		return it;
	}

public:
	explicit
	Impl(S::Bus& bus) : is_shutting_down(false) {
		bus.subscribe<Helm::Shutdown>([this](Helm::Shutdown const&) {
			shutdown();
			return Ev::lift();
		});
	}
	~Impl() {
		for (auto& t : timers)
			ev_timer_stop(EV_DEFAULT_ &t.timer);
	}

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([ this
				    , seconds
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);
			start_timer(seconds, std::move(pass), std::move(fail));
		});
	}

	struct TimedData {
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
		bool done;
		bool timer_live;
		Handle timer;
	};

	Ev::Io<void> timed_core(double timeout, Ev::Io<void> action) {
		return Ev::Io<void>([ this
				    , timeout
				    , action
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);

			auto sh = std::make_shared<TimedData>();
			sh->pass = std::move(pass);
			sh->fail = std::move(fail);
			sh->done = false;
			sh->timer_live = false;

			auto finish = [this, sh](std::exception_ptr e) {
				if (sh->done)
					return;
				sh->done = true;
				if (sh->timer_live && !is_shutting_down) {
					ev_timer_stop(EV_DEFAULT_ &sh->timer->timer);
					timers.erase(sh->timer);
				}
				sh->timer_live = false;
				auto pass = std::move(sh->pass);
				auto fail = std::move(sh->fail);
				if (e)
					fail(e);
				else
					pass();
			};

			sh->timer = start_timer(timeout, [sh, finish]() {
				sh->timer_live = false;
				try {
					throw TimedOut{};
				} catch (...) {
					finish(std::current_exception());
				}
			}, [sh, finish](std::exception_ptr e) {
				sh->timer_live = false;
				finish(e);
			});
			sh->timer_live = true;

			action.run([finish]() {
				finish(nullptr);
			}, finish);
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) { }
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}
Ev::Io<void> Waiter::timed_core(double timeout, Ev::Io<void> action) {
	return pimpl->timed_core(timeout, std::move(action));
}

}}
