#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

class SignalBase {
public:
	virtual ~SignalBase() { }
};

/* Holds the callbacks for messages of type a, and
 * broadcasts to them.  */
template<typename a>
class Signal : public SignalBase {
public:
	typedef std::function<Ev::Io<void>(a const&)> Callback;

private:
	typedef std::vector<Callback> Callbacks;
	/* Copied on write, so that a raise in progress
	 * is unaffected by new subscriptions.  */
	std::shared_ptr<Callbacks const> callbacks;

	struct RaiseData {
		std::shared_ptr<Callbacks const> callbacks;
		a value;
		std::exception_ptr exc;
	};

	/* Callbacks run in subscription order.
	 * A failing callback does not stop the rest;
	 * the first failure is rethrown at the end.  */
	static
	Ev::Io<void> raise_loop( std::shared_ptr<RaiseData> pdata
			       , std::size_t i
			       ) {
		if (i >= pdata->callbacks->size())
			return Ev::lift().then([pdata]() {
				if (pdata->exc)
					std::rethrow_exception(pdata->exc);
				return Ev::lift();
			});
		return Ev::Io<void>([ pdata
				    , i
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> _
				     ) {
			auto record = [pdata, pass](std::exception_ptr e) {
				if (!pdata->exc)
					pdata->exc = e;
				pass();
			};
			auto const& cb = (*pdata->callbacks)[i];
			auto io = std::unique_ptr<Ev::Io<void>>();
			try {
				io.reset(new Ev::Io<void>(cb(pdata->value)));
			} catch (...) {
				record(std::current_exception());
				return;
			}
			io->run(pass, record);
		}).then([pdata, i]() {
			return raise_loop(pdata, i + 1);
		});
	}

public:
	Signal() : callbacks(std::make_shared<Callbacks>()) { }

	void subscribe(Callback cb) {
		auto n = std::make_shared<Callbacks>(*callbacks);
		n->push_back(std::move(cb));
		callbacks = std::move(n);
	}

	/* `a` should be a dumb data-only structure that
	 * can at least be moved.  */
	Ev::Io<void> raise(a value) {
		auto pdata = std::shared_ptr<RaiseData>(new RaiseData{
			callbacks, std::move(value), nullptr
		});
		return raise_loop(std::move(pdata), 0);
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
