#ifndef HELM_MAIN_HPP
#define HELM_MAIN_HPP

#include<functional>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Net { class Fd; }

namespace Helm {

/** class Helm::Main
 *
 * @brief the lnhelm command line.
 *
 * @desc runs one command against the node backend,
 * printing its JSON result on `cout`, and log lines
 * and errors on `cerr`.
 * Exits with 0 on success, 1 if the command failed,
 * and 2 on bad usage.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    , std::function<Net::Fd(std::string const&)> open_node_socket
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(HELM_MAIN_HPP) */
