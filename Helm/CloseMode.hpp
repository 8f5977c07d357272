#ifndef HELM_CLOSEMODE_HPP
#define HELM_CLOSEMODE_HPP

namespace Helm {

enum class CloseMode {
	Cooperative,
	Force
};

inline
char const* to_string(CloseMode m) {
	return (m == CloseMode::Force) ? "force" : "cooperative";
}

}

#endif /* !defined(HELM_CLOSEMODE_HPP) */
