#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/* Seconds since the epoch, as seen by the event loop.  */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
