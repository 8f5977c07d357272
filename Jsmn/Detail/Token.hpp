#ifndef JSMN_DETAIL_TOKEN_HPP
#define JSMN_DETAIL_TOKEN_HPP

namespace Jsmn { namespace Detail {

enum Type
{ Undefined
, Object
, Array
, String
, Primitive
};

/* Mirror of jsmntok_t, so that jsmn.h need not be
 * visible outside the parser compilation unit.
 * `size` is the number of direct children; for an
 * object, the keys are the children, and each key
 * has its value as its single child.
 */
struct Token {
	Type type;
	int start;
	int end;
	int size;
};

}}

#endif /* !defined(JSMN_DETAIL_TOKEN_HPP) */
