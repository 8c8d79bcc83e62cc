/**
 * Character classes of property names written after ".".
 *
 * A name starts with an ASCII letter, "_" or a code point with the Unicode XID_Start property, and continues
 * with ASCII letters, digits, "_" or code points with the XID_Continue property. The tables follow
 * Unicode 14.0.
 */
#ifndef VALKEYJSONPATCH_IDENTIFIER_H_
#define VALKEYJSONPATCH_IDENTIFIER_H_

bool jsonpatch_is_identifier_start(const unsigned cp);
bool jsonpatch_is_identifier_continue(const unsigned cp);

#endif  // VALKEYJSONPATCH_IDENTIFIER_H_
