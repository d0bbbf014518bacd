/* Copyright (C) 2024 J.F.Dockes
 *	 This program is free software; you can redistribute it and/or modify
 *	 it under the terms of the GNU General Public License as published by
 *	 the Free Software Foundation; either version 2 of the License, or
 *	 (at your option) any later version.
 *
 *	 This program is distributed in the hope that it will be useful,
 *	 but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	 GNU General Public License for more details.
 *
 *	 You should have received a copy of the GNU General Public License
 *	 along with this program; if not, write to the
 *	 Free Software Foundation, Inc.,
 *	 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _UPDMRUTILS_H_X_INCLUDED_
#define _UPDMRUTILS_H_X_INCLUDED_

#include <string>

// Replace the first occurrence of regexp. cxx11 regex does not work
// that well yet...
extern std::string regsub1(const std::string& sexp, const std::string& input,
                           const std::string& repl);

// Return a parenthesized subexpression (1 to 9) of the first match
// of regexp, or an empty string.
extern std::string regmatch1(const std::string& sexp,
                             const std::string& input, int sub = 1);

// Remove characters from ws at both ends of s, in place.
extern void trimstring(std::string& s, const char *ws = " \t\r\n");

// Case-insensitive (ASCII) comparison, returns 0 if equal.
extern int stringicmp(const std::string& s1, const std::string& s2);

// Strict unsigned decimal conversion: digits only, no sign, no
// overflow of maxval. Returns false if the input does not qualify.
extern bool strToUint(const std::string& s, unsigned long maxval,
                      unsigned long *value);

// Current time formatted for HTTP and SSDP headers (RFC 1123, GMT)
extern std::string httpDate();

#define UPDMR_UNUSED(X) (void)(X)

#endif /* _UPDMRUTILS_H_X_INCLUDED_ */
