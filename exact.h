/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#ifndef NUMLIT_EXACT_H
#define NUMLIT_EXACT_H

#include <string>
#include "numlit.h"

namespace numlit {

/* A signed integer of unbounded magnitude, as written in a literal.
   Zero is never negative.  */
class ExactInteger {
 public:
  ExactInteger ();
  explicit ExactInteger (integerPart magnitude, bool negative = false);
  ExactInteger (const integerPart *magnitude, unsigned int parts,
                bool negative);
  ExactInteger (const ExactInteger &);
  ~ExactInteger ();

  ExactInteger &operator= (const ExactInteger &);

  bool isZero () const;
  bool isNegative () const { return sign; }
  void negate ();

  /* Bit number of the most significant set bit of the magnitude;
     zero for zero.  */
  unsigned int significantBits () const;

  /* The magnitude, least significant part first.  */
  const integerPart *magnitudeParts () const { return parts; }
  unsigned int partCount () const { return count; }

  /* *this = *this * MULTIPLIER + ADDEND, on the magnitude.  */
  void multiplyAndAdd (integerPart multiplier, integerPart addend);
  void multiplyByPowerOfTen (unsigned int);
  void shiftLeft (unsigned int bits);

  /* Signed comparison; returns -1, 0 or 1.  */
  int compare (const ExactInteger &) const;
  bool operator== (const ExactInteger &rhs) const { return compare (rhs) == 0; }
  bool operator!= (const ExactInteger &rhs) const { return compare (rhs) != 0; }

  /* Whether the value is representable in a two's-complement integer
     of WIDTH bits.  */
  bool fitsIn (unsigned int width, bool isSigned) const;

  /* Write the value modulo 2^WIDTH, in two's complement, to DST which
     has DSTPARTS parts.  Bits above WIDTH are cleared.  */
  void truncate (integerPart *dst, unsigned int dstParts,
                 unsigned int width) const;

  /* RADIX is between 2 and 16.  */
  std::string toString (unsigned int radix = 10) const;

 private:
  void resize (unsigned int newCount);
  int compareMagnitude (const ExactInteger &) const;

  integerPart *parts;
  unsigned int count;
  bool sign;
};

/* A floating literal before rounding: SIGNIFICAND * BASE^EXPONENT,
   where BASE is 2 for hexadecimal literals and 10 for decimal ones.
   Unlike ExactInteger a zero keeps its sign.  */
class ExactFloat {
 public:
  /* Exponents saturate at plus or minus this.  Anything beyond is an
     overflow or underflow in every supported format.  */
  static const exponent_t exponentLimit = 1 << 28;

  ExactFloat ();
  ExactFloat (bool negative, const ExactInteger &significand,
              exponent_t exponent, unsigned int base);

  bool isNegative () const { return sign; }
  bool isZero () const { return significand.isZero (); }
  const ExactInteger &getSignificand () const { return significand; }
  exponent_t getExponent () const { return exponent; }
  unsigned int getExponentBase () const { return base; }

  static exponent_t saturateExponent (long long);

 private:
  ExactInteger significand;
  exponent_t exponent;
  unsigned int base;
  bool sign;
};

}

#endif /* NUMLIT_EXACT_H */
