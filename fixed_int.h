/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#ifndef NUMLIT_FIXED_INT_H
#define NUMLIT_FIXED_INT_H

#include <string>
#include "exact.h"

namespace numlit {

  class BinaryFloat;

  /* Describes a two's-complement integer type.  */
  struct IntFormat
  {
    /* Between 1 and FixedInt::maxBitWidth.  */
    unsigned int bitWidth;

    bool isSigned;

    bool operator== (const IntFormat &rhs) const
    {
      return bitWidth == rhs.bitWidth && isSigned == rhs.isSigned;
    }

    bool operator!= (const IntFormat &rhs) const { return !(*this == rhs); }
  };

/* A value of a fixed-width integer type.  Arithmetic traps on
   overflow unless a reporting, wrapping or unchecked variant is
   used.  Binary operations require both operands to have the same
   format.  */
class FixedInt {
 public:
  static const unsigned int maxBitWidth = 128;

  static const IntFormat int8;
  static const IntFormat int16;
  static const IntFormat int32;
  static const IntFormat int64;
  static const IntFormat int128;
  static const IntFormat uint8;
  static const IntFormat uint16;
  static const IntFormat uint32;
  static const IntFormat uint64;
  static const IntFormat uint128;

  /* VALUE sign-extended to infinite width, then truncated to the
     format's width.  */
  FixedInt (const IntFormat &, long long value);

  /* The bit pattern HIGH:LOW truncated to the format's width.  */
  static FixedInt fromBits (const IntFormat &, integerPart low,
                            integerPart high = 0);

  static FixedInt minValue (const IntFormat &);
  static FixedInt maxValue (const IntFormat &);

  /* Simple queries.  */
  const IntFormat &getFormat () const { return format; }
  unsigned int getBitWidth () const { return format.bitWidth; }
  bool isSigned () const { return format.isSigned; }
  bool isNegative () const;
  bool isZero () const;

  /* The raw bits, least significant part first.  Bits above the
     width are zero.  */
  const integerPart *getRawParts () const { return parts; }

  /* The low 64 bits of the value sign- or zero-extended to 128.  */
  long long getSExtValue () const;
  unsigned long long getZExtValue () const;

  ExactInteger toExact () const;
  std::string toString (unsigned int radix = 10) const;

  /* Numeric comparison of two values of the same format.  */
  int compare (const FixedInt &) const;
  bool operator== (const FixedInt &) const;
  bool operator!= (const FixedInt &rhs) const { return !(*this == rhs); }

  /* Conversions.  The value is replaced by its conversion to FORMAT
     under POLICY.  cpExactly returns opInvalidOp and leaves the value
     alone when the conversion would change it; cpClamping and
     cpTruncating return opInexact when they did change it.  */
  opStatus convert (const IntFormat &, conversionPolicy);
  opStatus convertFromExactInteger (const ExactInteger &, const IntFormat &,
                                    conversionPolicy);

  /* Conversion of a floating value, truncating toward zero.  Only
     cpExact and cpExactly are defined; cpExact traps on NaN,
     infinity and out of range values, cpExactly also fails when a
     fraction would be dropped.  */
  opStatus convertFromFloat (const BinaryFloat &, const IntFormat &,
                             conversionPolicy);

  /* Arithmetic reporting overflow.  The value becomes the wrapped
     partial result and the return value says whether it overflowed.
     Division and remainder by zero leave the dividend; remainder of
     a signed value by -1 is zero.  Both report overflow.  */
  bool addReportingOverflow (const FixedInt &);
  bool subtractReportingOverflow (const FixedInt &);
  bool multiplyReportingOverflow (const FixedInt &);
  bool divideReportingOverflow (const FixedInt &);
  bool remainderReportingOverflow (const FixedInt &);

  /* Trapping arithmetic.  */
  void add (const FixedInt &);
  void subtract (const FixedInt &);
  void multiply (const FixedInt &);
  void divide (const FixedInt &);
  void remainder (const FixedInt &);
  void negate ();
  void abs ();

  /* Two's-complement wraparound; never fails.  */
  void wrappingAdd (const FixedInt &);
  void wrappingSubtract (const FixedInt &);
  void wrappingMultiply (const FixedInt &);
  void wrappingNegate ();

  /* The caller promises no overflow.  Checked builds trap when the
     promise is broken; other builds wrap.  */
  void uncheckedAdd (const FixedInt &);
  void uncheckedSubtract (const FixedInt &);
  void uncheckedMultiply (const FixedInt &);
  void uncheckedDivide (const FixedInt &);

  /* The absolute value as the unsigned type of the same width.  */
  FixedInt magnitude () const;

  /* HIGH:LOW = LHS * RHS.  HIGH has the operands' format, LOW is the
     unsigned format of the same width.  */
  static void multiplyFullWidth (const FixedInt &lhs, const FixedInt &rhs,
                                 FixedInt &high, FixedInt &low);

  /* Divide the double-width value HIGH:LOW by DIVISOR, truncating
     toward zero.  QUOTIENT and REMAINDER get DIVISOR's format, the
     remainder taking the sign of the dividend.  Traps if DIVISOR is
     zero or the quotient does not fit.  */
  static void divideFullWidth (const FixedInt &divisor, const FixedInt &high,
                               const FixedInt &low, FixedInt &quotient,
                               FixedInt &remainder);

  /* As above, but returns true instead of trapping.  On overflow the
     quotient is truncated to the width and the remainder is exact; a
     zero divisor gives the truncated dividend and a zero
     remainder.  */
  static bool divideFullWidthReportingOverflow (const FixedInt &divisor,
                                                const FixedInt &high,
                                                const FixedInt &low,
                                                FixedInt &quotient,
                                                FixedInt &remainder);

 private:
  static const unsigned int maxParts = 2;

  void assignExact (const ExactInteger &, const IntFormat &);
  void checkFormat (const FixedInt &) const;
  bool signBit () const;
  void signExtend (integerPart *, unsigned int) const;
  void storeTruncated (const integerPart *, unsigned int);
  void magnitudeParts (integerPart *) const;
  bool divideOrRemainder (const FixedInt &, bool wantRemainder);

  IntFormat format;
  integerPart parts[maxParts];
};

}

#endif /* NUMLIT_FIXED_INT_H */
