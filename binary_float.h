/*
   Copyright 2004-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#ifndef NUMLIT_BINARY_FLOAT_H
#define NUMLIT_BINARY_FLOAT_H

#include <string>
#include "exact.h"
#include "fixed_int.h"

namespace numlit {

  /* Describes an IEEE-754 binary interchange format.  */
  struct FloatFormat
  {
    /* Width of the biased exponent field.  */
    unsigned int exponentBits;

    /* Number of bits in the significand.  This includes the integer
       bit.  */
    unsigned int precision;

    /* If the integer bit is stored in the encoding, as it is in the
       x87 80-bit format.  */
    bool explicitIntegerBit;

    /* The largest E such that 2^E is representable; this matches the
       definition of IEEE 754.  */
    exponent_t maxExponent () const
    {
      return (1 << (exponentBits - 1)) - 1;
    }

    /* The smallest E such that 2^E is a normalized number.  */
    exponent_t minExponent () const { return 1 - maxExponent (); }

    /* Width of the stored significand field.  */
    unsigned int significandFieldBits () const
    {
      return precision - 1 + explicitIntegerBit;
    }

    /* Width of the whole encoding, sign included.  */
    unsigned int bitWidth () const
    {
      return 1 + exponentBits + significandFieldBits ();
    }

    /* Width of a NaN payload: the trailing significand less the quiet
       and signalling flags.  */
    unsigned int payloadBits () const { return precision - 3; }
  };

class BinaryFloat {
 public:

  /* We support the following floating point formats.  */
  static const FloatFormat ieeeHalf;
  static const FloatFormat ieeeSingle;
  static const FloatFormat ieeeDouble;
  static const FloatFormat x87DoubleExtended;
  static const FloatFormat ieeeQuad;

  /* Floating point numbers have a four-state comparison relation.  */
  enum cmpResult {
    cmpLessThan,
    cmpEqual,
    cmpGreaterThan,
    cmpUnordered
  };

  /* Category of internally-represented number.  */
  enum fltCategory {
    fcInfinity,
    fcNaN,
    fcNormal,
    fcZero
  };

  /* The ten classes of IEEE 754 section 5.7.2.  */
  enum fltClass {
    fcSignalingNaN,
    fcQuietNaN,
    fcNegativeInfinity,
    fcNegativeNormal,
    fcNegativeSubnormal,
    fcNegativeZero,
    fcPositiveZero,
    fcPositiveSubnormal,
    fcPositiveNormal,
    fcPositiveInfinity
  };

  /* Constructors.  The string constructor takes a runtime string and
     reports a fatal error if it is rejected.  A category of fcNormal
     gives a zero, fcNaN a quiet NaN with a zero payload.  The bit
     pattern constructor needs an integer as wide as the format.  */
  BinaryFloat (const FloatFormat &, const char *);
  BinaryFloat (const FloatFormat &, fltCategory, bool negative);
  BinaryFloat (const FloatFormat &, const FixedInt &bits);
  explicit BinaryFloat (double);
  explicit BinaryFloat (float);
  BinaryFloat (const BinaryFloat &);
  ~BinaryFloat ();

  BinaryFloat &operator= (const BinaryFloat &);

  static BinaryFloat largest (const FloatFormat &, bool negative = false);
  static BinaryFloat smallest (const FloatFormat &, bool negative = false);
  static BinaryFloat smallestNormalized (const FloatFormat &,
                                         bool negative = false);

  /* Conversions between formats.  cpExact rounds once to nearest,
     overflowing to infinity and underflowing to zero or a subnormal;
     a NaN keeps its sign and flag and the low bits of its payload.
     cpExactly returns opInvalidOp, leaving the value alone, unless
     the conversion is exact and the value is not a NaN.  cpClamping
     is cpExact with overflows and infinities saturated to the
     largest finite value.  */
  opStatus convert (const FloatFormat &, conversionPolicy);

  /* Truncate toward zero into an integer of FORMAT.  NaNs,
     infinities and values out of range return opInvalidOp, leaving
     RESULT alone; a dropped fraction returns opInexact.  */
  opStatus convertToInteger (FixedInt &result, const IntFormat &) const;

  /* Conversions from integers round once; zero is always +0.0.
     cpExactly fails with opInvalidOp if rounding was needed.  */
  opStatus convertFromInteger (const FixedInt &, conversionPolicy);
  opStatus convertFromExactInteger (const ExactInteger &, conversionPolicy);

  /* Round an exact literal value once.  */
  opStatus convertFromExactFloat (const ExactFloat &);

  /* Parse literal text.  A valid integer literal converts as an
     integer, so "-0" is +0.0; anything else must be a floating
     literal.  Returns opSyntaxError or the rounding status.  */
  opStatus convertFromLiteral (const char *);

  /* Parse a runtime string.  The value is only changed on success,
     when opOK or opInexact is returned.  Malformed text returns
     opSyntaxError; values that overflow or round to zero return
     opInvalidOp with opOverflow or opUnderflow and opInexact.  */
  opStatus convertFromString (const char *);

  /* Host bridging; the value must be of the matching format.  */
  double convertToDouble () const;
  float convertToFloat () const;

  /* The encoding as an unsigned integer of the format's width.  */
  FixedInt bitcastToInteger () const;

  /* Hexadecimal text that convertFromString reads back exactly.  */
  std::string toHexString () const;

  /* Comparison with another floating point number.  */
  cmpResult compare (const BinaryFloat &) const;
  bool bitwiseIsEqual (const BinaryFloat &) const;

  /* IEEE 754 totalOrder: true if *this orders at or below RHS.  */
  bool totalOrder (const BinaryFloat &rhs) const;

  /* A number wins over a quiet NaN; a signalling NaN operand gives a
     quiet NaN.  Either zero may be returned for -0 and +0.  */
  static BinaryFloat minimum (const BinaryFloat &, const BinaryFloat &);
  static BinaryFloat maximum (const BinaryFloat &, const BinaryFloat &);
  static BinaryFloat minimumMagnitude (const BinaryFloat &,
                                       const BinaryFloat &);
  static BinaryFloat maximumMagnitude (const BinaryFloat &,
                                       const BinaryFloat &);

  /* NaN payloads.  setNaN keeps the sign and returns opEncodingError,
     leaving the value alone, if the payload needs more than
     payloadBits bits.  The quiet flag is the top bit of the trailing
     significand; the signalling flag is the bit below it, a
     convention of this library rather than of IEEE 754.  */
  opStatus setNaN (bool signaling, const ExactInteger &payload);
  ExactInteger getNaNPayload () const;
  bool isSignalingNaN () const;

  /* Neighbours.  A signalling NaN is quieted and opInvalidOp
     returned.  */
  opStatus nextUp ();
  opStatus nextDown ();

  /* The distance to the next value of greater magnitude; the
     smallest subnormal for zeros and a quiet NaN for infinities and
     NaNs.  */
  BinaryFloat ulp () const;

  void changeSign ();

  /* Simple queries.  */
  fltCategory getCategory () const { return category; }
  const FloatFormat &getFormat () const { return *format; }
  fltClass classify () const;
  bool isZero () const { return category == fcZero; }
  bool isNonZero () const { return category != fcZero; }
  bool isNaN () const { return category == fcNaN; }
  bool isInfinity () const { return category == fcInfinity; }
  bool isFinite () const { return category == fcNormal || category == fcZero; }
  bool isNormal () const;
  bool isSubnormal () const;
  bool isNegative () const { return sign; }

 private:

  /* Trivial queries.  */
  integerPart *significandParts ();
  const integerPart *significandParts () const;
  unsigned int partCount () const;

  /* Significand operations.  */
  void incrementSignificand ();
  void initialize (const FloatFormat *);
  void shiftSignificandLeft (unsigned int);
  lostFraction shiftSignificandRight (unsigned int);
  unsigned int significandLSB () const;
  unsigned int significandMSB () const;
  void zeroSignificand ();
  bool isLargestMagnitude () const;

  /* Special values.  */
  void makeLargest (bool negative);
  void makeNaN (bool signaling, const integerPart *payload,
                unsigned int payloadParts);
  void makeQuiet ();
  static BinaryFloat quietCopy (const BinaryFloat &);
  void decodeBits (const integerPart *);

  /* Miscellany.  */
  opStatus normalize (lostFraction);
  cmpResult compareAbsoluteValue (const BinaryFloat &) const;
  opStatus handleOverflow ();
  bool roundAwayFromZero (lostFraction);
  opStatus convertFromUnsignedParts (const integerPart *, unsigned int,
                                     int scale, lostFraction);
  opStatus convertFromDecimal (const ExactInteger &, exponent_t);
  opStatus roundFrom (const BinaryFloat &);
  static lostFraction combineLostFractions (lostFraction, lostFraction);

  void assign (const BinaryFloat &);
  void copySignificand (const BinaryFloat &);
  void freeSignificand ();

  /* What format does this value have?  */
  const FloatFormat *format;

  /* Significand - the fraction with an explicit integer bit.  Must be
     at least one bit wider than the target precision.  A NaN keeps
     its trailing significand field here.  */
  union Significand
  {
    integerPart part;
    integerPart *parts;
  } significand;

  /* The exponent - a signed number.  */
  exponent_t exponent;

  /* What kind of floating point number this is.  */
  fltCategory category: 2;

  /* The sign bit of this number.  */
  unsigned int sign: 1;
};

}

#endif /* NUMLIT_BINARY_FLOAT_H */
